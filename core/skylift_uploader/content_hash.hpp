// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SKYLIFT_CONTENT_HASH_HPP
#define SKYLIFT_CONTENT_HASH_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "uploader_interfaces.hpp"

// Forward declaration to keep OpenSSL out of public headers
struct evp_md_ctx_st;

namespace skylift {
namespace uploader {

/**
 * Incremental MD5 digest over OpenSSL EVP.
 */
class Md5Digest {
public:
  Md5Digest();
  ~Md5Digest();

  Md5Digest(const Md5Digest&) = delete;
  Md5Digest& operator=(const Md5Digest&) = delete;

  void update(const char* data, size_t size);

  /**
   * Finish the digest. The object can't be updated afterwards.
   *
   * @return Lower-case hex digest
   */
  std::string final_hex();

private:
  struct CtxDeleter {
    void operator()(evp_md_ctx_st* ctx) const;
  };

  std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
  bool finished_ = false;
};

/**
 * MD5 (hex) of a buffer.
 */
std::string md5_hex(const std::string& data);

/**
 * MD5 (hex) of the first `size` bytes of a file, read sequentially through
 * a fresh handle from the factory.
 *
 * @throws SourceReadError if the file can't be opened or is shorter than size
 */
std::string compute_file_md5(const SourceFile& source, IFileStreamFactory& streams);

}  // namespace uploader
}  // namespace skylift

#endif  // SKYLIFT_CONTENT_HASH_HPP

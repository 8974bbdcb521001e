// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "content_hash.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "upload_errors.hpp"

namespace skylift {
namespace uploader {

void Md5Digest::CtxDeleter::operator()(evp_md_ctx_st* ctx) const {
  EVP_MD_CTX_free(ctx);
}

Md5Digest::Md5Digest()
    : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(ctx_.get(), EVP_md5(), nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex(md5) failed");
  }
}

Md5Digest::~Md5Digest() = default;

void Md5Digest::update(const char* data, size_t size) {
  if (finished_) {
    throw std::logic_error("Md5Digest updated after final_hex()");
  }
  if (size == 0) {
    return;
  }
  if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
}

std::string Md5Digest::final_hex() {
  if (finished_) {
    throw std::logic_error("Md5Digest finished twice");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (EVP_DigestFinal_ex(ctx_.get(), hash, &hash_len) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  finished_ = true;

  std::ostringstream oss;
  for (unsigned int i = 0; i < hash_len; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return oss.str();
}

std::string md5_hex(const std::string& data) {
  Md5Digest digest;
  digest.update(data.data(), data.size());
  return digest.final_hex();
}

std::string compute_file_md5(const SourceFile& source, IFileStreamFactory& streams) {
  auto stream = streams.create_file_stream(source.path, std::ios::in | std::ios::binary);
  if (!stream) {
    throw SourceReadError("Can't open " + source.path + " for hashing");
  }

  constexpr size_t buffer_size = 64 * 1024;
  std::vector<char> buffer(buffer_size);
  Md5Digest digest;

  uint64_t remaining = source.size;
  while (remaining > 0) {
    auto want = static_cast<std::streamsize>(std::min<uint64_t>(remaining, buffer_size));
    stream->read(buffer.data(), want);
    std::streamsize got = stream->gcount();
    if (got <= 0) {
      throw SourceReadError(
        "Unexpected end of " + source.path + " while hashing (" + std::to_string(remaining) +
        " bytes missing)"
      );
    }
    digest.update(buffer.data(), static_cast<size_t>(got));
    remaining -= static_cast<uint64_t>(got);
  }

  return digest.final_hex();
}

}  // namespace uploader
}  // namespace skylift

// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SKYLIFT_UPLOADER_IMPL_HPP
#define SKYLIFT_UPLOADER_IMPL_HPP

#include <filesystem>
#include <fstream>
#include <memory>

#include "uploader_interfaces.hpp"

namespace skylift {
namespace uploader {

/**
 * Default implementation of IFileSystem using std::filesystem
 */
class FileSystemImpl : public IFileSystem {
public:
  bool exists(const std::string& path) const override {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
  }

  bool is_regular_file(const std::string& path) const override {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
  }

  uint64_t file_size(const std::string& path) const override {
    return static_cast<uint64_t>(std::filesystem::file_size(path));
  }
};

/**
 * Default implementation of IFileStream using std::ifstream
 */
class FileStreamImpl : public IFileStream {
public:
  explicit FileStreamImpl(const std::string& path, std::ios_base::openmode mode)
      : stream_(path, mode) {}

  IFileStream& read(char* buffer, std::streamsize size) override {
    stream_.read(buffer, size);
    return *this;
  }

  IFileStream& seekg(std::streamoff offset, std::ios_base::seekdir origin) override {
    stream_.seekg(offset, origin);
    return *this;
  }

  std::streamsize gcount() const override {
    return stream_.gcount();
  }

  bool good() const override {
    return stream_.good();
  }

  bool fail() const override {
    return stream_.fail();
  }

  bool bad() const override {
    return stream_.bad();
  }

private:
  std::ifstream stream_;
};

/**
 * Default implementation of IFileStreamFactory
 */
class FileStreamFactoryImpl : public IFileStreamFactory {
public:
  std::unique_ptr<IFileStream> create_file_stream(
    const std::string& path, std::ios_base::openmode mode
  ) override {
    auto stream = std::make_unique<FileStreamImpl>(path, mode);
    if (!stream->good()) {
      return nullptr;
    }
    return stream;
  }
};

}  // namespace uploader
}  // namespace skylift

#endif  // SKYLIFT_UPLOADER_IMPL_HPP

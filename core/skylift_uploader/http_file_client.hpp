// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SKYLIFT_HTTP_FILE_CLIENT_HPP
#define SKYLIFT_HTTP_FILE_CLIENT_HPP

#include <memory>
#include <string>
#include <utility>

#include <http_client.hpp>

#include "uploader_interfaces.hpp"

namespace skylift {
namespace uploader {

/**
 * Supplies the bearer token for file service requests
 */
class ITokenProvider {
public:
  virtual ~ITokenProvider() = default;

  /**
   * @return Token without the "Bearer " prefix; may be called concurrently
   */
  virtual std::string token() = 0;
};

/**
 * Token fixed at construction (CLI flag, environment or settings file)
 */
class StaticTokenProvider : public ITokenProvider {
public:
  explicit StaticTokenProvider(std::string token)
      : token_(std::move(token)) {}

  std::string token() override {
    return token_;
  }

private:
  std::string token_;
};

/**
 * Configuration for the file service client
 */
struct FileServiceConfig {
  std::string gateway_url;  // e.g. https://gateway.eu1.example.com
  std::string api_prefix = "/api/iotfile/v3/files";
  http::HttpClient::Config http;
};

/**
 * ITransportClient over the platform file service REST API
 *
 * Single-shot:  PUT {gateway}{prefix}/{assetId}/{filePath}
 * Chunked:      PUT ...?upload=start, PUT ...?upload=true&part=N (N = index + 1),
 *               PUT ...?upload=complete
 *
 * Thread-safe: every call performs an independent HTTP exchange.
 */
class HttpFileClient : public ITransportClient {
public:
  HttpFileClient(const FileServiceConfig& config, std::shared_ptr<ITokenProvider> tokens);
  ~HttpFileClient() override;

  TransportResult begin_multipart(const UploadTarget& target) override;

  TransportResult send(
    const UploadTarget& target, const std::string& payload, const PartMetadata& metadata
  ) override;

  TransportResult complete_multipart(const UploadTarget& target, size_t part_count) override;

  const FileServiceConfig& config() const {
    return config_;
  }

private:
  TransportResult put(
    const UploadTarget& target, const std::string& query, const std::string& payload,
    const PartMetadata& metadata
  );

  FileServiceConfig config_;
  std::shared_ptr<ITokenProvider> tokens_;
  http::HttpClient http_;
};

}  // namespace uploader
}  // namespace skylift

#endif  // SKYLIFT_HTTP_FILE_CLIENT_HPP

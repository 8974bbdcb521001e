// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "http_file_client.hpp"

#include "http_file_client_test_helpers.hpp"
#include "upload_errors.hpp"

#define SKYLIFT_LOG_COMPONENT "file_client"
#include <skylift_log_macros.hpp>

namespace bhttp = boost::beast::http;

namespace skylift {
namespace uploader {

std::string buildFileUrlImpl(
  const FileServiceConfig& config, const UploadTarget& target, const std::string& query
) {
  std::string base = config.gateway_url;
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }

  std::string file_path = target.file_path;
  while (!file_path.empty() && file_path.front() == '/') {
    file_path.erase(0, 1);
  }

  std::string url = base + config.api_prefix + "/" + http::HttpClient::encode_path(target.asset_id) +
                    "/" + http::HttpClient::encode_path(file_path);
  if (!query.empty()) {
    url += "?" + query;
  }
  return url;
}

std::map<std::string, std::string> buildRequestHeadersImpl(
  const std::string& token, const PartMetadata& metadata
) {
  std::map<std::string, std::string> headers;
  headers["Authorization"] = "Bearer " + token;
  headers["Content-Type"] =
    metadata.mime_type.empty() ? "application/octet-stream" : metadata.mime_type;
  if (!metadata.description.empty()) {
    headers["description"] = metadata.description;
  }
  if (!metadata.content_md5.empty()) {
    headers["x-content-md5"] = metadata.content_md5;
  }
  return headers;
}

TransportResult toTransportResultImpl(const http::HttpResponse& response) {
  if (response.success) {
    return TransportResult::Success(
      response.header("etag"), response.header("x-content-md5")
    );
  }

  if (response.status_code == 0) {
    return TransportResult::Failure(response.error_message, true, 0, "NETWORK_ERROR");
  }

  std::string message = "HTTP " + std::to_string(response.status_code);
  if (!response.body.empty()) {
    // Platform errors are short JSON documents; keep the log line bounded
    message += ": " + response.body.substr(0, 512);
  }
  return TransportResult::Failure(
    message, http::HttpClient::is_retryable_status(response.status_code), response.status_code,
    "HTTP_" + std::to_string(response.status_code)
  );
}

HttpFileClient::HttpFileClient(
  const FileServiceConfig& config, std::shared_ptr<ITokenProvider> tokens
)
    : config_(config)
    , tokens_(std::move(tokens))
    , http_(config.http) {
  if (config_.gateway_url.empty()) {
    throw ConfigError("file service gateway URL is empty");
  }
  if (!tokens_) {
    throw ConfigError("file service client needs a token provider");
  }
}

HttpFileClient::~HttpFileClient() = default;

TransportResult HttpFileClient::begin_multipart(const UploadTarget& target) {
  PartMetadata metadata;
  metadata.mime_type = target.mime_type;
  metadata.description = target.description;
  return put(target, "upload=start", "", metadata);
}

TransportResult HttpFileClient::send(
  const UploadTarget& target, const std::string& payload, const PartMetadata& metadata
) {
  std::string query;
  if (metadata.part_index) {
    query = "upload=true&part=" + std::to_string(*metadata.part_index + 1);
  }
  return put(target, query, payload, metadata);
}

TransportResult HttpFileClient::complete_multipart(const UploadTarget& target, size_t part_count) {
  PartMetadata metadata;
  metadata.mime_type = target.mime_type;
  metadata.description = target.description;
  SKYLIFT_LOG_DEBUG("Completing multipart upload" << logging::kv("parts", part_count));
  return put(target, "upload=complete", "", metadata);
}

TransportResult HttpFileClient::put(
  const UploadTarget& target, const std::string& query, const std::string& payload,
  const PartMetadata& metadata
) {
  std::string url = buildFileUrlImpl(config_, target, query);
  auto headers = buildRequestHeadersImpl(tokens_->token(), metadata);

  http::HttpResponse response = http_.request(bhttp::verb::put, url, headers, payload);
  TransportResult result = toTransportResultImpl(response);

  if (!result.success) {
    SKYLIFT_LOG_DEBUG(
      "PUT failed" << logging::kv("asset", target.asset_id) << logging::kv("query", query)
                   << logging::kv("status", response.status_code)
                   << logging::kv("retryable", result.is_retryable)
    );
  }
  return result;
}

}  // namespace uploader
}  // namespace skylift

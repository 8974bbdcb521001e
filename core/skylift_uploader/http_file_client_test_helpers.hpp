// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SKYLIFT_HTTP_FILE_CLIENT_TEST_HELPERS_HPP
#define SKYLIFT_HTTP_FILE_CLIENT_TEST_HELPERS_HPP

#include <map>
#include <string>

#include <http_client.hpp>

#include "http_file_client.hpp"

namespace skylift {
namespace uploader {

// Internal implementations defined in http_file_client.cpp, exposed so the
// request building and response mapping can be tested without a server.

/**
 * Build the object URL for a target.
 *
 * @param query Query string without '?', or empty
 */
std::string buildFileUrlImpl(
  const FileServiceConfig& config, const UploadTarget& target, const std::string& query
);

/**
 * Build request headers. The token is sent as a bearer credential.
 */
std::map<std::string, std::string> buildRequestHeadersImpl(
  const std::string& token, const PartMetadata& metadata
);

/**
 * Map an HTTP response onto a TransportResult.
 */
TransportResult toTransportResultImpl(const http::HttpResponse& response);

}  // namespace uploader
}  // namespace skylift

#endif  // SKYLIFT_HTTP_FILE_CLIENT_TEST_HELPERS_HPP

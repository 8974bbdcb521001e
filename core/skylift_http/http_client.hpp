// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SKYLIFT_HTTP_CLIENT_HPP
#define SKYLIFT_HTTP_CLIENT_HPP

#include <boost/beast/http/verb.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <string>

namespace skylift {
namespace http {

/**
 * Components of an http(s) URL.
 */
struct ParsedUrl {
  std::string host;
  std::string port;
  std::string target;  // path plus query, always starts with '/'
  bool use_ssl = false;
};

/**
 * Result of a single HTTP exchange.
 *
 * success is true only for 2xx responses. A status_code of 0 means the
 * request never produced a response (resolve, connect, TLS or socket error).
 */
struct HttpResponse {
  bool success = false;
  int status_code = 0;
  std::string body;
  std::map<std::string, std::string> headers;  // lower-case field names
  std::string error_message;

  std::string header(const std::string& lower_name) const {
    auto it = headers.find(lower_name);
    return it == headers.end() ? std::string() : it->second;
  }
};

/**
 * Blocking HTTP/1.1 client on Boost.Beast.
 *
 * Every request uses its own io_context and socket, so one client instance
 * can be shared by concurrent upload workers.
 */
class HttpClient {
public:
  struct Config {
    std::chrono::milliseconds request_timeout{300000};
    std::string user_agent = "skylift/1.0";
    bool verify_ssl = true;
  };

  HttpClient();
  explicit HttpClient(const Config& config);
  ~HttpClient();

  HttpClient(const HttpClient&) = delete;
  HttpClient& operator=(const HttpClient&) = delete;

  /**
   * Perform a request. Never throws; failures are reported in the response.
   */
  HttpResponse request(
    boost::beast::http::verb method, const std::string& url,
    const std::map<std::string, std::string>& headers, const std::string& body
  ) const;

  const Config& config() const {
    return config_;
  }

  /**
   * Parse http(s)://host(:port)/path?query
   */
  static bool parse_url(const std::string& url, ParsedUrl& parsed);

  /**
   * Transient statuses: 408, 425, 429 and every 5xx. Status 0 (no response)
   * is transient as well.
   */
  static bool is_retryable_status(int status_code);

  /**
   * Percent-encode each segment of a slash separated path, keeping the slashes.
   */
  static std::string encode_path(const std::string& path);

private:
  HttpResponse plain_request(
    boost::beast::http::verb method, const ParsedUrl& url,
    const std::map<std::string, std::string>& headers, const std::string& body
  ) const;

  HttpResponse tls_request(
    boost::beast::http::verb method, const ParsedUrl& url,
    const std::map<std::string, std::string>& headers, const std::string& body
  ) const;

  class TlsContext;

  Config config_;
  std::unique_ptr<TlsContext> tls_;
};

}  // namespace http
}  // namespace skylift

#endif  // SKYLIFT_HTTP_CLIENT_HPP

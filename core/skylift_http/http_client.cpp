// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "http_client.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <openssl/ssl.h>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <regex>
#include <sstream>

#define SKYLIFT_LOG_COMPONENT "http_client"
#include <skylift_log_macros.hpp>

namespace beast = boost::beast;
namespace bhttp = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace skylift {
namespace http {

class HttpClient::TlsContext {
public:
  explicit TlsContext(bool verify)
      : context(ssl::context::tls_client) {
    context.set_default_verify_paths();
    context.set_verify_mode(verify ? ssl::verify_peer : ssl::verify_none);
  }

  ssl::context context;
};

namespace {

template<typename Stream>
HttpResponse exchange(
  Stream& stream, bhttp::verb method, const ParsedUrl& url,
  const std::map<std::string, std::string>& headers, const std::string& body,
  const std::string& user_agent
) {
  bhttp::request<bhttp::string_body> req{method, url.target, 11};
  req.set(bhttp::field::host, url.host);
  req.set(bhttp::field::user_agent, user_agent);
  for (const auto& [name, value] : headers) {
    req.set(name, value);
  }
  req.body() = body;
  req.prepare_payload();

  bhttp::write(stream, req);

  beast::flat_buffer buffer;
  bhttp::response_parser<bhttp::string_body> parser;
  parser.body_limit(64 * 1024 * 1024);
  bhttp::read(stream, buffer, parser);
  auto res = parser.release();

  HttpResponse result;
  result.status_code = static_cast<int>(res.result_int());
  result.body = res.body();
  for (const auto& field : res) {
    std::string name(field.name_string());
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
      return std::tolower(c);
    });
    result.headers[name] = std::string(field.value());
  }

  if (result.status_code >= 200 && result.status_code < 300) {
    result.success = true;
  } else {
    result.error_message = "Server returned status " + std::to_string(result.status_code);
  }
  return result;
}

}  // namespace

HttpClient::HttpClient()
    : HttpClient(Config()) {}

HttpClient::HttpClient(const Config& config)
    : config_(config)
    , tls_(std::make_unique<TlsContext>(config.verify_ssl)) {}

HttpClient::~HttpClient() = default;

bool HttpClient::parse_url(const std::string& url, ParsedUrl& parsed) {
  std::regex url_regex(R"(^(https?)://([^/:?#]+)(?::(\d+))?([^#]*)$)", std::regex::icase);
  std::smatch match;

  if (!std::regex_match(url, match, url_regex)) {
    return false;
  }

  std::string scheme = match[1].str();
  std::transform(scheme.begin(), scheme.end(), scheme.begin(), [](unsigned char c) {
    return std::tolower(c);
  });

  parsed.host = match[2].str();
  parsed.use_ssl = (scheme == "https");
  parsed.port = match[3].str();
  if (parsed.port.empty()) {
    parsed.port = parsed.use_ssl ? "443" : "80";
  }

  parsed.target = match[4].str();
  if (parsed.target.empty()) {
    parsed.target = "/";
  } else if (parsed.target[0] == '?') {
    parsed.target = "/" + parsed.target;
  }

  return true;
}

bool HttpClient::is_retryable_status(int status_code) {
  if (status_code == 0) {
    return true;
  }
  if (status_code == 408 || status_code == 425 || status_code == 429) {
    return true;
  }
  return status_code >= 500 && status_code < 600;
}

std::string HttpClient::encode_path(const std::string& path) {
  std::ostringstream oss;
  oss << std::uppercase << std::hex;
  for (unsigned char c : path) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
      oss << static_cast<char>(c);
    } else {
      oss << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
    }
  }
  return oss.str();
}

HttpResponse HttpClient::request(
  bhttp::verb method, const std::string& url, const std::map<std::string, std::string>& headers,
  const std::string& body
) const {
  ParsedUrl parsed;
  if (!parse_url(url, parsed)) {
    HttpResponse result;
    result.error_message = "Invalid URL format: " + url;
    return result;
  }

  SKYLIFT_LOG_DEBUG(
    "Request" << logging::kv("method", std::string(bhttp::to_string(method)))
              << logging::kv("host", parsed.host) << logging::kv("bytes", body.size())
  );

  if (parsed.use_ssl) {
    return tls_request(method, parsed, headers, body);
  }
  return plain_request(method, parsed, headers, body);
}

HttpResponse HttpClient::plain_request(
  bhttp::verb method, const ParsedUrl& url, const std::map<std::string, std::string>& headers,
  const std::string& body
) const {
  try {
    net::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);

    stream.expires_after(config_.request_timeout);
    stream.connect(resolver.resolve(url.host, url.port));

    HttpResponse result = exchange(stream, method, url, headers, body, config_.user_agent);

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != beast::errc::not_connected) {
      SKYLIFT_LOG_DEBUG("Socket shutdown warning: " << ec.message());
    }
    return result;
  } catch (const std::exception& e) {
    HttpResponse result;
    result.error_message = std::string("Network error: ") + e.what();
    return result;
  }
}

HttpResponse HttpClient::tls_request(
  bhttp::verb method, const ParsedUrl& url, const std::map<std::string, std::string>& headers,
  const std::string& body
) const {
  try {
    net::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::ssl_stream<beast::tcp_stream> stream(ioc, tls_->context);

    // SNI is required by most TLS front ends
    if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
      HttpResponse result;
      result.error_message = "Failed to set TLS server name for " + url.host;
      return result;
    }

    beast::get_lowest_layer(stream).expires_after(config_.request_timeout);
    beast::get_lowest_layer(stream).connect(resolver.resolve(url.host, url.port));
    stream.handshake(ssl::stream_base::client);

    HttpResponse result = exchange(stream, method, url, headers, body, config_.user_agent);

    beast::error_code ec;
    stream.shutdown(ec);
    if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
      SKYLIFT_LOG_DEBUG("TLS shutdown warning: " << ec.message());
    }
    return result;
  } catch (const std::exception& e) {
    HttpResponse result;
    result.error_message = std::string("Network error: ") + e.what();
    return result;
  }
}

}  // namespace http
}  // namespace skylift

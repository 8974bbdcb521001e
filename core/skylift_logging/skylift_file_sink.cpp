// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "skylift_file_sink.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/filesystem.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/make_shared.hpp>

#include <cstdio>
#include <iostream>
#include <sstream>
#include <utility>

#include "skylift_console_sink.hpp"

namespace skylift {
namespace logging {

namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;
namespace sinks = boost::log::sinks;

std::string escape_json(const std::string& s) {
  std::string result;
  result.reserve(s.size() + 16);
  for (unsigned char c : s) {
    switch (c) {
      case '"':
        result += "\\\"";
        break;
      case '\\':
        result += "\\\\";
        break;
      case '\n':
        result += "\\n";
        break;
      case '\r':
        result += "\\r";
        break;
      case '\t':
        result += "\\t";
        break;
      default:
        if (c < 0x20) {
          char buf[8];
          snprintf(buf, sizeof(buf), "\\u%04x", c);
          result += buf;
        } else {
          result += static_cast<char>(c);
        }
    }
  }
  return result;
}

namespace {

template<typename T>
std::string to_text(const T& value) {
  std::ostringstream oss;
  oss << value;
  return oss.str();
}

// {"ts":...,"level":...,"msg":...,"thread_id":...,"client_id":...,"asset_id":...}
// Absent attributes are left out, except ts/level/msg which are always present.
void json_formatter(boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
  std::string ts;
  if (auto value = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec)) {
    ts = to_text(*value);
  }
  std::string level;
  if (auto value = boost::log::extract<severity_level>("Severity", rec)) {
    level = to_text(*value);
  }

  strm << "{\"ts\":\"" << ts << "\",\"level\":\"" << level << "\",\"msg\":\""
       << escape_json(rec[expr::smessage].get()) << "\"";

  using thread_id_t = boost::log::attributes::current_thread_id::value_type;
  if (auto value = boost::log::extract<thread_id_t>("ThreadID", rec)) {
    strm << ",\"thread_id\":\"" << to_text(*value) << "\"";
  }

  static const std::pair<const char*, const char*> kIdentity[] = {
    {"ClientID", "client_id"},
    {"AssetID", "asset_id"},
  };
  for (const auto& field : kIdentity) {
    if (auto value = boost::log::extract<std::string>(field.first, rec)) {
      strm << ",\"" << field.second << "\":\"" << escape_json(*value) << "\"";
    }
  }

  strm << "}";
}

void text_formatter(boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
  format_text_record(rec, strm, false);
}

// Log directory, or the system temp directory when it can't be created
std::string resolve_directory(const std::string& requested) {
  boost::system::error_code ec;
  boost::filesystem::create_directories(requested, ec);
  if (!ec) {
    return requested;
  }
  std::string fallback = boost::filesystem::temp_directory_path(ec).string();
  if (ec || fallback.empty()) {
    fallback = "/tmp";
  }
  // Sinks are not installed yet
  std::cerr << "[skylift_logging] Can't create log directory '" << requested
            << "', writing logs to " << fallback << std::endl;
  return fallback;
}

}  // namespace

boost::shared_ptr<async_file_sink_t> create_file_sink(
  const FileSinkConfig& config, severity_level min_level
) {
  std::string directory = resolve_directory(config.directory);

  auto backend = boost::make_shared<sinks::text_file_backend>(
    keywords::file_name = directory + "/" + config.file_pattern,
    keywords::rotation_size = config.rotation_size_mb * 1024 * 1024,
    keywords::auto_flush = true
  );
  backend->set_file_collector(
    sinks::file::make_collector(keywords::target = directory, keywords::max_files = config.max_files)
  );
  backend->scan_for_files();

  auto sink = boost::make_shared<async_file_sink_t>(backend);
  sink->set_filter(severity >= min_level);
  sink->set_formatter(config.format_json ? &json_formatter : &text_formatter);
  return sink;
}

}  // namespace logging
}  // namespace skylift

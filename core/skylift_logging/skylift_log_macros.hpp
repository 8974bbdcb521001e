// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SKYLIFT_LOG_MACROS_HPP
#define SKYLIFT_LOG_MACROS_HPP

#include <boost/log/attributes/constant.hpp>
#include <boost/log/attributes/scoped_attribute.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/utility/unique_identifier_name.hpp>

#include <atomic>
#include <cstdint>
#include <sstream>
#include <string>

#include "skylift_log_severity.hpp"

namespace skylift {
namespace logging {

// Thread-safe logger: chunk workers log concurrently
typedef boost::log::sources::severity_logger_mt<severity_level> logger_type;

/**
 * Get the global logger instance.
 * Defined in skylift_log_init.cpp
 */
logger_type& get_logger();

/**
 * Key-value formatter for structured logging.
 * Usage: SKYLIFT_LOG_INFO("chunk uploaded" << kv("index", i));
 */
template<typename T>
inline std::string kv(const char* name, const T& value) {
  std::ostringstream oss;
  oss << " " << name << "=" << value;
  return oss.str();
}

template<>
inline std::string kv(const char* name, const std::string& value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

inline std::string kv(const char* name, const char* value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

}  // namespace logging
}  // namespace skylift

// Define SKYLIFT_LOG_COMPONENT before including this header to tag records:
//   #define SKYLIFT_LOG_COMPONENT "chunk_worker"
//   #include <skylift_log_macros.hpp>
#ifndef SKYLIFT_LOG_COMPONENT
#define SKYLIFT_LOG_COMPONENT "skylift"
#endif

#ifdef NDEBUG
#define SKYLIFT_LOG_ENABLE_DEBUG 0
#else
#define SKYLIFT_LOG_ENABLE_DEBUG 1
#endif

#define SKYLIFT_LOG_DEBUG(msg) \
  do { \
    if (SKYLIFT_LOG_ENABLE_DEBUG) { \
      BOOST_LOG_SEV(::skylift::logging::get_logger(), ::skylift::logging::severity_level::debug) \
        << "[" << SKYLIFT_LOG_COMPONENT << "] " << msg; \
    } \
  } while (0)

#define SKYLIFT_LOG_INFO(msg) \
  do { \
    BOOST_LOG_SEV(::skylift::logging::get_logger(), ::skylift::logging::severity_level::info) \
      << "[" << SKYLIFT_LOG_COMPONENT << "] " << msg; \
  } while (0)

#define SKYLIFT_LOG_WARN(msg) \
  do { \
    BOOST_LOG_SEV(::skylift::logging::get_logger(), ::skylift::logging::severity_level::warn) \
      << "[" << SKYLIFT_LOG_COMPONENT << "] " << msg; \
  } while (0)

#define SKYLIFT_LOG_ERROR(msg) \
  do { \
    BOOST_LOG_SEV(::skylift::logging::get_logger(), ::skylift::logging::severity_level::error) \
      << "[" << SKYLIFT_LOG_COMPONENT << "] " << msg; \
  } while (0)

#define SKYLIFT_LOG_FATAL(msg) \
  do { \
    BOOST_LOG_SEV(::skylift::logging::get_logger(), ::skylift::logging::severity_level::fatal) \
      << "[" << SKYLIFT_LOG_COMPONENT << "] " << msg; \
  } while (0)

// Attach agent identity to every record emitted in the current scope.
// Usage: SKYLIFT_LOG_SCOPED_CONTEXT(client_id, asset_id);
// Each guard gets its own prefix, since both expand on the same line.
#define SKYLIFT_LOG_SCOPED_CONTEXT(client_id_val, asset_id_val) \
  [[maybe_unused]] ::boost::log::scoped_attribute BOOST_LOG_UNIQUE_IDENTIFIER_NAME( \
    _skylift_client_scope_ \
  ) = \
    ::boost::log::add_scoped_thread_attribute( \
      "ClientID", ::boost::log::attributes::constant<std::string>(client_id_val) \
    ); \
  [[maybe_unused]] ::boost::log::scoped_attribute BOOST_LOG_UNIQUE_IDENTIFIER_NAME( \
    _skylift_asset_scope_ \
  ) = \
    ::boost::log::add_scoped_thread_attribute( \
      "AssetID", ::boost::log::attributes::constant<std::string>(asset_id_val) \
    )

// Log every Nth occurrence at a call site (per-chunk progress on large files).
#define SKYLIFT_LOG_INFO_EVERY_N(n, msg) \
  do { \
    static std::atomic<uint64_t> _skylift_log_counter{0}; \
    if ((++_skylift_log_counter % (n)) == 1) { \
      SKYLIFT_LOG_INFO(msg); \
    } \
  } while (0)

#endif  // SKYLIFT_LOG_MACROS_HPP

// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_LOG_MACROS_HPP
#define CIRRUS_LOG_MACROS_HPP

#include <boost/log/attributes/constant.hpp>
#include <boost/log/attributes/scoped_attribute.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/utility/unique_identifier_name.hpp>

#include <sstream>
#include <string>

#include "cirrus_log_context.hpp"
#include "cirrus_log_severity.hpp"

namespace cirrus {
namespace logging {

// Severity logger shared by every component (thread-safe variant, part tasks log from pool threads)
typedef boost::log::sources::severity_logger_mt<severity_level> logger_type;

/**
 * Get the global logger instance.
 * Defined in cirrus_log_init.cpp
 */
logger_type& get_logger();

/**
 * Key-value formatter for structured log lines.
 * Usage: CIRRUS_LOG_INFO("Part uploaded" << kv("part_number", n));
 */
template <typename T>
inline std::string kv(const char* name, const T& value) {
  std::ostringstream oss;
  oss << " " << name << "=" << value;
  return oss.str();
}

template <>
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
}  // namespace cirrus

// =============================================================================
// Component identification
// Define CIRRUS_LOG_COMPONENT before including this header:
//
//   #define CIRRUS_LOG_COMPONENT "stream_uploader"
//   #include <cirrus_log_macros.hpp>
// =============================================================================
#ifndef CIRRUS_LOG_COMPONENT
#define CIRRUS_LOG_COMPONENT "cirrus"
#endif

// DEBUG records are compiled out of release builds
#ifdef NDEBUG
#define CIRRUS_LOG_ENABLE_DEBUG 0
#else
#define CIRRUS_LOG_ENABLE_DEBUG 1
#endif

// =============================================================================
// Stream-based logging macros
// Usage: CIRRUS_LOG_INFO("message" << kv("key", value));
// =============================================================================

#define CIRRUS_LOG_DEBUG(msg)                                                                    \
  do {                                                                                           \
    if (CIRRUS_LOG_ENABLE_DEBUG) {                                                               \
      BOOST_LOG_SEV(::cirrus::logging::get_logger(), ::cirrus::logging::severity_level::debug)   \
        << "[" << CIRRUS_LOG_COMPONENT << "] " << msg;                                           \
    }                                                                                            \
  } while (0)

#define CIRRUS_LOG_INFO(msg)                                                                   \
  do {                                                                                         \
    BOOST_LOG_SEV(::cirrus::logging::get_logger(), ::cirrus::logging::severity_level::info)    \
      << "[" << CIRRUS_LOG_COMPONENT << "] " << msg;                                           \
  } while (0)

#define CIRRUS_LOG_WARN(msg)                                                                   \
  do {                                                                                         \
    BOOST_LOG_SEV(::cirrus::logging::get_logger(), ::cirrus::logging::severity_level::warn)    \
      << "[" << CIRRUS_LOG_COMPONENT << "] " << msg;                                           \
  } while (0)

#define CIRRUS_LOG_ERROR(msg)                                                                  \
  do {                                                                                         \
    BOOST_LOG_SEV(::cirrus::logging::get_logger(), ::cirrus::logging::severity_level::error)   \
      << "[" << CIRRUS_LOG_COMPONENT << "] " << msg;                                           \
  } while (0)

// =============================================================================
// Upload context for the current thread, cleared when the scope exits.
// Each guard gets its own sentry name so both fit on the caller's line.
//
//   CIRRUS_LOG_SCOPED_CONTEXT(session.sessionId(), target.key);
//   CIRRUS_LOG_SCOPED_PART(part_number);
// =============================================================================
#define CIRRUS_LOG_SCOPED_CONTEXT(upload_id_val, object_key_val)                        \
  BOOST_LOG_SCOPED_THREAD_ATTR_INTERNAL(                                                 \
    ::cirrus::logging::kUploadIdAttr,                                                    \
    boost::log::attributes::constant<std::string>(upload_id_val),                        \
    BOOST_LOG_UNIQUE_IDENTIFIER_NAME(_cirrus_ctx_upload_id_)                             \
  );                                                                                     \
  BOOST_LOG_SCOPED_THREAD_ATTR_INTERNAL(                                                 \
    ::cirrus::logging::kObjectKeyAttr,                                                   \
    boost::log::attributes::constant<std::string>(object_key_val),                       \
    BOOST_LOG_UNIQUE_IDENTIFIER_NAME(_cirrus_ctx_object_key_)                            \
  )

#define CIRRUS_LOG_SCOPED_PART(part_number_val)                                          \
  BOOST_LOG_SCOPED_THREAD_ATTR_INTERNAL(                                                 \
    ::cirrus::logging::kPartNumberAttr,                                                  \
    boost::log::attributes::constant<int>(part_number_val),                              \
    BOOST_LOG_UNIQUE_IDENTIFIER_NAME(_cirrus_ctx_part_number_)                           \
  )

#endif  // CIRRUS_LOG_MACROS_HPP

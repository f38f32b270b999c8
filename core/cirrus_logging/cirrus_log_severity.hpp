// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_LOG_SEVERITY_HPP
#define CIRRUS_LOG_SEVERITY_HPP

#include <boost/log/expressions/keyword.hpp>

#include <optional>
#include <ostream>
#include <string>

namespace cirrus {
namespace logging {

enum class severity_level { debug = 0, info = 1, warn = 2, error = 3, fatal = 4 };

/**
 * Upper-case tag written into every record ("WARN"), nullptr when out of range.
 */
const char* severity_name(severity_level level);

/**
 * Parse "debug", "info", "warn"/"warning", "error" or "fatal", ignoring case.
 */
std::optional<severity_level> parse_severity_level(const std::string& level_str);

inline std::ostream& operator<<(std::ostream& strm, severity_level level) {
  if (const char* name = severity_name(level)) {
    return strm << name;
  }
  return strm << static_cast<int>(level);
}

BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", severity_level)

}  // namespace logging
}  // namespace cirrus

#endif  // CIRRUS_LOG_SEVERITY_HPP

// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CAPSULE_LOG_SEVERITY_HPP
#define CAPSULE_LOG_SEVERITY_HPP

#include <boost/log/expressions/keyword.hpp>

#include <cstddef>
#include <ostream>

namespace capsule {
namespace logging {

/**
 * Severity levels for capsule logging.
 * FATAL is reserved for conditions that end the process.
 */
enum class severity_level { debug = 0, info = 1, warn = 2, error = 3, fatal = 4 };

inline const char* severity_name(severity_level level) {
  switch (level) {
    case severity_level::debug:
      return "DEBUG";
    case severity_level::info:
      return "INFO";
    case severity_level::warn:
      return "WARN";
    case severity_level::error:
      return "ERROR";
    case severity_level::fatal:
      return "FATAL";
  }
  return nullptr;
}

inline std::ostream& operator<<(std::ostream& strm, severity_level level) {
  if (const char* name = severity_name(level)) {
    strm << name;
  } else {
    strm << static_cast<int>(level);
  }
  return strm;
}

// Boost.Log keyword used by sink filters
BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", severity_level)

}  // namespace logging
}  // namespace capsule

#endif  // CAPSULE_LOG_SEVERITY_HPP

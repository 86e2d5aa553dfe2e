// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef TESSERA_LOG_SEVERITY_HPP
#define TESSERA_LOG_SEVERITY_HPP

#include <boost/log/expressions/keyword.hpp>

#include <ostream>
#include <string>

namespace tessera {
namespace logging {

/**
 * Severity levels for tessera logging.
 * FATAL is reserved for conditions after which the process cannot continue.
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
  return "UNKNOWN";
}

inline std::ostream& operator<<(std::ostream& strm, severity_level level) {
  return strm << severity_name(level);
}

// Boost.Log keyword for severity filtering
BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", severity_level)

// Attribute names for upload context (see TESSERA_LOG_SCOPED_UPLOAD)
constexpr const char* kProjectIdAttr = "ProjectID";
constexpr const char* kUploadIdAttr = "UploadID";

}  // namespace logging
}  // namespace tessera

#endif  // TESSERA_LOG_SEVERITY_HPP

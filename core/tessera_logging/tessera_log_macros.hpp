// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef TESSERA_LOG_MACROS_HPP
#define TESSERA_LOG_MACROS_HPP

#include <boost/log/attributes/constant.hpp>
#include <boost/log/attributes/scoped_attribute.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <chrono>
#include <mutex>
#include <sstream>
#include <string>

#include "tessera_log_severity.hpp"

namespace tessera {
namespace logging {

typedef boost::log::sources::severity_logger_mt<severity_level> logger_type;

/**
 * Global logger instance. Defined in tessera_log_init.cpp.
 */
logger_type& get_logger();

/**
 * Key-value formatter for structured logging.
 * Usage: TESSERA_LOG_INFO("Part uploaded" << kv("part", n) << kv("etag", etag));
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
  oss << " " << name << "=\"" << (value ? value : "") << "\"";
  return oss.str();
}

/**
 * Per call-site throttle state for the *_THROTTLE macros.
 */
class LogThrottle {
public:
  bool should_log(double interval_sec) {
    auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(mutex_);
    if (!logged_once_ || now - last_ >= std::chrono::duration<double>(interval_sec)) {
      last_ = now;
      logged_once_ = true;
      return true;
    }
    return false;
  }

private:
  std::mutex mutex_;
  std::chrono::steady_clock::time_point last_{};
  bool logged_once_ = false;
};

}  // namespace logging
}  // namespace tessera

// Define TESSERA_LOG_COMPONENT before including this header:
//   #define TESSERA_LOG_COMPONENT "chunk_scheduler"
//   #include <tessera_log_macros.hpp>
#ifndef TESSERA_LOG_COMPONENT
#define TESSERA_LOG_COMPONENT "tessera"
#endif

// DEBUG records are compiled out of release builds
#ifdef NDEBUG
#define TESSERA_LOG_ENABLE_DEBUG 0
#else
#define TESSERA_LOG_ENABLE_DEBUG 1
#endif

#define TESSERA_LOG_SEV(level, msg)                                                            \
  do {                                                                                         \
    BOOST_LOG_SEV(::tessera::logging::get_logger(), ::tessera::logging::severity_level::level) \
      << "[" << TESSERA_LOG_COMPONENT << "] " << msg;                                          \
  } while (0)

#define TESSERA_LOG_DEBUG(msg)     \
  do {                             \
    if (TESSERA_LOG_ENABLE_DEBUG) { \
      TESSERA_LOG_SEV(debug, msg); \
    }                              \
  } while (0)

#define TESSERA_LOG_INFO(msg) TESSERA_LOG_SEV(info, msg)
#define TESSERA_LOG_WARN(msg) TESSERA_LOG_SEV(warn, msg)
#define TESSERA_LOG_ERROR(msg) TESSERA_LOG_SEV(error, msg)
#define TESSERA_LOG_FATAL(msg) TESSERA_LOG_SEV(fatal, msg)

// Attaches project_id / upload_id to every record emitted by this thread
// until the enclosing scope exits. At most one use per scope.
#define TESSERA_LOG_SCOPED_UPLOAD(project_id_val, upload_id_val)                  \
  ::boost::log::scoped_attribute _tessera_scoped_project =                        \
    ::boost::log::add_scoped_thread_attribute(                                    \
      ::tessera::logging::kProjectIdAttr,                                         \
      ::boost::log::attributes::constant<std::string>(project_id_val)             \
    );                                                                            \
  ::boost::log::scoped_attribute _tessera_scoped_upload =                         \
    ::boost::log::add_scoped_thread_attribute(                                    \
      ::tessera::logging::kUploadIdAttr,                                          \
      ::boost::log::attributes::constant<std::string>(upload_id_val)              \
    )

// At most one record per interval (seconds) per call site.
#define TESSERA_LOG_THROTTLE(level_macro, interval_sec, msg)                   \
  do {                                                                         \
    static ::tessera::logging::LogThrottle _tessera_throttle;                  \
    if (_tessera_throttle.should_log(interval_sec)) {                          \
      level_macro(msg);                                                        \
    }                                                                          \
  } while (0)

#define TESSERA_LOG_DEBUG_THROTTLE(interval_sec, msg) \
  TESSERA_LOG_THROTTLE(TESSERA_LOG_DEBUG, interval_sec, msg)
#define TESSERA_LOG_INFO_THROTTLE(interval_sec, msg) \
  TESSERA_LOG_THROTTLE(TESSERA_LOG_INFO, interval_sec, msg)
#define TESSERA_LOG_WARN_THROTTLE(interval_sec, msg) \
  TESSERA_LOG_THROTTLE(TESSERA_LOG_WARN, interval_sec, msg)

#endif  // TESSERA_LOG_MACROS_HPP

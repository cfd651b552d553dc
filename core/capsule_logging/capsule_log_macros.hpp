// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CAPSULE_LOG_MACROS_HPP
#define CAPSULE_LOG_MACROS_HPP

#include <boost/log/attributes/constant.hpp>
#include <boost/log/attributes/scoped_attribute.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <sstream>
#include <string>

#include "capsule_log_severity.hpp"

namespace capsule {
namespace logging {

typedef boost::log::sources::severity_logger_mt<severity_level> logger_type;

/**
 * Process-wide logger, defined in capsule_log_init.cpp.
 */
logger_type& get_logger();

/**
 * Key-value field for structured log lines.
 * Usage: CAPSULE_LOG_INFO("Chunk uploaded" << kv("chunk", n));
 */
template <typename T>
inline std::string kv(const char* name, const T& value) {
  std::ostringstream oss;
  oss << " " << name << "=" << value;
  return oss.str();
}

// Strings are quoted so that paths with spaces stay readable
template <>
inline std::string kv(const char* name, const std::string& value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

inline std::string kv(const char* name, const char* value) {
  return kv(name, std::string(value ? value : ""));
}

}  // namespace logging
}  // namespace capsule

// Each translation unit defines CAPSULE_LOG_COMPONENT before including this header.
#ifndef CAPSULE_LOG_COMPONENT
#define CAPSULE_LOG_COMPONENT "capsule"
#endif

// DEBUG records are compiled out of release builds
#ifdef NDEBUG
#define CAPSULE_LOG_ENABLE_DEBUG 0
#else
#define CAPSULE_LOG_ENABLE_DEBUG 1
#endif

#define CAPSULE_LOG_AT(level, msg)                                                            \
  do {                                                                                        \
    BOOST_LOG_SEV(::capsule::logging::get_logger(), ::capsule::logging::severity_level::level) \
      << "[" << CAPSULE_LOG_COMPONENT << "] " << msg;                                         \
  } while (0)

#define CAPSULE_LOG_DEBUG(msg)      \
  do {                              \
    if (CAPSULE_LOG_ENABLE_DEBUG) { \
      CAPSULE_LOG_AT(debug, msg);   \
    }                               \
  } while (0)

#define CAPSULE_LOG_INFO(msg) CAPSULE_LOG_AT(info, msg)
#define CAPSULE_LOG_WARN(msg) CAPSULE_LOG_AT(warn, msg)
#define CAPSULE_LOG_ERROR(msg) CAPSULE_LOG_AT(error, msg)
#define CAPSULE_LOG_FATAL(msg) CAPSULE_LOG_AT(fatal, msg)

// Tags every record emitted in the enclosing scope with the recording folder
// and the server upload session.
// Usage: CAPSULE_LOG_SCOPED_CONTEXT(folder_name, upload_id);
#define CAPSULE_LOG_SCOPED_CONTEXT(recording_val, upload_id_val)                     \
  BOOST_LOG_SCOPED_THREAD_ATTR_INTERNAL(                                             \
    "RecordingID", boost::log::attributes::constant<std::string>(recording_val),     \
    BOOST_LOG_UNIQUE_IDENTIFIER_NAME(_capsule_log_recording_sentry_)                 \
  );                                                                                 \
  BOOST_LOG_SCOPED_THREAD_ATTR_INTERNAL(                                             \
    "UploadID", boost::log::attributes::constant<std::string>(upload_id_val),        \
    BOOST_LOG_UNIQUE_IDENTIFIER_NAME(_capsule_log_upload_sentry_)                    \
  )

// Log the 1st, (n+1)th, (2n+1)th ... occurrence at a call site.
#define CAPSULE_LOG_EVERY_N(level_macro, n, msg)                     \
  do {                                                               \
    static std::atomic<uint64_t> _capsule_log_counter{0};            \
    if ((_capsule_log_counter.fetch_add(1) % (n)) == 0) {            \
      level_macro(msg);                                              \
    }                                                                \
  } while (0)

#define CAPSULE_LOG_DEBUG_EVERY_N(n, msg) CAPSULE_LOG_EVERY_N(CAPSULE_LOG_DEBUG, n, msg)
#define CAPSULE_LOG_INFO_EVERY_N(n, msg) CAPSULE_LOG_EVERY_N(CAPSULE_LOG_INFO, n, msg)
#define CAPSULE_LOG_WARN_EVERY_N(n, msg) CAPSULE_LOG_EVERY_N(CAPSULE_LOG_WARN, n, msg)
#define CAPSULE_LOG_ERROR_EVERY_N(n, msg) CAPSULE_LOG_EVERY_N(CAPSULE_LOG_ERROR, n, msg)

// Log at most once per interval_sec seconds at a call site.
#define CAPSULE_LOG_THROTTLE(level_macro, interval_sec, msg)                                 \
  do {                                                                                       \
    static std::chrono::steady_clock::time_point _capsule_last_log_time{};                   \
    static std::mutex _capsule_throttle_mutex;                                               \
    const auto _capsule_now = std::chrono::steady_clock::now();                              \
    bool _capsule_should_log = false;                                                        \
    {                                                                                        \
      std::lock_guard<std::mutex> _capsule_lock(_capsule_throttle_mutex);                    \
      if (_capsule_now - _capsule_last_log_time >=                                           \
          std::chrono::duration<double>(interval_sec)) {                                     \
        _capsule_last_log_time = _capsule_now;                                               \
        _capsule_should_log = true;                                                          \
      }                                                                                      \
    }                                                                                        \
    if (_capsule_should_log) {                                                               \
      level_macro(msg);                                                                      \
    }                                                                                        \
  } while (0)

#define CAPSULE_LOG_DEBUG_THROTTLE(sec, msg) CAPSULE_LOG_THROTTLE(CAPSULE_LOG_DEBUG, sec, msg)
#define CAPSULE_LOG_INFO_THROTTLE(sec, msg) CAPSULE_LOG_THROTTLE(CAPSULE_LOG_INFO, sec, msg)
#define CAPSULE_LOG_WARN_THROTTLE(sec, msg) CAPSULE_LOG_THROTTLE(CAPSULE_LOG_WARN, sec, msg)
#define CAPSULE_LOG_ERROR_THROTTLE(sec, msg) CAPSULE_LOG_THROTTLE(CAPSULE_LOG_ERROR, sec, msg)

#endif  // CAPSULE_LOG_MACROS_HPP

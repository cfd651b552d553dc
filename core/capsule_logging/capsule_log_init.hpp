// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CAPSULE_LOG_INIT_HPP
#define CAPSULE_LOG_INIT_HPP

#include <boost/log/sinks/sink.hpp>

#include <optional>
#include <string>

#include "capsule_console_sink.hpp"
#include "capsule_file_sink.hpp"
#include "capsule_log_severity.hpp"

namespace capsule {
namespace logging {

/**
 * Sink selection and levels for the uploader process.
 */
struct LoggingConfig {
  bool console_enabled = true;
  bool console_colors = true;
  severity_level console_level = severity_level::info;

  bool file_enabled = false;
  FileSinkConfig file_config;
  severity_level file_level = severity_level::debug;
};

/**
 * Parse "debug", "info", "warn"/"warning", "error" or "fatal" (case-insensitive).
 *
 * @return The level, or std::nullopt for anything else
 */
std::optional<severity_level> parse_severity_level(const std::string& level_str);

/**
 * Apply environment variable overrides in place.
 *
 *   CAPSULE_LOG_LEVEL            - both sinks
 *   CAPSULE_LOG_CONSOLE_LEVEL    - console sink
 *   CAPSULE_LOG_FILE_LEVEL       - file sink
 *   CAPSULE_LOG_FILE_DIR         - log file directory
 *   CAPSULE_LOG_FORMAT           - "json" or "text"
 *   CAPSULE_LOG_FILE_ENABLED     - "true"/"false"
 *   CAPSULE_LOG_CONSOLE_ENABLED  - "true"/"false"
 */
void apply_env_overrides(LoggingConfig& config);

/**
 * Initialize console and file sinks. A second call is a no-op until
 * shutdown_logging() has run.
 */
void init_logging(const LoggingConfig& config);

/**
 * Console only, INFO level, colors on.
 */
void init_logging_default();

/**
 * Stop the async sink threads after draining their queues.
 * Call before the process exits.
 */
void shutdown_logging();

void add_sink(boost::shared_ptr<boost::log::sinks::sink> sink);
void remove_sink(boost::shared_ptr<boost::log::sinks::sink> sink);

void flush_logging();

/**
 * Tear down the current sinks and initialize again from config with
 * environment overrides applied.
 */
void reconfigure_logging(const LoggingConfig& config);

bool is_logging_initialized();

}  // namespace logging
}  // namespace capsule

#endif  // CAPSULE_LOG_INIT_HPP

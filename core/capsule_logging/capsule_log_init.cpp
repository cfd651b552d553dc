// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "capsule_log_init.hpp"

#include <boost/log/core.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>
#include <vector>

#include "capsule_log_macros.hpp"

namespace capsule {
namespace logging {

namespace {

struct SinkRegistry {
  std::mutex mutex;
  std::vector<boost::shared_ptr<boost::log::sinks::sink>> extra_sinks;
  boost::shared_ptr<async_console_sink_t> console_sink;
  boost::shared_ptr<async_file_sink_t> file_sink;
  bool initialized = false;
};

SinkRegistry& registry() {
  static SinkRegistry instance;
  return instance;
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

std::optional<std::string> get_env(const char* name) {
  const char* value = std::getenv(name);
  if (value && value[0] != '\0') {
    return std::string(value);
  }
  return std::nullopt;
}

bool parse_bool(const std::string& s, bool fallback) {
  const std::string lower = to_lower(s);
  if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
    return true;
  }
  if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
    return false;
  }
  return fallback;
}

void apply_level_env(const char* name, severity_level& target) {
  if (auto level_str = get_env(name)) {
    if (auto level = parse_severity_level(*level_str)) {
      target = *level;
    }
  }
}

// Caller holds the registry mutex
void stop_sinks_locked(SinkRegistry& reg) {
  auto core = boost::log::core::get();
  if (reg.console_sink) {
    core->remove_sink(reg.console_sink);
    reg.console_sink->stop();
    reg.console_sink->flush();
    reg.console_sink.reset();
  }
  if (reg.file_sink) {
    core->remove_sink(reg.file_sink);
    reg.file_sink->stop();
    reg.file_sink->flush();
    reg.file_sink.reset();
  }
  for (auto& sink : reg.extra_sinks) {
    core->remove_sink(sink);
  }
  reg.extra_sinks.clear();
}

}  // namespace

std::optional<severity_level> parse_severity_level(const std::string& level_str) {
  const std::string lower = to_lower(level_str);
  if (lower == "debug") return severity_level::debug;
  if (lower == "info") return severity_level::info;
  if (lower == "warn" || lower == "warning") return severity_level::warn;
  if (lower == "error") return severity_level::error;
  if (lower == "fatal") return severity_level::fatal;
  return std::nullopt;
}

void apply_env_overrides(LoggingConfig& config) {
  if (auto level_str = get_env("CAPSULE_LOG_LEVEL")) {
    if (auto level = parse_severity_level(*level_str)) {
      config.console_level = *level;
      config.file_level = *level;
    }
  }

  // Sink-specific levels win over the global one
  apply_level_env("CAPSULE_LOG_CONSOLE_LEVEL", config.console_level);
  apply_level_env("CAPSULE_LOG_FILE_LEVEL", config.file_level);

  if (auto enabled = get_env("CAPSULE_LOG_CONSOLE_ENABLED")) {
    config.console_enabled = parse_bool(*enabled, config.console_enabled);
  }
  if (auto enabled = get_env("CAPSULE_LOG_FILE_ENABLED")) {
    config.file_enabled = parse_bool(*enabled, config.file_enabled);
  }
  if (auto dir = get_env("CAPSULE_LOG_FILE_DIR")) {
    config.file_config.directory = *dir;
  }
  if (auto format = get_env("CAPSULE_LOG_FORMAT")) {
    config.file_config.format_json = (to_lower(*format) == "json");
  }
}

logger_type& get_logger() {
  static logger_type instance;
  return instance;
}

void init_logging(const LoggingConfig& config) {
  auto& reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);
  if (reg.initialized) {
    return;
  }

  auto core = boost::log::core::get();
  boost::log::add_common_attributes();

  if (config.console_enabled) {
    reg.console_sink = create_console_sink(config.console_level, config.console_colors);
    core->add_sink(reg.console_sink);
  }
  if (config.file_enabled) {
    reg.file_sink = create_file_sink(config.file_config, config.file_level);
    core->add_sink(reg.file_sink);
  }

  reg.initialized = true;
}

void init_logging_default() {
  init_logging(LoggingConfig{});
}

void shutdown_logging() {
  auto& reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);
  if (!reg.initialized) {
    return;
  }
  stop_sinks_locked(reg);
  reg.initialized = false;
}

void add_sink(boost::shared_ptr<boost::log::sinks::sink> sink) {
  auto& reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);
  boost::log::core::get()->add_sink(sink);
  reg.extra_sinks.push_back(sink);
}

void remove_sink(boost::shared_ptr<boost::log::sinks::sink> sink) {
  auto& reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);
  boost::log::core::get()->remove_sink(sink);
  auto it = std::find(reg.extra_sinks.begin(), reg.extra_sinks.end(), sink);
  if (it != reg.extra_sinks.end()) {
    reg.extra_sinks.erase(it);
  }
}

void flush_logging() {
  auto& reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);
  if (reg.console_sink) {
    reg.console_sink->flush();
  }
  if (reg.file_sink) {
    reg.file_sink->flush();
  }
}

void reconfigure_logging(const LoggingConfig& config) {
  LoggingConfig final_config = config;
  apply_env_overrides(final_config);
  shutdown_logging();
  init_logging(final_config);
}

bool is_logging_initialized() {
  auto& reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);
  return reg.initialized;
}

}  // namespace logging
}  // namespace capsule

// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "config_parser.hpp"

#include <chrono>
#include <cstdlib>
#include <fstream>

#define CAPSULE_LOG_COMPONENT "config_parser"
#include <capsule_log_init.hpp>
#include <capsule_log_macros.hpp>

namespace capsule {
namespace uploader {

void convert_logging_config(
  const LoggingSettings& settings, ::capsule::logging::LoggingConfig& log_config
) {
  log_config.console_enabled = settings.console_enabled;
  log_config.console_colors = settings.console_colors;
  if (auto level = ::capsule::logging::parse_severity_level(settings.console_level)) {
    log_config.console_level = *level;
  }

  log_config.file_enabled = settings.file_enabled;
  if (auto level = ::capsule::logging::parse_severity_level(settings.file_level)) {
    log_config.file_level = *level;
  }

  log_config.file_config.directory = settings.file_directory;
  log_config.file_config.file_pattern = settings.file_pattern;
  log_config.file_config.format_json = (settings.file_format == "json");
  log_config.file_config.rotation_size_mb = settings.rotation_size_mb;
  log_config.file_config.max_files = settings.max_files;
  log_config.file_config.rotate_at_midnight = settings.rotate_at_midnight;
}

RetryConfig make_retry_config(const UploadSettings& upload) {
  RetryConfig retry;
  retry.max_attempts = upload.chunk_max_attempts;
  retry.delay_step = std::chrono::milliseconds(upload.chunk_delay_step_ms);
  return retry;
}

OrchestratorConfig make_orchestrator_config(const UploadSettings& upload) {
  OrchestratorConfig config;
  config.unreliable_connection = upload.unreliable_connection;
  config.min_resume_seconds = upload.min_resume_seconds;
  return config;
}

HttpTransportConfig make_transport_config(const ApiSettings& api) {
  HttpTransportConfig config;
  config.request_timeout = std::chrono::seconds(api.request_timeout_sec);
  config.put_timeout = std::chrono::seconds(api.put_timeout_sec);
  return config;
}

// ============================================================================
// ConfigParser Implementation
// ============================================================================

bool ConfigParser::load_from_file(const std::string& path, UploaderConfig& config) {
  std::ifstream file(path);
  if (!file.good()) {
    last_error_ = "Config file not found or not readable: " + path;
    return false;
  }

  try {
    YAML::Node yaml = YAML::LoadFile(path);
    return load_from_string(YAML::Dump(yaml), config);
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML file: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::load_from_string(const std::string& yaml_content, UploaderConfig& config) {
  try {
    YAML::Node node = YAML::Load(yaml_content);
    if (!node.IsDefined() || node.IsNull()) {
      return true;
    }
    if (!node.IsMap()) {
      last_error_ = "Top-level YAML node must be a map";
      return false;
    }

    if (node["api"]) {
      parse_api(node["api"], config.api);
    }
    if (node["recordings"]) {
      parse_recordings(node["recordings"], config.recordings);
    }
    if (node["upload"]) {
      parse_upload(node["upload"], config.upload);
    }
    if (node["logging"]) {
      parse_logging(node["logging"], config.logging);
    }
    return true;
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML content: " + std::string(e.what());
    return false;
  }
}

void ConfigParser::parse_api(const YAML::Node& node, ApiSettings& api) {
  if (node["base_url"]) {
    api.base_url = node["base_url"].as<std::string>();
  }
  if (node["api_key"]) {
    api.api_key = node["api_key"].as<std::string>();
  }
  if (node["request_timeout_sec"]) {
    api.request_timeout_sec = node["request_timeout_sec"].as<int>();
  }
  if (node["put_timeout_sec"]) {
    api.put_timeout_sec = node["put_timeout_sec"].as<int>();
  }
}

void ConfigParser::parse_recordings(const YAML::Node& node, RecordingsSettings& recordings) {
  if (node["directory"]) {
    recordings.directory = node["directory"].as<std::string>();
  }
  if (node["delete_uploaded"]) {
    recordings.delete_uploaded = node["delete_uploaded"].as<bool>();
  }
  if (node["scan_interval_sec"]) {
    recordings.scan_interval_sec = node["scan_interval_sec"].as<int>();
  }
}

void ConfigParser::parse_upload(const YAML::Node& node, UploadSettings& upload) {
  if (node["unreliable_connection"]) {
    upload.unreliable_connection = node["unreliable_connection"].as<bool>();
  }
  if (node["min_resume_seconds"]) {
    upload.min_resume_seconds = node["min_resume_seconds"].as<int64_t>();
  }

  if (node["chunk_retry"]) {
    const auto& retry = node["chunk_retry"];
    if (retry["max_attempts"]) {
      upload.chunk_max_attempts = retry["max_attempts"].as<int>();
    }
    if (retry["delay_step_ms"]) {
      upload.chunk_delay_step_ms = retry["delay_step_ms"].as<int>();
    }
  }
}

void ConfigParser::parse_logging(const YAML::Node& node, LoggingSettings& logging) {
  if (node["console"]) {
    const auto& console = node["console"];
    if (console["enabled"]) {
      logging.console_enabled = console["enabled"].as<bool>();
    }
    if (console["colors"]) {
      logging.console_colors = console["colors"].as<bool>();
    }
    if (console["level"]) {
      logging.console_level = console["level"].as<std::string>();
    }
  }

  if (node["file"]) {
    const auto& file = node["file"];
    if (file["enabled"]) {
      logging.file_enabled = file["enabled"].as<bool>();
    }
    if (file["level"]) {
      logging.file_level = file["level"].as<std::string>();
    }
    if (file["directory"]) {
      logging.file_directory = file["directory"].as<std::string>();
    }
    if (file["pattern"]) {
      logging.file_pattern = file["pattern"].as<std::string>();
    }
    if (file["format"]) {
      logging.file_format = file["format"].as<std::string>();
    }
    if (file["rotation_size_mb"]) {
      logging.rotation_size_mb = file["rotation_size_mb"].as<uint64_t>();
    }
    if (file["max_files"]) {
      logging.max_files = file["max_files"].as<int>();
    }
    if (file["rotate_at_midnight"]) {
      logging.rotate_at_midnight = file["rotate_at_midnight"].as<bool>();
    }
  }
}

void ConfigParser::apply_env_overrides(UploaderConfig& config) {
  if (config.api.api_key.empty()) {
    if (const char* key = std::getenv("CAPSULE_API_KEY")) {
      config.api.api_key = key;
      CAPSULE_LOG_DEBUG("API key taken from CAPSULE_API_KEY");
    }
  }
}

bool ConfigParser::validate(const UploaderConfig& config, std::string& error_msg) {
  if (config.api.base_url.empty()) {
    error_msg = "api.base_url is required";
    return false;
  }
  if (config.api.base_url.rfind("http://", 0) != 0 &&
      config.api.base_url.rfind("https://", 0) != 0) {
    error_msg = "api.base_url must start with http:// or https://";
    return false;
  }
  if (config.api.api_key.empty()) {
    error_msg = "api.api_key is required (or set CAPSULE_API_KEY)";
    return false;
  }
  if (config.api.request_timeout_sec <= 0 || config.api.put_timeout_sec <= 0) {
    error_msg = "api timeouts must be positive";
    return false;
  }
  if (config.recordings.directory.empty()) {
    error_msg = "recordings.directory is required";
    return false;
  }
  if (config.recordings.scan_interval_sec <= 0) {
    error_msg = "recordings.scan_interval_sec must be positive";
    return false;
  }
  if (config.upload.chunk_max_attempts <= 0) {
    error_msg = "upload.chunk_retry.max_attempts must be at least 1";
    return false;
  }
  if (config.upload.chunk_delay_step_ms < 0) {
    error_msg = "upload.chunk_retry.delay_step_ms must not be negative";
    return false;
  }
  if (config.upload.min_resume_seconds < 0) {
    error_msg = "upload.min_resume_seconds must not be negative";
    return false;
  }
  if (config.logging.file_format != "json" && config.logging.file_format != "text") {
    error_msg = "logging.file.format must be 'json' or 'text'";
    return false;
  }
  return true;
}

}  // namespace uploader
}  // namespace capsule

// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CAPSULE_UPLOADER_CONFIG_HPP
#define CAPSULE_UPLOADER_CONFIG_HPP

#include <cstdint>
#include <string>

namespace capsule {
namespace uploader {

/**
 * Remote multipart API
 */
struct ApiSettings {
  std::string base_url;
  std::string api_key;  // CAPSULE_API_KEY is used when empty
  int request_timeout_sec = 30;
  int put_timeout_sec = 300;
};

struct RecordingsSettings {
  std::string directory;
  bool delete_uploaded = false;
  int scan_interval_sec = 60;
};

struct UploadSettings {
  bool unreliable_connection = false;
  int64_t min_resume_seconds = 15 * 60;
  int chunk_max_attempts = 5;
  int chunk_delay_step_ms = 500;
};

/**
 * Logging section as written in YAML. Levels stay strings until
 * convert_logging_config() maps them onto the logging library.
 */
struct LoggingSettings {
  bool console_enabled = true;
  bool console_colors = true;
  std::string console_level = "info";

  bool file_enabled = false;
  std::string file_level = "debug";
  std::string file_directory = "/var/log/capsule";
  std::string file_pattern = "uploader_%Y%m%d_%H%M%S.log";
  std::string file_format = "json";  // "json" or "text"
  uint64_t rotation_size_mb = 50;
  int max_files = 10;
  bool rotate_at_midnight = true;
};

struct UploaderConfig {
  ApiSettings api;
  RecordingsSettings recordings;
  UploadSettings upload;
  LoggingSettings logging;
};

}  // namespace uploader
}  // namespace capsule

#endif  // CAPSULE_UPLOADER_CONFIG_HPP

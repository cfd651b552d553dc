// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CAPSULE_UPLOADER_CONFIG_PARSER_HPP
#define CAPSULE_UPLOADER_CONFIG_PARSER_HPP

#include <yaml-cpp/yaml.h>

#include <string>

#include "http_transport.hpp"
#include "retry_handler.hpp"
#include "upload_orchestrator.hpp"
#include "uploader_config.hpp"

namespace capsule {
namespace logging {
struct LoggingConfig;
}
}  // namespace capsule

namespace capsule {
namespace uploader {

/**
 * Map the YAML logging section onto the logging library's config.
 * Unknown level names keep the library default.
 */
void convert_logging_config(
  const LoggingSettings& settings, ::capsule::logging::LoggingConfig& log_config
);

RetryConfig make_retry_config(const UploadSettings& upload);
OrchestratorConfig make_orchestrator_config(const UploadSettings& upload);
HttpTransportConfig make_transport_config(const ApiSettings& api);

class ConfigParser {
public:
  ConfigParser() = default;

  /**
   * Load configuration from YAML file
   */
  bool load_from_file(const std::string& path, UploaderConfig& config);

  /**
   * Load configuration from YAML string. Keys that are absent keep the
   * values already in config.
   */
  bool load_from_string(const std::string& yaml_content, UploaderConfig& config);

  /**
   * Fill settings that may come from the environment (CAPSULE_API_KEY)
   */
  static void apply_env_overrides(UploaderConfig& config);

  /**
   * Validate configuration
   */
  static bool validate(const UploaderConfig& config, std::string& error_msg);

  /**
   * Get last error message
   */
  std::string get_last_error() const {
    return last_error_;
  }

private:
  void parse_api(const YAML::Node& node, ApiSettings& api);
  void parse_recordings(const YAML::Node& node, RecordingsSettings& recordings);
  void parse_upload(const YAML::Node& node, UploadSettings& upload);
  void parse_logging(const YAML::Node& node, LoggingSettings& logging);

  std::string last_error_;
};

}  // namespace uploader
}  // namespace capsule

#endif  // CAPSULE_UPLOADER_CONFIG_PARSER_HPP

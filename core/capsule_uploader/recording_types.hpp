// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CAPSULE_RECORDING_TYPES_HPP
#define CAPSULE_RECORDING_TYPES_HPP

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace capsule {
namespace uploader {

// Artifacts written by the recorder into every recording folder
constexpr const char* kVideoFileName = "recording.mp4";
constexpr const char* kInputsFileName = "inputs.csv";
constexpr const char* kMetadataFileName = "metadata.json";

// Lifecycle markers
constexpr const char* kUploadedMarker = ".uploaded";
constexpr const char* kInvalidMarker = ".invalid";
constexpr const char* kServerInvalidMarker = ".server_invalid";

/**
 * Fields of metadata.json the uploader relies on. The whole document is kept
 * so it can be forwarded to the server untouched.
 */
struct RecordingMetadata {
  std::string game_exe;
  std::string session_id;
  std::string hardware_id;
  double start_timestamp = 0.0;
  double end_timestamp = 0.0;
  double duration = 0.0;
  nlohmann::json document;

  /**
   * Throws UploadError(SERIALIZATION) when a required field is missing
   */
  static RecordingMetadata from_json(const nlohmann::json& j);

  static RecordingMetadata parse(const std::string& text);
};

/**
 * Three artifact paths of a recording that passed local validation
 */
struct RecordingArtifact {
  std::string video_path;
  std::string inputs_path;
  std::string metadata_path;
  uint64_t total_bytes = 0;
  double duration_seconds = 0.0;
};

/**
 * Common facts about a recording folder, whatever its state
 */
struct RecordingInfo {
  std::string folder_name;
  std::string folder_path;
  uint64_t folder_size = 0;
  std::optional<int64_t> timestamp;  // unix seconds parsed from folder_name
};

}  // namespace uploader
}  // namespace capsule

#endif  // CAPSULE_RECORDING_TYPES_HPP

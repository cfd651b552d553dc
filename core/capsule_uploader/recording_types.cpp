// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "recording_types.hpp"

#include "upload_error.hpp"

namespace capsule {
namespace uploader {

RecordingMetadata RecordingMetadata::from_json(const nlohmann::json& j) {
  RecordingMetadata metadata;
  try {
    metadata.game_exe = j.at("game_exe").get<std::string>();
    metadata.session_id = j.at("session_id").get<std::string>();
    metadata.hardware_id = j.at("hardware_id").get<std::string>();
    metadata.start_timestamp = j.at("start_timestamp").get<double>();
    metadata.end_timestamp = j.at("end_timestamp").get<double>();
    metadata.duration = j.at("duration").get<double>();
  } catch (const nlohmann::json::exception& e) {
    throw UploadError::serialization(std::string("invalid metadata: ") + e.what());
  }
  metadata.document = j;
  return metadata;
}

RecordingMetadata RecordingMetadata::parse(const std::string& text) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(text);
  } catch (const nlohmann::json::exception& e) {
    throw UploadError::serialization(std::string("metadata is not JSON: ") + e.what());
  }
  return from_json(j);
}

}  // namespace uploader
}  // namespace capsule

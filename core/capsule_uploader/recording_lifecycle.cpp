// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "recording_lifecycle.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sstream>

#include "upload_error.hpp"

#define CAPSULE_LOG_COMPONENT "lifecycle"
#include <capsule_log_macros.hpp>

namespace capsule {
namespace uploader {

using capsule::logging::kv;

namespace {

std::string join_path(const std::string& folder, const std::string& name) {
  return (std::filesystem::path(folder) / name).string();
}

std::string trim(const std::string& s) {
  const auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return "";
  }
  const auto last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}

std::optional<int64_t> parse_folder_timestamp(const std::string& name) {
  if (name.empty() || name.size() > 18 ||
      !std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
      })) {
    return std::nullopt;
  }
  return static_cast<int64_t>(std::stoll(name));
}

}  // namespace

RecordingStatus recordingStatus(const RecordingState& state) {
  switch (state.index()) {
    case 0:
      return RecordingStatus::UNUPLOADED;
    case 1:
      return RecordingStatus::PAUSED;
    case 2:
      return RecordingStatus::UPLOADED;
    default:
      return RecordingStatus::INVALID;
  }
}

const RecordingInfo& recordingInfo(const RecordingState& state) {
  return std::visit(
    [](const auto& recording) -> const RecordingInfo& {
      return recording.info;
    },
    state
  );
}

RecordingLifecycle::RecordingLifecycle(const IFileSystem& fs)
    : fs_(fs) {}

RecordingInfo RecordingLifecycle::read_info(const std::string& folder) const {
  RecordingInfo info;
  info.folder_path = folder;
  info.folder_name = std::filesystem::path(folder).filename().string();
  info.timestamp = parse_folder_timestamp(info.folder_name);
  for (const auto& entry : fs_.list_directory(folder)) {
    if (fs_.is_file(entry)) {
      info.folder_size += fs_.file_size(entry).value_or(0);
    }
  }
  return info;
}

std::optional<RecordingMetadata> RecordingLifecycle::read_metadata(
  const std::string& folder
) const {
  auto text = fs_.read_file(join_path(folder, kMetadataFileName));
  if (!text) {
    return std::nullopt;
  }
  try {
    return RecordingMetadata::parse(*text);
  } catch (const UploadError& e) {
    CAPSULE_LOG_DEBUG("Unreadable metadata" << kv("folder", folder) << kv("error", e.what()));
    return std::nullopt;
  }
}

std::vector<std::string> RecordingLifecycle::read_reasons(const std::string& marker_path) const {
  std::vector<std::string> reasons;
  std::istringstream lines(fs_.read_file(marker_path).value_or(""));
  std::string line;
  while (std::getline(lines, line)) {
    line = trim(line);
    if (!line.empty()) {
      reasons.push_back(line);
    }
  }
  return reasons;
}

std::optional<RecordingState> RecordingLifecycle::from_path(const std::string& folder) const {
  if (!fs_.is_directory(folder)) {
    return std::nullopt;
  }
  RecordingInfo info = read_info(folder);

  const std::string uploaded_marker = join_path(folder, kUploadedMarker);
  if (fs_.is_file(uploaded_marker)) {
    return RecordingState{
      UploadedRecording{info, trim(fs_.read_file(uploaded_marker).value_or(""))}
    };
  }

  const std::string server_marker = join_path(folder, kServerInvalidMarker);
  const std::string local_marker = join_path(folder, kInvalidMarker);
  const bool by_server = fs_.is_file(server_marker);
  if (by_server || fs_.is_file(local_marker)) {
    return RecordingState{InvalidRecording{
      info, read_metadata(folder), read_reasons(by_server ? server_marker : local_marker),
      by_server
    }};
  }

  const std::string progress_path = UploadProgressStore::path_for(folder);
  if (fs_.is_file(progress_path)) {
    try {
      auto progress = UploadProgressStore::load(progress_path);
      return RecordingState{PausedRecording{info, read_metadata(folder), std::move(progress)}};
    } catch (const UploadError& e) {
      CAPSULE_LOG_WARN(
        "Ignoring corrupt upload progress" << kv("folder", folder) << kv("error", e.what())
      );
    }
  }

  return RecordingState{UnuploadedRecording{info, read_metadata(folder)}};
}

std::vector<RecordingState> RecordingLifecycle::scan_directory(
  const std::string& directory
) const {
  std::vector<RecordingState> recordings;
  for (const auto& entry : fs_.list_directory(directory)) {
    if (auto state = from_path(entry)) {
      recordings.push_back(std::move(*state));
    }
  }

  std::stable_sort(
    recordings.begin(), recordings.end(),
    [](const RecordingState& a, const RecordingState& b) {
      const auto& ia = recordingInfo(a);
      const auto& ib = recordingInfo(b);
      if (ia.timestamp.has_value() != ib.timestamp.has_value()) {
        return ia.timestamp.has_value();
      }
      if (ia.timestamp && *ia.timestamp != *ib.timestamp) {
        return *ia.timestamp > *ib.timestamp;
      }
      return ia.folder_name > ib.folder_name;
    }
  );
  return recordings;
}

ArtifactValidation RecordingLifecycle::validate_artifacts(const std::string& folder) const {
  ArtifactValidation result;
  RecordingArtifact artifact;
  artifact.video_path = join_path(folder, kVideoFileName);
  artifact.inputs_path = join_path(folder, kInputsFileName);
  artifact.metadata_path = join_path(folder, kMetadataFileName);

  for (const auto* path : {&artifact.video_path, &artifact.inputs_path, &artifact.metadata_path}) {
    std::optional<uint64_t> size;
    if (fs_.is_file(*path)) {
      size = fs_.file_size(*path);
    }
    const std::string name = std::filesystem::path(*path).filename().string();
    if (!size) {
      result.reasons.push_back("Missing " + name);
    } else if (*size == 0) {
      result.reasons.push_back(name + " is empty");
    } else {
      artifact.total_bytes += *size;
    }
  }

  if (auto text = fs_.read_file(artifact.metadata_path)) {
    try {
      result.metadata = RecordingMetadata::parse(*text);
      artifact.duration_seconds = result.metadata->duration;
      if (result.metadata->duration <= 0.0) {
        result.reasons.push_back("Recording duration is not positive");
      }
    } catch (const UploadError& e) {
      result.reasons.push_back(std::string("Unreadable ") + kMetadataFileName + ": " + e.what());
    }
  }

  if (result.reasons.empty()) {
    result.artifact = artifact;
  }
  return result;
}

void RecordingLifecycle::write_marker(const std::string& path, const std::string& contents) const {
  if (!fs_.write_file(path, contents)) {
    throw UploadError::io("cannot write marker " + path);
  }
}

void RecordingLifecycle::remove_upload_artifacts(
  const std::string& folder, const UploadProgressState& progress
) const {
  if (!fs_.remove(UploadProgressStore::path_for(folder))) {
    CAPSULE_LOG_WARN("Failed to remove progress file" << kv("folder", folder));
  }
  if (!progress.tar_path.empty() && !fs_.remove(progress.tar_path)) {
    CAPSULE_LOG_WARN("Failed to remove archive" << kv("path", progress.tar_path));
  }
}

UploadedRecording RecordingLifecycle::mark_uploaded(
  const PausedRecording& paused, const std::string& content_id
) const {
  const auto& folder = paused.info.folder_path;
  write_marker(join_path(folder, kUploadedMarker), content_id);
  remove_upload_artifacts(folder, paused.progress);
  CAPSULE_LOG_INFO("Recording uploaded" << kv("folder", folder) << kv("content_id", content_id));
  return UploadedRecording{read_info(folder), content_id};
}

InvalidRecording RecordingLifecycle::mark_invalid(
  const RecordingInfo& info, const std::optional<RecordingMetadata>& metadata,
  const std::vector<std::string>& reasons
) const {
  std::string contents;
  for (const auto& reason : reasons) {
    contents += reason + "\n";
  }
  write_marker(join_path(info.folder_path, kInvalidMarker), contents);
  CAPSULE_LOG_WARN("Recording marked invalid" << kv("folder", info.folder_path)
                                              << kv("reasons", reasons.size()));
  return InvalidRecording{info, metadata, reasons, false};
}

InvalidRecording RecordingLifecycle::mark_server_invalid(
  const PausedRecording& paused, const std::string& reason
) const {
  const auto& folder = paused.info.folder_path;
  write_marker(join_path(folder, kServerInvalidMarker), reason + "\n");
  remove_upload_artifacts(folder, paused.progress);
  CAPSULE_LOG_WARN("Recording rejected by server" << kv("folder", folder) << kv("reason", reason));
  return InvalidRecording{read_info(folder), paused.metadata, {reason}, true};
}

void RecordingLifecycle::abort_and_cleanup(
  IRemoteUploadClient& client, const PausedRecording& paused
) const {
  abort_upload_best_effort(client, paused.progress.session.upload_id);
  remove_upload_artifacts(paused.info.folder_path, paused.progress);
}

bool RecordingLifecycle::delete_recording(
  const RecordingState& state, IRemoteUploadClient& client
) const {
  if (const auto* paused = std::get_if<PausedRecording>(&state)) {
    abort_upload_best_effort(client, paused->progress.session.upload_id);
  }
  const auto& folder = recordingInfo(state).folder_path;
  if (!fs_.remove_all(folder)) {
    CAPSULE_LOG_ERROR("Failed to delete recording" << kv("folder", folder));
    return false;
  }
  CAPSULE_LOG_INFO("Deleted recording" << kv("folder", folder));
  return true;
}

}  // namespace uploader
}  // namespace capsule

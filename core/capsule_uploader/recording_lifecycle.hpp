// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CAPSULE_RECORDING_LIFECYCLE_HPP
#define CAPSULE_RECORDING_LIFECYCLE_HPP

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "recording_types.hpp"
#include "remote_upload_client.hpp"
#include "upload_progress_store.hpp"
#include "uploader_interfaces.hpp"

namespace capsule {
namespace uploader {

struct UnuploadedRecording {
  RecordingInfo info;
  std::optional<RecordingMetadata> metadata;
};

/**
 * Partially uploaded; carries the session to resume
 */
struct PausedRecording {
  RecordingInfo info;
  std::optional<RecordingMetadata> metadata;
  UploadProgressState progress;
};

struct UploadedRecording {
  RecordingInfo info;
  std::string content_id;
};

struct InvalidRecording {
  RecordingInfo info;
  std::optional<RecordingMetadata> metadata;
  std::vector<std::string> reasons;
  bool by_server = false;
};

/**
 * Disposition of one recording folder, derived from its marker files only
 */
using RecordingState =
  std::variant<UnuploadedRecording, PausedRecording, UploadedRecording, InvalidRecording>;

enum class RecordingStatus { UNUPLOADED, PAUSED, UPLOADED, INVALID };

inline std::string recordingStatusToString(RecordingStatus status) {
  switch (status) {
    case RecordingStatus::UNUPLOADED:
      return "unuploaded";
    case RecordingStatus::PAUSED:
      return "paused";
    case RecordingStatus::UPLOADED:
      return "uploaded";
    case RecordingStatus::INVALID:
      return "invalid";
  }
  return "unknown";
}

RecordingStatus recordingStatus(const RecordingState& state);
const RecordingInfo& recordingInfo(const RecordingState& state);

/**
 * Result of checking a folder's artifacts before a fresh upload
 */
struct ArtifactValidation {
  std::optional<RecordingArtifact> artifact;
  std::optional<RecordingMetadata> metadata;
  std::vector<std::string> reasons;  // empty when valid

  bool ok() const {
    return reasons.empty() && artifact.has_value();
  }
};

/**
 * Reads and mutates the marker files of recording folders.
 *
 * Scan priority: .uploaded, then .server_invalid / .invalid, then a readable
 * .upload-progress. Anything else (an unreadable progress file included) is
 * Unuploaded.
 *
 * Mutations write the new marker before removing the files it supersedes, so
 * a crash in between leaves the folder in the newer state.
 */
class RecordingLifecycle {
public:
  explicit RecordingLifecycle(const IFileSystem& fs);

  /**
   * @return std::nullopt if folder is not a directory
   */
  std::optional<RecordingState> from_path(const std::string& folder) const;

  /**
   * Every recording folder under directory, newest first by folder-name
   * timestamp. Folders without a numeric name sort last.
   */
  std::vector<RecordingState> scan_directory(const std::string& directory) const;

  ArtifactValidation validate_artifacts(const std::string& folder) const;

  /**
   * @throws UploadError(IO) if the marker cannot be written
   */
  UploadedRecording mark_uploaded(const PausedRecording& paused,
                                  const std::string& content_id) const;

  InvalidRecording mark_invalid(
    const RecordingInfo& info, const std::optional<RecordingMetadata>& metadata,
    const std::vector<std::string>& reasons
  ) const;

  InvalidRecording mark_server_invalid(const PausedRecording& paused,
                                       const std::string& reason) const;

  /**
   * Remove the progress file and the archive of an upload attempt
   */
  void remove_upload_artifacts(const std::string& folder, const UploadProgressState& progress) const;

  /**
   * Best-effort server abort followed by local artifact removal
   */
  void abort_and_cleanup(IRemoteUploadClient& client, const PausedRecording& paused) const;

  /**
   * Delete a recording folder. A Paused recording is aborted server-side first.
   */
  bool delete_recording(const RecordingState& state, IRemoteUploadClient& client) const;

  RecordingInfo read_info(const std::string& folder) const;

private:
  std::optional<RecordingMetadata> read_metadata(const std::string& folder) const;
  std::vector<std::string> read_reasons(const std::string& marker_path) const;
  void write_marker(const std::string& path, const std::string& contents) const;

  const IFileSystem& fs_;
};

}  // namespace uploader
}  // namespace capsule

#endif  // CAPSULE_RECORDING_LIFECYCLE_HPP

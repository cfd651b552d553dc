// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CAPSULE_UPLOAD_ORCHESTRATOR_HPP
#define CAPSULE_UPLOAD_ORCHESTRATOR_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "chunk_uploader.hpp"
#include "progress_sender.hpp"
#include "recording_lifecycle.hpp"
#include "remote_upload_client.hpp"
#include "uploader_interfaces.hpp"

namespace capsule {
namespace uploader {

enum class UploadOutcome { SUCCESS, SERVER_INVALID, PAUSED };

inline std::string uploadOutcomeToString(UploadOutcome outcome) {
  switch (outcome) {
    case UploadOutcome::SUCCESS:
      return "success";
    case UploadOutcome::SERVER_INVALID:
      return "server_invalid";
    case UploadOutcome::PAUSED:
      return "paused";
  }
  return "unknown";
}

/**
 * Terminal outcome of one upload attempt plus the recording's new state
 */
struct UploadResult {
  UploadOutcome outcome;
  RecordingState recording;
};

struct OrchestratorConfig {
  bool unreliable_connection = false;
  uint64_t unreliable_chunk_size_bytes = 5 * 1024 * 1024;
  int64_t min_resume_seconds = 15 * 60;  // below this a saved session is not resumed
};

/**
 * Aborts an in-flight upload unless released.
 *
 * While armed, destruction issues a best-effort server abort and removes the
 * progress file and archive, leaving the folder Unuploaded. release() is
 * called on the exits that keep the session (pause, resumable errors) or have
 * already finished it (success, server invalidation).
 */
class AbortUploadGuard {
public:
  AbortUploadGuard(
    IRemoteUploadClient& client, const RecordingLifecycle& lifecycle,
    const PausedRecording& recording
  )
      : client_(client)
      , lifecycle_(lifecycle)
      , recording_(recording)
      , armed_(true) {}

  ~AbortUploadGuard();

  void release() {
    armed_ = false;
  }

  bool is_armed() const {
    return armed_;
  }

  // Non-copyable, non-movable
  AbortUploadGuard(const AbortUploadGuard&) = delete;
  AbortUploadGuard& operator=(const AbortUploadGuard&) = delete;
  AbortUploadGuard(AbortUploadGuard&&) = delete;
  AbortUploadGuard& operator=(AbortUploadGuard&&) = delete;

private:
  IRemoteUploadClient& client_;
  const RecordingLifecycle& lifecycle_;
  const PausedRecording& recording_;
  bool armed_;
};

/**
 * Drives one recording from Unuploaded/Paused to a terminal outcome.
 *
 * Chunks are sent strictly in order. The pause flag is only consulted between
 * chunks, so a chunk in flight always finishes or fails on its own.
 *
 * Errors (UploadError):
 * - VALIDATION: the recording failed local checks and is now marked .invalid,
 *   or it is not in an uploadable state
 * - SESSION_EXPIRED, CHUNK_UPLOAD_FAILED and any complete failure keep the
 *   progress file for a later attempt
 * - everything else aborts the session and removes local upload artifacts
 */
class UploadOrchestrator {
public:
  using UnixClock = std::function<int64_t()>;
  using HardwareIdProvider = std::function<std::string()>;

  UploadOrchestrator(
    IRemoteUploadClient& client, ChunkUploader& chunk_uploader,
    const RecordingLifecycle& lifecycle, IFileStreamFactory& streams, const IFileSystem& fs,
    const OrchestratorConfig& config, HardwareIdProvider hardware_id,
    UnixClock clock = UnixClock()
  );

  UploadOrchestrator(const UploadOrchestrator&) = delete;
  UploadOrchestrator& operator=(const UploadOrchestrator&) = delete;

  UploadResult upload(
    const RecordingState& recording, const std::atomic<bool>& pause_flag,
    const ProgressCallback& on_progress = ProgressCallback(),
    const FileProgress& file_progress = FileProgress()
  );

  /**
   * Keep a saved session only if its archive is still there and more than
   * min_resume_seconds remain. Otherwise abort it, clean up, and return
   * std::nullopt so the caller starts over.
   */
  std::optional<PausedRecording> validate_resume(const PausedRecording& paused);

  static std::string format_rfc3339(int64_t unix_seconds);

private:
  /**
   * Validate artifacts, build the archive and open a server session.
   * The progress file is not written yet.
   */
  PausedRecording start_fresh(const RecordingInfo& info);

  UploadResult run(
    PausedRecording& paused, bool fresh, const std::atomic<bool>& pause_flag,
    const ProgressCallback& on_progress, const FileProgress& file_progress
  );

  UploadResult complete(PausedRecording& paused, AbortUploadGuard& guard);

  int64_t now() const;

  IRemoteUploadClient& client_;
  ChunkUploader& chunk_uploader_;
  const RecordingLifecycle& lifecycle_;
  IFileStreamFactory& streams_;
  const IFileSystem& fs_;
  OrchestratorConfig config_;
  HardwareIdProvider hardware_id_;
  UnixClock clock_;
};

}  // namespace uploader
}  // namespace capsule

#endif  // CAPSULE_UPLOAD_ORCHESTRATOR_HPP

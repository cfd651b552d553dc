// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_manager.hpp"

#include <utility>
#include <vector>

#include "upload_error.hpp"

#define CAPSULE_LOG_COMPONENT "upload_manager"
#include <capsule_log_macros.hpp>

namespace capsule {
namespace uploader {

using capsule::logging::kv;

UploadManager::UploadManager(
  const UploadManagerConfig& config, UploadOrchestrator& orchestrator,
  const RecordingLifecycle& lifecycle, IRemoteUploadClient& client
)
    : config_(config)
    , orchestrator_(orchestrator)
    , lifecycle_(lifecycle)
    , client_(client) {}

UploadManager::~UploadManager() {
  pause();
  wait();
}

void UploadManager::set_event_callback(UploadEventCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  event_callback_ = std::move(callback);
}

void UploadManager::set_progress_callback(ProgressCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  progress_callback_ = std::move(callback);
}

BatchStats UploadManager::last_batch() const {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  return last_batch_;
}

void UploadManager::emit(const UploadEvent& event) {
  UploadEventCallback callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback = event_callback_;
  }
  if (callback) {
    callback(event);
  }
}

bool UploadManager::upload_all() {
  if (running_.exchange(true)) {
    CAPSULE_LOG_INFO("Upload batch already running");
    return false;
  }
  if (worker_.joinable()) {
    worker_.join();
  }
  pause_flag_ = false;
  worker_ = std::thread([this]() {
    process_batch();
    running_ = false;
  });
  return true;
}

BatchStats UploadManager::run_batch() {
  if (running_.exchange(true)) {
    CAPSULE_LOG_INFO("Upload batch already running");
    return BatchStats();
  }
  pause_flag_ = false;
  auto stats = process_batch();
  running_ = false;
  return stats;
}

void UploadManager::pause() {
  if (running_.load() && !pause_flag_.exchange(true)) {
    CAPSULE_LOG_INFO("Pause requested; stopping after the current chunk");
  }
}

void UploadManager::wait() {
  if (worker_.joinable()) {
    worker_.join();
  }
}

BatchStats UploadManager::process_batch() {
  BatchStats stats;

  for (const auto& recording : lifecycle_.scan_directory(config_.recordings_directory)) {
    const auto status = recordingStatus(recording);
    if (status == RecordingStatus::PAUSED || status == RecordingStatus::UNUPLOADED) {
      if (queue_.enqueue(recordingInfo(recording).folder_path)) {
        stats.queued++;
      }
    }
  }
  CAPSULE_LOG_INFO("Upload batch started" << kv("recordings", stats.queued)
                                          << kv("directory", config_.recordings_directory));

  size_t processed = 0;
  while (!pause_flag_.load()) {
    auto folder = queue_.dequeue();
    if (!folder) {
      break;
    }
    process_recording(*folder, stats.queued - processed, stats);
    queue_.complete_current();
    processed++;
  }

  if (pause_flag_.load()) {
    stats.paused = true;
    queue_.clear();
  }

  CAPSULE_LOG_INFO(
    "Upload batch finished" << kv("succeeded", stats.succeeded) << kv("failed", stats.failed)
                            << kv("server_invalid", stats.server_invalid)
                            << kv("paused", stats.paused)
  );
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    last_batch_ = stats;
  }
  emit(UploadEvent{UploadEventType::BATCH_FINISHED, config_.recordings_directory, "", false});
  return stats;
}

void UploadManager::process_recording(
  const std::string& folder, size_t files_remaining, BatchStats& stats
) {
  // State may have changed since the scan (deleted, uploaded by another run)
  auto recording = lifecycle_.from_path(folder);
  if (!recording) {
    CAPSULE_LOG_WARN("Queued recording disappeared" << kv("folder", folder));
    return;
  }
  const auto status = recordingStatus(*recording);
  if (status != RecordingStatus::PAUSED && status != RecordingStatus::UNUPLOADED) {
    return;
  }

  ProgressCallback progress_callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    progress_callback = progress_callback_;
  }
  FileProgress file_progress{recordingInfo(*recording).folder_name, files_remaining};

  emit(UploadEvent{UploadEventType::STARTED, folder, recordingStatusToString(status), false});

  try {
    auto result = orchestrator_.upload(*recording, pause_flag_, progress_callback, file_progress);
    switch (result.outcome) {
      case UploadOutcome::SUCCESS:
        stats.succeeded++;
        emit(UploadEvent{UploadEventType::SUCCEEDED, folder, "", false});
        if (config_.delete_uploaded) {
          lifecycle_.delete_recording(result.recording, client_);
        }
        break;
      case UploadOutcome::SERVER_INVALID: {
        stats.server_invalid++;
        const auto& invalid = std::get<InvalidRecording>(result.recording);
        emit(UploadEvent{
          UploadEventType::SERVER_INVALID, folder,
          invalid.reasons.empty() ? std::string() : invalid.reasons.front(), false
        });
        break;
      }
      case UploadOutcome::PAUSED:
        emit(UploadEvent{UploadEventType::PAUSED, folder, "", false});
        break;
    }
  } catch (const UploadError& e) {
    stats.failed++;
    CAPSULE_LOG_ERROR(
      "Upload failed" << kv("folder", folder) << kv("kind", uploadErrorKindToString(e.kind()))
                      << kv("network", e.is_network_error()) << kv("error", e.what())
    );
    emit(UploadEvent{UploadEventType::FAILED, folder, e.what(), e.is_network_error()});
  } catch (const std::exception& e) {
    stats.failed++;
    CAPSULE_LOG_ERROR("Upload failed unexpectedly" << kv("folder", folder)
                                                   << kv("error", e.what()));
    emit(UploadEvent{UploadEventType::FAILED, folder, e.what(), false});
  }
}

bool UploadManager::delete_recording(const std::string& folder) {
  // Withdrawing under the queue lock keeps the worker from picking the folder
  // up while it is being removed
  if (!queue_.withdraw(folder)) {
    CAPSULE_LOG_WARN("Refusing to delete the recording being uploaded" << kv("folder", folder));
    return false;
  }
  struct RestoreOnExit {
    UploadQueue& queue;
    const std::string& folder;
    ~RestoreOnExit() {
      queue.restore(folder);
    }
  } restore_on_exit{queue_, folder};

  auto recording = lifecycle_.from_path(folder);
  if (!recording) {
    CAPSULE_LOG_WARN("No recording to delete" << kv("folder", folder));
    return false;
  }
  return lifecycle_.delete_recording(*recording, client_);
}

}  // namespace uploader
}  // namespace capsule

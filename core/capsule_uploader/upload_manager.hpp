// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CAPSULE_UPLOAD_MANAGER_HPP
#define CAPSULE_UPLOAD_MANAGER_HPP

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "progress_sender.hpp"
#include "recording_lifecycle.hpp"
#include "remote_upload_client.hpp"
#include "upload_orchestrator.hpp"
#include "upload_queue.hpp"

namespace capsule {
namespace uploader {

enum class UploadEventType {
  STARTED,         // a recording began uploading
  SUCCEEDED,       // recording is now Uploaded
  SERVER_INVALID,  // server rejected the content
  PAUSED,          // recording is Paused and resumable
  FAILED,          // attempt failed; see message and network_error
  BATCH_FINISHED   // no more recordings will be processed in this batch
};

inline std::string uploadEventTypeToString(UploadEventType type) {
  switch (type) {
    case UploadEventType::STARTED:
      return "started";
    case UploadEventType::SUCCEEDED:
      return "succeeded";
    case UploadEventType::SERVER_INVALID:
      return "server_invalid";
    case UploadEventType::PAUSED:
      return "paused";
    case UploadEventType::FAILED:
      return "failed";
    case UploadEventType::BATCH_FINISHED:
      return "batch_finished";
  }
  return "unknown";
}

struct UploadEvent {
  UploadEventType type;
  std::string folder;
  std::string message;
  bool network_error = false;
};

using UploadEventCallback = std::function<void(const UploadEvent&)>;

struct UploadManagerConfig {
  std::string recordings_directory;
  bool delete_uploaded = false;
};

/**
 * Statistics of the last batch
 */
struct BatchStats {
  size_t queued = 0;
  size_t succeeded = 0;
  size_t server_invalid = 0;
  size_t failed = 0;
  bool paused = false;
};

/**
 * Runs uploads one recording at a time on a single background thread.
 *
 * Usage:
 *   UploadManager manager(config, orchestrator, lifecycle, client);
 *   manager.set_event_callback(...);
 *   manager.upload_all();   // returns immediately
 *   ...
 *   manager.pause();        // takes effect at the next chunk boundary
 *   manager.wait();
 */
class UploadManager {
public:
  UploadManager(
    const UploadManagerConfig& config, UploadOrchestrator& orchestrator,
    const RecordingLifecycle& lifecycle, IRemoteUploadClient& client
  );
  ~UploadManager();

  // Non-copyable, non-movable
  UploadManager(const UploadManager&) = delete;
  UploadManager& operator=(const UploadManager&) = delete;
  UploadManager(UploadManager&&) = delete;
  UploadManager& operator=(UploadManager&&) = delete;

  /**
   * Start a batch on the worker thread
   *
   * @return false if a batch is already running
   */
  bool upload_all();

  /**
   * Run a batch on the calling thread
   */
  BatchStats run_batch();

  /**
   * Ask the running batch to stop at the next chunk boundary
   */
  void pause();

  bool is_paused() const {
    return pause_flag_.load();
  }

  bool is_running() const {
    return running_.load();
  }

  /**
   * Block until the worker thread has finished its batch
   */
  void wait();

  /**
   * Delete a recording folder. Refused while it is being uploaded.
   */
  bool delete_recording(const std::string& folder);

  void set_event_callback(UploadEventCallback callback);
  void set_progress_callback(ProgressCallback callback);

  BatchStats last_batch() const;

  const UploadQueue& queue() const {
    return queue_;
  }

private:
  BatchStats process_batch();
  void process_recording(const std::string& folder, size_t files_remaining, BatchStats& stats);
  void emit(const UploadEvent& event);

  UploadManagerConfig config_;
  UploadOrchestrator& orchestrator_;
  const RecordingLifecycle& lifecycle_;
  IRemoteUploadClient& client_;

  UploadQueue queue_;
  std::atomic<bool> pause_flag_{false};
  std::atomic<bool> running_{false};
  std::thread worker_;

  mutable std::mutex callback_mutex_;
  UploadEventCallback event_callback_;
  ProgressCallback progress_callback_;
  BatchStats last_batch_;
};

}  // namespace uploader
}  // namespace capsule

#endif  // CAPSULE_UPLOAD_MANAGER_HPP

// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CAPSULE_PROGRESS_SENDER_HPP
#define CAPSULE_PROGRESS_SENDER_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace capsule {
namespace uploader {

/**
 * Which recording is being uploaded and how many are still queued behind it
 */
struct FileProgress {
  std::string current_file;
  uint64_t files_remaining = 0;
};

/**
 * Read-only progress snapshot handed to observers
 */
struct ProgressData {
  uint64_t bytes_uploaded = 0;
  uint64_t total_bytes = 0;
  double speed_mbps = 0.0;  // MiB/s since the sender was created
  double eta_seconds = 0.0;
  double percent = 0.0;  // capped at 100
  FileProgress file_progress;
};

using ProgressCallback = std::function<void(const ProgressData&)>;

/**
 * Running byte counter for one archive, publishing snapshots at most once
 * per kMinInterval.
 *
 * Not thread-safe; it is owned by the thread running the upload.
 */
class ProgressSender {
public:
  using Clock = std::chrono::steady_clock;
  using ClockFunction = std::function<Clock::time_point()>;

  static constexpr std::chrono::milliseconds kMinInterval{100};

  /**
   * @param initial_bytes Bytes already on the server when this sender starts
   *                      (a resumed upload). Excluded from the speed estimate.
   */
  ProgressSender(
    ProgressCallback callback, uint64_t total_bytes, uint64_t initial_bytes = 0,
    FileProgress file_progress = FileProgress(), ClockFunction clock = ClockFunction()
  );

  void set_bytes_uploaded(uint64_t bytes);
  void increment_bytes_uploaded(uint64_t bytes);

  uint64_t bytes_uploaded() const {
    return bytes_uploaded_;
  }

  /**
   * Publish a snapshot unless one went out less than kMinInterval ago
   */
  void send();

  /**
   * Publish a snapshot regardless of the throttle
   */
  void send_now();

  ProgressData snapshot() const;

private:
  Clock::time_point now() const;

  ProgressCallback callback_;
  ClockFunction clock_;
  uint64_t total_bytes_;
  uint64_t initial_bytes_;
  uint64_t bytes_uploaded_;
  FileProgress file_progress_;
  Clock::time_point start_time_;
  std::optional<Clock::time_point> last_sent_;
};

}  // namespace uploader
}  // namespace capsule

#endif  // CAPSULE_PROGRESS_SENDER_HPP

// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "progress_sender.hpp"

#include <algorithm>
#include <utility>

namespace capsule {
namespace uploader {

ProgressSender::ProgressSender(
  ProgressCallback callback, uint64_t total_bytes, uint64_t initial_bytes,
  FileProgress file_progress, ClockFunction clock
)
    : callback_(std::move(callback))
    , clock_(std::move(clock))
    , total_bytes_(total_bytes)
    , initial_bytes_(initial_bytes)
    , bytes_uploaded_(initial_bytes)
    , file_progress_(std::move(file_progress)) {
  start_time_ = now();
}

ProgressSender::Clock::time_point ProgressSender::now() const {
  return clock_ ? clock_() : Clock::now();
}

void ProgressSender::set_bytes_uploaded(uint64_t bytes) {
  bytes_uploaded_ = bytes;
  send();
}

void ProgressSender::increment_bytes_uploaded(uint64_t bytes) {
  set_bytes_uploaded(bytes_uploaded_ + bytes);
}

void ProgressSender::send() {
  const auto current = now();
  if (last_sent_ && current - *last_sent_ < kMinInterval) {
    return;
  }
  last_sent_ = current;
  if (callback_) {
    callback_(snapshot());
  }
}

void ProgressSender::send_now() {
  last_sent_ = now();
  if (callback_) {
    callback_(snapshot());
  }
}

ProgressData ProgressSender::snapshot() const {
  ProgressData data;
  data.bytes_uploaded = bytes_uploaded_;
  data.total_bytes = total_bytes_;
  data.file_progress = file_progress_;

  const double elapsed = std::chrono::duration<double>(now() - start_time_).count();
  const uint64_t transferred = bytes_uploaded_ > initial_bytes_ ? bytes_uploaded_ - initial_bytes_ : 0;
  const double bytes_per_second = elapsed > 0.0 ? static_cast<double>(transferred) / elapsed : 0.0;

  data.speed_mbps = bytes_per_second / (1024.0 * 1024.0);
  if (bytes_per_second > 0.0 && total_bytes_ > bytes_uploaded_) {
    data.eta_seconds = static_cast<double>(total_bytes_ - bytes_uploaded_) / bytes_per_second;
  }
  if (total_bytes_ > 0) {
    data.percent = std::min(
      100.0, static_cast<double>(bytes_uploaded_) / static_cast<double>(total_bytes_) * 100.0
    );
  }
  return data;
}

}  // namespace uploader
}  // namespace capsule

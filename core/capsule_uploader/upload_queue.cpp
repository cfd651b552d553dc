// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_queue.hpp"

#include <algorithm>

#define CAPSULE_LOG_COMPONENT "upload_queue"
#include <capsule_log_macros.hpp>

namespace capsule {
namespace uploader {

using capsule::logging::kv;

bool UploadQueue::enqueue(const std::string& folder) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (current_ == folder || std::find(pending_.begin(), pending_.end(), folder) != pending_.end()) {
    CAPSULE_LOG_DEBUG("Recording already queued" << kv("folder", folder));
    return false;
  }
  if (withdrawn_.count(folder) > 0) {
    CAPSULE_LOG_DEBUG("Recording is being deleted" << kv("folder", folder));
    return false;
  }
  pending_.push_back(folder);
  CAPSULE_LOG_INFO("Queued recording for upload" << kv("folder", folder));
  return true;
}

std::optional<std::string> UploadQueue::dequeue() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (pending_.empty()) {
    return std::nullopt;
  }
  current_ = std::move(pending_.front());
  pending_.pop_front();
  return current_;
}

void UploadQueue::complete_current() {
  std::lock_guard<std::mutex> lock(mutex_);
  current_.reset();
}

void UploadQueue::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!pending_.empty()) {
    CAPSULE_LOG_INFO("Cleared pending uploads" << kv("count", pending_.size()));
  }
  pending_.clear();
}

void UploadQueue::clear_all() {
  std::lock_guard<std::mutex> lock(mutex_);
  CAPSULE_LOG_INFO("Cleared all uploads" << kv("pending", pending_.size()));
  pending_.clear();
  current_.reset();
}

bool UploadQueue::is_empty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.empty() && !current_;
}

size_t UploadQueue::pending_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

std::optional<std::string> UploadQueue::current() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_;
}

bool UploadQueue::withdraw(const std::string& folder) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (current_ == folder) {
    return false;
  }
  pending_.erase(std::remove(pending_.begin(), pending_.end(), folder), pending_.end());
  withdrawn_.insert(folder);
  return true;
}

void UploadQueue::restore(const std::string& folder) {
  std::lock_guard<std::mutex> lock(mutex_);
  withdrawn_.erase(folder);
}

}  // namespace uploader
}  // namespace capsule

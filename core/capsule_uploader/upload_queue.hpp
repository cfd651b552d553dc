// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CAPSULE_UPLOAD_QUEUE_HPP
#define CAPSULE_UPLOAD_QUEUE_HPP

#include <deque>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace capsule {
namespace uploader {

/**
 * Thread-safe FIFO of recording folders waiting for upload
 *
 * The folder handed out by dequeue() becomes "current" until
 * complete_current() or clear_all(). A folder that is pending or current is
 * never queued twice.
 */
class UploadQueue {
public:
  UploadQueue() = default;

  // Non-copyable, non-movable
  UploadQueue(const UploadQueue&) = delete;
  UploadQueue& operator=(const UploadQueue&) = delete;
  UploadQueue(UploadQueue&&) = delete;
  UploadQueue& operator=(UploadQueue&&) = delete;

  /**
   * @return false if the folder is already pending or current
   */
  bool enqueue(const std::string& folder);

  /**
   * Pop the oldest pending folder and make it current
   */
  std::optional<std::string> dequeue();

  void complete_current();

  /**
   * Drop pending folders; the current one stays
   */
  void clear();

  /**
   * Drop pending folders and forget the current one
   */
  void clear_all();

  /**
   * True when nothing is pending and nothing is current
   */
  bool is_empty() const;

  size_t pending_count() const;

  std::optional<std::string> current() const;

  /**
   * Take a folder out of the queue so it can be deleted. Until restore() the
   * folder is refused by enqueue().
   *
   * @return false if the folder is current (being uploaded)
   */
  bool withdraw(const std::string& folder);

  void restore(const std::string& folder);

private:
  mutable std::mutex mutex_;
  std::deque<std::string> pending_;
  std::optional<std::string> current_;
  std::set<std::string> withdrawn_;
};

}  // namespace uploader
}  // namespace capsule

#endif  // CAPSULE_UPLOAD_QUEUE_HPP

// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CAPSULE_CHUNK_UPLOADER_HPP
#define CAPSULE_CHUNK_UPLOADER_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include "http_transport.hpp"
#include "progress_sender.hpp"
#include "remote_upload_client.hpp"
#include "retry_handler.hpp"
#include "upload_progress_store.hpp"

namespace capsule {
namespace uploader {

using SleepFunction = std::function<void(std::chrono::milliseconds)>;

/**
 * Bytes of one chunk plus what the server needs to know about it
 */
struct ChunkPayload {
  uint64_t chunk_number = 0;
  uint64_t total_chunks = 0;
  const char* data = nullptr;
  size_t size = 0;
  std::string sha256;
};

/**
 * Transfers one chunk: signed URL, PUT, ETag.
 *
 * Every failed attempt is retried until RetryConfig::max_attempts is reached.
 * Before each attempt the progress counter goes back to the value it had when
 * the chunk started, so bytes of failed attempts are never counted twice.
 */
class ChunkUploader {
public:
  ChunkUploader(
    IRemoteUploadClient& client, IHttpTransport& transport,
    const RetryConfig& retry_config = RetryConfig(), SleepFunction sleep = SleepFunction()
  );

  ChunkUploader(const ChunkUploader&) = delete;
  ChunkUploader& operator=(const ChunkUploader&) = delete;

  /**
   * @return The acknowledged chunk
   * @throws UploadError(CHUNK_UPLOAD_FAILED) once all attempts failed
   */
  ChunkRecord uploadChunk(
    const std::string& upload_id, const ChunkPayload& chunk, ProgressSender& progress
  );

  /**
   * ETag header value with surrounding double quotes removed
   */
  static std::string normalizeEtag(const std::string& raw);

private:
  std::string attemptUpload(
    const std::string& upload_id, const ChunkPayload& chunk, ProgressSender& progress,
    uint64_t bytes_before_chunk
  );

  IRemoteUploadClient& client_;
  IHttpTransport& transport_;
  RetryHandler retry_;
  SleepFunction sleep_;
};

}  // namespace uploader
}  // namespace capsule

#endif  // CAPSULE_CHUNK_UPLOADER_HPP

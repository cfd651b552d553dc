// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "chunk_uploader.hpp"

#include <optional>
#include <thread>
#include <utility>

#include "upload_error.hpp"

#define CAPSULE_LOG_COMPONENT "chunk_uploader"
#include <capsule_log_macros.hpp>

namespace capsule {
namespace uploader {

using capsule::logging::kv;

ChunkUploader::ChunkUploader(
  IRemoteUploadClient& client, IHttpTransport& transport, const RetryConfig& retry_config,
  SleepFunction sleep
)
    : client_(client)
    , transport_(transport)
    , retry_(retry_config)
    , sleep_(std::move(sleep)) {
  if (!sleep_) {
    sleep_ = [](std::chrono::milliseconds delay) {
      std::this_thread::sleep_for(delay);
    };
  }
}

std::string ChunkUploader::normalizeEtag(const std::string& raw) {
  const auto first = raw.find_first_not_of('"');
  if (first == std::string::npos) {
    return "";
  }
  const auto last = raw.find_last_not_of('"');
  return raw.substr(first, last - first + 1);
}

std::string ChunkUploader::attemptUpload(
  const std::string& upload_id, const ChunkPayload& chunk, ProgressSender& progress,
  uint64_t bytes_before_chunk
) {
  progress.set_bytes_uploaded(bytes_before_chunk);

  auto signed_url = client_.request_chunk_url(upload_id, chunk.chunk_number, chunk.sha256);

  auto response = transport_.put(
    signed_url.upload_url, chunk.data, chunk.size, "application/octet-stream",
    [&progress, bytes_before_chunk](uint64_t sent) {
      progress.set_bytes_uploaded(bytes_before_chunk + sent);
    }
  );

  if (response.status_code == 0) {
    throw UploadError::api("Chunk PUT failed: " + response.error_message,
                           response.is_network_error);
  }
  if (!response.success) {
    throw UploadError::api(
      "Chunk upload failed with status " + std::to_string(response.status_code), false
    );
  }

  std::string etag = normalizeEtag(response.header("etag"));
  if (etag.empty()) {
    throw UploadError::api("No ETag header found after chunk upload", false);
  }
  return etag;
}

ChunkRecord ChunkUploader::uploadChunk(
  const std::string& upload_id, const ChunkPayload& chunk, ProgressSender& progress
) {
  const uint64_t bytes_before_chunk = progress.bytes_uploaded();
  std::optional<UploadError> last_error;

  for (int attempt = 1; attempt <= retry_.maxAttempts(); ++attempt) {
    try {
      std::string etag = attemptUpload(upload_id, chunk, progress, bytes_before_chunk);
      progress.send_now();
      if (attempt > 1) {
        CAPSULE_LOG_INFO("Chunk succeeded after retry" << kv("chunk", chunk.chunk_number)
                                                       << kv("attempt", attempt));
      }
      return ChunkRecord{chunk.chunk_number, etag};
    } catch (const UploadError& e) {
      last_error = e;
      if (!retry_.shouldRetry(attempt)) {
        break;
      }
      const auto delay = retry_.getDelay(attempt);
      CAPSULE_LOG_WARN(
        "Failed to upload chunk, retrying" << kv("chunk", chunk.chunk_number)
                                           << kv("total", chunk.total_chunks)
                                           << kv("attempt", attempt)
                                           << kv("delay_ms", delay.count())
                                           << kv("network", e.is_network_error())
                                           << kv("error", e.what())
      );
      sleep_(delay);
    }
  }

  progress.set_bytes_uploaded(bytes_before_chunk);

  if (!last_error) {
    throw UploadError::validation("chunk retry budget is zero");
  }
  auto error = UploadError::chunkUploadFailed(
    chunk.chunk_number, chunk.total_chunks, retry_.maxAttempts(), *last_error
  );
  CAPSULE_LOG_ERROR(error.what());
  throw error;
}

}  // namespace uploader
}  // namespace capsule

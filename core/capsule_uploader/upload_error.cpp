// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_error.hpp"

namespace capsule {
namespace uploader {

UploadError::UploadError(UploadErrorKind kind, const std::string& message, bool network)
    : std::runtime_error(message)
    , kind_(kind)
    , network_(network) {}

UploadError UploadError::io(const std::string& message) {
  return UploadError(UploadErrorKind::IO, "I/O error: " + message);
}

UploadError UploadError::serialization(const std::string& message) {
  return UploadError(UploadErrorKind::SERIALIZATION, "Serialization error: " + message);
}

UploadError UploadError::api(const std::string& message, bool network) {
  return UploadError(
    network ? UploadErrorKind::API_NETWORK : UploadErrorKind::API_APPLICATION, message, network
  );
}

UploadError UploadError::serverInvalidation(const std::string& reason) {
  return UploadError(UploadErrorKind::SERVER_INVALIDATION, reason);
}

UploadError UploadError::sessionExpired(
  const std::string& upload_id, int64_t client_time, int64_t expires_at
) {
  return UploadError(
    UploadErrorKind::SESSION_EXPIRED,
    "Upload session expired: " + upload_id + " (client_time=" + std::to_string(client_time) +
      ", expires_at=" + std::to_string(expires_at) + ")"
  );
}

UploadError UploadError::completionFailed(const std::string& server_message) {
  return UploadError(
    UploadErrorKind::COMPLETION_FAILED, "Failed to complete multipart upload: " + server_message
  );
}

UploadError UploadError::validation(const std::string& message) {
  return UploadError(UploadErrorKind::VALIDATION, message);
}

UploadError UploadError::chunkUploadFailed(
  uint64_t chunk_number, uint64_t total_chunks, int attempts, const UploadError& last
) {
  UploadError error(
    UploadErrorKind::CHUNK_UPLOAD_FAILED,
    "Failed to upload chunk " + std::to_string(chunk_number) + "/" +
      std::to_string(total_chunks) + " after " + std::to_string(attempts) +
      " attempts: " + last.what(),
    last.is_network_error()
  );
  error.chunk_number_ = chunk_number;
  error.total_chunks_ = total_chunks;
  error.attempts_ = attempts;
  return error;
}

}  // namespace uploader
}  // namespace capsule

// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CAPSULE_UPLOAD_ERROR_HPP
#define CAPSULE_UPLOAD_ERROR_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace capsule {
namespace uploader {

/**
 * Failure classes of the upload pipeline
 */
enum class UploadErrorKind {
  IO,                   // Local filesystem
  SERIALIZATION,        // Progress file or API payload could not be (de)serialized
  API_NETWORK,          // Remote call never got an answer (resolve/connect/timeout)
  API_APPLICATION,      // Remote call answered with a non-2xx status or bad body
  SERVER_INVALIDATION,  // Server accepted the round-trip and rejected the content
  SESSION_EXPIRED,      // Client clock crossed the session's expires_at
  CHUNK_UPLOAD_FAILED,  // Per-chunk retries exhausted
  COMPLETION_FAILED,    // complete answered success=false
  VALIDATION            // Recording or configuration failed a precondition
};

inline std::string uploadErrorKindToString(UploadErrorKind kind) {
  switch (kind) {
    case UploadErrorKind::IO:
      return "io";
    case UploadErrorKind::SERIALIZATION:
      return "serialization";
    case UploadErrorKind::API_NETWORK:
      return "api_network";
    case UploadErrorKind::API_APPLICATION:
      return "api_application";
    case UploadErrorKind::SERVER_INVALIDATION:
      return "server_invalidation";
    case UploadErrorKind::SESSION_EXPIRED:
      return "session_expired";
    case UploadErrorKind::CHUNK_UPLOAD_FAILED:
      return "chunk_upload_failed";
    case UploadErrorKind::COMPLETION_FAILED:
      return "completion_failed";
    case UploadErrorKind::VALIDATION:
      return "validation";
  }
  return "unknown";
}

/**
 * Exception type thrown across the upload pipeline.
 *
 * is_network_error() tells a UI whether to suggest checking the connection
 * (true) or to report a server/logic problem (false).
 */
class UploadError : public std::runtime_error {
public:
  UploadError(UploadErrorKind kind, const std::string& message, bool network = false);

  static UploadError io(const std::string& message);
  static UploadError serialization(const std::string& message);
  static UploadError api(const std::string& message, bool network);
  static UploadError serverInvalidation(const std::string& reason);
  static UploadError sessionExpired(
    const std::string& upload_id, int64_t client_time, int64_t expires_at
  );
  static UploadError completionFailed(const std::string& server_message);
  static UploadError validation(const std::string& message);

  /**
   * Wrap the last per-attempt error once all chunk attempts are spent.
   * The network flag of the last error is carried over.
   */
  static UploadError chunkUploadFailed(
    uint64_t chunk_number, uint64_t total_chunks, int attempts, const UploadError& last
  );

  UploadErrorKind kind() const noexcept {
    return kind_;
  }

  bool is_network_error() const noexcept {
    return network_;
  }

  uint64_t chunk_number() const noexcept {
    return chunk_number_;
  }

  uint64_t total_chunks() const noexcept {
    return total_chunks_;
  }

  int attempts() const noexcept {
    return attempts_;
  }

private:
  UploadErrorKind kind_;
  bool network_;
  uint64_t chunk_number_ = 0;
  uint64_t total_chunks_ = 0;
  int attempts_ = 0;
};

}  // namespace uploader
}  // namespace capsule

#endif  // CAPSULE_UPLOAD_ERROR_HPP

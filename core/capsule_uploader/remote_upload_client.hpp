// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CAPSULE_REMOTE_UPLOAD_CLIENT_HPP
#define CAPSULE_REMOTE_UPLOAD_CLIENT_HPP

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "http_transport.hpp"
#include "upload_progress_store.hpp"

namespace capsule {
namespace uploader {

/**
 * Body of the multipart init call
 */
struct InitUploadRequest {
  std::string filename;  // archive file name, no directory
  uint64_t total_size_bytes = 0;
  std::optional<uint64_t> chunk_size_bytes;  // hint; server decides
  std::vector<std::string> tags;
  std::string video_filename;
  std::string control_filename;
  double video_duration_seconds = 0.0;
  uint32_t video_width = 1280;
  uint32_t video_height = 720;
  double video_fps = 60.0;
  std::optional<std::string> video_codec;
  nlohmann::json additional_metadata;
  std::string uploader_hwid;
  std::string upload_timestamp;  // RFC 3339

  nlohmann::json to_json() const;
};

struct InitUploadResponse {
  std::string upload_id;
  std::string content_id;
  uint64_t total_chunks = 0;
  uint64_t chunk_size_bytes = 0;
  int64_t expires_at = 0;
};

struct ChunkUrlResponse {
  std::string upload_url;
  uint64_t chunk_number = 0;
  int64_t expires_at = 0;
};

struct CompleteUploadResponse {
  bool success = false;
  std::string content_id;
  std::string object_key;
  std::string message;
  std::optional<bool> verified;
};

/**
 * The four operations of the multipart upload API.
 *
 * Failures throw UploadError: API_NETWORK / API_APPLICATION for transport and
 * status problems, SERIALIZATION for unreadable bodies, and
 * SERVER_INVALIDATION when complete rejects the finished content.
 */
class IRemoteUploadClient {
public:
  virtual ~IRemoteUploadClient() = default;

  virtual InitUploadResponse init_upload(const InitUploadRequest& request) = 0;

  virtual ChunkUrlResponse request_chunk_url(
    const std::string& upload_id, uint64_t chunk_number, const std::string& chunk_hash
  ) = 0;

  virtual CompleteUploadResponse complete_upload(
    const std::string& upload_id, const std::vector<ChunkRecord>& chunks
  ) = 0;

  virtual void abort_upload(const std::string& upload_id) = 0;
};

/**
 * Abort a server session, logging instead of throwing on failure
 */
void abort_upload_best_effort(IRemoteUploadClient& client, const std::string& upload_id);

class RemoteUploadClient : public IRemoteUploadClient {
public:
  static constexpr const char* kMultipartPath = "/tracker/upload/game_control/multipart";

  RemoteUploadClient(const std::string& base_url, const std::string& api_key,
                     IHttpTransport& transport);

  RemoteUploadClient(const RemoteUploadClient&) = delete;
  RemoteUploadClient& operator=(const RemoteUploadClient&) = delete;

  InitUploadResponse init_upload(const InitUploadRequest& request) override;

  ChunkUrlResponse request_chunk_url(
    const std::string& upload_id, uint64_t chunk_number, const std::string& chunk_hash
  ) override;

  CompleteUploadResponse complete_upload(
    const std::string& upload_id, const std::vector<ChunkRecord>& chunks
  ) override;

  void abort_upload(const std::string& upload_id) override;

  const std::string& base_url() const {
    return base_url_;
  }

private:
  std::string endpoint(const std::string& suffix) const;
  HttpHeaders auth_headers() const;

  /**
   * Throw for a transport failure or non-2xx status, else parse the body.
   * An empty body parses to null.
   */
  nlohmann::json check_response(const HttpResponse& response, const std::string& context) const;

  std::string base_url_;
  std::string api_key_;
  IHttpTransport& transport_;
};

}  // namespace uploader
}  // namespace capsule

#endif  // CAPSULE_REMOTE_UPLOAD_CLIENT_HPP

// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "remote_upload_client.hpp"

#include "upload_error.hpp"

#define CAPSULE_LOG_COMPONENT "remote_api"
#include <capsule_log_macros.hpp>

namespace capsule {
namespace uploader {

using capsule::logging::kv;

namespace {

constexpr int kStatusUnprocessableEntity = 422;

// "detail" is the error field of the API's error bodies
std::string error_detail(const std::string& body) {
  auto j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_object()) {
    auto it = j.find("detail");
    if (it != j.end() && it->is_string()) {
      return it->get<std::string>();
    }
    it = j.find("message");
    if (it != j.end() && it->is_string()) {
      return it->get<std::string>();
    }
  }
  return "unknown error";
}

}  // namespace

nlohmann::json InitUploadRequest::to_json() const {
  nlohmann::json j{
    {"filename", filename},
    {"content_type", "application/x-tar"},
    {"total_size_bytes", total_size_bytes},
    {"video_filename", video_filename},
    {"control_filename", control_filename},
    {"video_duration_seconds", video_duration_seconds},
    {"video_width", video_width},
    {"video_height", video_height},
    {"video_fps", video_fps},
    {"uploader_hwid", uploader_hwid},
    {"upload_timestamp", upload_timestamp},
  };
  if (chunk_size_bytes) {
    j["chunk_size_bytes"] = *chunk_size_bytes;
  }
  if (!tags.empty()) {
    j["tags"] = tags;
  }
  if (video_codec) {
    j["video_codec"] = *video_codec;
  }
  if (!additional_metadata.is_null()) {
    j["additional_metadata"] = additional_metadata;
  }
  return j;
}

void abort_upload_best_effort(IRemoteUploadClient& client, const std::string& upload_id) {
  try {
    client.abort_upload(upload_id);
    CAPSULE_LOG_INFO("Aborted upload session" << kv("upload_id", upload_id));
  } catch (const std::exception& e) {
    CAPSULE_LOG_WARN(
      "Abort of upload session failed" << kv("upload_id", upload_id) << kv("error", e.what())
    );
  }
}

RemoteUploadClient::RemoteUploadClient(
  const std::string& base_url, const std::string& api_key, IHttpTransport& transport
)
    : base_url_(base_url)
    , api_key_(api_key)
    , transport_(transport) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

std::string RemoteUploadClient::endpoint(const std::string& suffix) const {
  return base_url_ + kMultipartPath + suffix;
}

HttpHeaders RemoteUploadClient::auth_headers() const {
  return {{"X-API-Key", api_key_}};
}

nlohmann::json RemoteUploadClient::check_response(
  const HttpResponse& response, const std::string& context
) const {
  if (response.status_code == 0) {
    throw UploadError::api(context + ": " + response.error_message, response.is_network_error);
  }
  if (!response.success) {
    throw UploadError::api(
      context + " (" + std::to_string(response.status_code) + ": " +
        error_detail(response.body) + ")",
      false
    );
  }
  if (response.body.empty()) {
    return nullptr;
  }
  try {
    return nlohmann::json::parse(response.body);
  } catch (const nlohmann::json::exception& e) {
    throw UploadError::serialization(context + ": unreadable response body: " + e.what());
  }
}

InitUploadResponse RemoteUploadClient::init_upload(const InitUploadRequest& request) {
  const std::string context = "Multipart upload initialization failed";
  auto response =
    transport_.post_json(endpoint("/init"), request.to_json().dump(), auth_headers());
  auto j = check_response(response, context);

  InitUploadResponse result;
  try {
    result.upload_id = j.at("upload_id").get<std::string>();
    result.content_id = j.at("content_id").get<std::string>();
    result.total_chunks = j.at("total_chunks").get<uint64_t>();
    result.chunk_size_bytes = j.at("chunk_size_bytes").get<uint64_t>();
    result.expires_at = j.at("expires_at").get<int64_t>();
  } catch (const nlohmann::json::exception& e) {
    throw UploadError::serialization(context + ": " + e.what());
  }
  if (result.total_chunks == 0 || result.chunk_size_bytes == 0) {
    throw UploadError::api(context + ": server returned an empty session", false);
  }

  CAPSULE_LOG_INFO(
    "Upload session created" << kv("upload_id", result.upload_id)
                             << kv("content_id", result.content_id)
                             << kv("total_chunks", result.total_chunks)
                             << kv("chunk_size", result.chunk_size_bytes)
                             << kv("expires_at", result.expires_at)
  );
  return result;
}

ChunkUrlResponse RemoteUploadClient::request_chunk_url(
  const std::string& upload_id, uint64_t chunk_number, const std::string& chunk_hash
) {
  const std::string context = "Upload multipart chunk request failed";
  nlohmann::json body{
    {"upload_id", upload_id},
    {"chunk_number", chunk_number},
    {"chunk_hash", chunk_hash},
  };
  auto j = check_response(
    transport_.post_json(endpoint("/chunk"), body.dump(), auth_headers()), context
  );

  ChunkUrlResponse result;
  try {
    result.upload_url = j.at("upload_url").get<std::string>();
    result.chunk_number = j.at("chunk_number").get<uint64_t>();
    result.expires_at = j.at("expires_at").get<int64_t>();
  } catch (const nlohmann::json::exception& e) {
    throw UploadError::serialization(context + ": " + e.what());
  }
  return result;
}

CompleteUploadResponse RemoteUploadClient::complete_upload(
  const std::string& upload_id, const std::vector<ChunkRecord>& chunks
) {
  const std::string context = "Complete multipart upload request failed";
  nlohmann::json etags = nlohmann::json::array();
  for (const auto& chunk : chunks) {
    etags.push_back({{"chunk_number", chunk.chunk_number}, {"etag", chunk.etag}});
  }
  nlohmann::json body{{"upload_id", upload_id}, {"chunk_etags", etags}};

  auto response = transport_.post_json(endpoint("/complete"), body.dump(), auth_headers());
  if (response.status_code == kStatusUnprocessableEntity) {
    throw UploadError::serverInvalidation(error_detail(response.body));
  }
  auto j = check_response(response, context);

  if (j.is_object()) {
    auto invalidated = j.find("invalidated");
    if (invalidated != j.end() && invalidated->is_boolean() && invalidated->get<bool>()) {
      throw UploadError::serverInvalidation(error_detail(response.body));
    }
  }

  CompleteUploadResponse result;
  try {
    result.success = j.at("success").get<bool>();
    result.content_id = j.value("content_id", std::string());
    result.object_key = j.value("object_key", std::string());
    result.message = j.value("message", std::string());
    auto verified = j.find("verified");
    if (verified != j.end() && verified->is_boolean()) {
      result.verified = verified->get<bool>();
    }
  } catch (const nlohmann::json::exception& e) {
    throw UploadError::serialization(context + ": " + e.what());
  }
  return result;
}

void RemoteUploadClient::abort_upload(const std::string& upload_id) {
  check_response(
    transport_.delete_request(endpoint("/abort/" + upload_id), auth_headers()),
    "Abort multipart upload request failed"
  );
}

}  // namespace uploader
}  // namespace capsule

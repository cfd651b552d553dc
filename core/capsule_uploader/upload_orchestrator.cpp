// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_orchestrator.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <utility>
#include <vector>

#include "archive_builder.hpp"
#include "digest.hpp"
#include "upload_error.hpp"
#include "upload_progress_store.hpp"

#define CAPSULE_LOG_COMPONENT "orchestrator"
#include <capsule_log_macros.hpp>

namespace capsule {
namespace uploader {

using capsule::logging::kv;

namespace {

std::string join_reasons(const std::vector<std::string>& reasons) {
  std::string joined;
  for (const auto& reason : reasons) {
    if (!joined.empty()) {
      joined += "; ";
    }
    joined += reason;
  }
  return joined;
}

bool is_resumable(const UploadError& e) {
  return e.kind() == UploadErrorKind::SESSION_EXPIRED ||
         e.kind() == UploadErrorKind::CHUNK_UPLOAD_FAILED;
}

}  // namespace

// ============================================================================
// AbortUploadGuard
// ============================================================================

AbortUploadGuard::~AbortUploadGuard() {
  if (!armed_) {
    return;
  }
  CAPSULE_LOG_INFO(
    "Aborting upload after unexpected failure"
    << kv("upload_id", recording_.progress.session.upload_id)
    << kv("folder", recording_.info.folder_path)
  );
  try {
    lifecycle_.abort_and_cleanup(client_, recording_);
  } catch (const std::exception& e) {
    CAPSULE_LOG_ERROR("Upload abort cleanup failed" << kv("error", e.what()));
  }
}

// ============================================================================
// UploadOrchestrator
// ============================================================================

UploadOrchestrator::UploadOrchestrator(
  IRemoteUploadClient& client, ChunkUploader& chunk_uploader, const RecordingLifecycle& lifecycle,
  IFileStreamFactory& streams, const IFileSystem& fs, const OrchestratorConfig& config,
  HardwareIdProvider hardware_id, UnixClock clock
)
    : client_(client)
    , chunk_uploader_(chunk_uploader)
    , lifecycle_(lifecycle)
    , streams_(streams)
    , fs_(fs)
    , config_(config)
    , hardware_id_(std::move(hardware_id))
    , clock_(std::move(clock)) {}

int64_t UploadOrchestrator::now() const {
  if (clock_) {
    return clock_();
  }
  return std::chrono::duration_cast<std::chrono::seconds>(
           std::chrono::system_clock::now().time_since_epoch()
  )
    .count();
}

std::string UploadOrchestrator::format_rfc3339(int64_t unix_seconds) {
  std::time_t time = static_cast<std::time_t>(unix_seconds);
  std::tm tm{};
  gmtime_r(&time, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

std::optional<PausedRecording> UploadOrchestrator::validate_resume(const PausedRecording& paused) {
  const auto& progress = paused.progress;
  const auto& folder = paused.info.folder_path;
  const int64_t current = now();
  const int64_t seconds_left = progress.seconds_until_expiration(current);
  const bool tar_present = fs_.is_file(progress.tar_path);

  if (tar_present && seconds_left > config_.min_resume_seconds) {
    CAPSULE_LOG_INFO(
      "Resuming upload" << kv("folder", folder) << kv("chunk", progress.next_chunk_number())
                        << kv("total", progress.session.total_chunks)
                        << kv("expires_in_s", seconds_left)
    );
    return paused;
  }

  if (!tar_present) {
    CAPSULE_LOG_WARN("Archive for paused upload is gone, starting fresh"
                     << kv("folder", folder) << kv("tar", progress.tar_path));
  }
  if (progress.is_expired(current)) {
    CAPSULE_LOG_WARN("Paused upload session has expired, starting fresh" << kv("folder", folder));
  } else if (seconds_left <= config_.min_resume_seconds) {
    CAPSULE_LOG_WARN(
      "Paused upload session has insufficient time remaining, starting fresh"
      << kv("folder", folder) << kv("seconds_left", seconds_left)
      << kv("required", config_.min_resume_seconds)
    );
  }

  lifecycle_.abort_and_cleanup(client_, paused);
  return std::nullopt;
}

PausedRecording UploadOrchestrator::start_fresh(const RecordingInfo& info) {
  const auto& folder = info.folder_path;

  CAPSULE_LOG_INFO("Validating recording" << kv("folder", folder));
  auto validation = lifecycle_.validate_artifacts(folder);
  if (!validation.ok()) {
    lifecycle_.mark_invalid(info, validation.metadata, validation.reasons);
    throw UploadError::validation(
      "Recording " + info.folder_name + " failed validation: " + join_reasons(validation.reasons)
    );
  }
  const auto& artifact = *validation.artifact;
  const auto& metadata = *validation.metadata;

  if (!hardware_id_) {
    throw UploadError::validation("no hardware id provider configured");
  }
  const std::string hardware_id = hardware_id_();

  CAPSULE_LOG_INFO("Creating archive" << kv("folder", folder));
  const std::string tar_path = ArchiveBuilder::build(folder, artifact);

  InitUploadResponse session;
  try {
    auto tar_size = fs_.file_size(tar_path);
    if (!tar_size) {
      throw UploadError::io("cannot stat archive " + tar_path);
    }

    InitUploadRequest request;
    request.filename = std::filesystem::path(tar_path).filename().string();
    request.total_size_bytes = *tar_size;
    if (config_.unreliable_connection) {
      request.chunk_size_bytes = config_.unreliable_chunk_size_bytes;
    }
    request.video_filename = kVideoFileName;
    request.control_filename = kInputsFileName;
    request.video_duration_seconds = metadata.duration;
    request.additional_metadata = metadata.document;
    request.uploader_hwid = hardware_id;
    request.upload_timestamp = format_rfc3339(now());

    session = client_.init_upload(request);
  } catch (const UploadError&) {
    fs_.remove(tar_path);
    throw;
  }

  PausedRecording paused;
  paused.info = info;
  paused.metadata = metadata;
  paused.progress.tar_path = tar_path;
  paused.progress.session.upload_id = session.upload_id;
  paused.progress.session.content_id = session.content_id;
  paused.progress.session.total_chunks = session.total_chunks;
  paused.progress.session.chunk_size_bytes = session.chunk_size_bytes;
  paused.progress.session.expires_at = session.expires_at;
  return paused;
}

UploadResult UploadOrchestrator::upload(
  const RecordingState& recording, const std::atomic<bool>& pause_flag,
  const ProgressCallback& on_progress, const FileProgress& file_progress
) {
  const auto status = recordingStatus(recording);
  if (status == RecordingStatus::UPLOADED || status == RecordingStatus::INVALID) {
    throw UploadError::validation(
      "Recording " + recordingInfo(recording).folder_name + " is " +
      recordingStatusToString(status) + " and cannot be uploaded"
    );
  }

  std::optional<PausedRecording> resumed;
  if (const auto* paused = std::get_if<PausedRecording>(&recording)) {
    resumed = validate_resume(*paused);
  }

  if (resumed) {
    return run(*resumed, false, pause_flag, on_progress, file_progress);
  }

  auto fresh = start_fresh(lifecycle_.read_info(recordingInfo(recording).folder_path));
  return run(fresh, true, pause_flag, on_progress, file_progress);
}

UploadResult UploadOrchestrator::run(
  PausedRecording& paused, bool fresh, const std::atomic<bool>& pause_flag,
  const ProgressCallback& on_progress, const FileProgress& file_progress
) {
  AbortUploadGuard guard(client_, lifecycle_, paused);

  auto& progress = paused.progress;
  const auto& session = progress.session;
  const auto& folder = paused.info.folder_path;
  CAPSULE_LOG_SCOPED_CONTEXT(paused.info.folder_name, session.upload_id);

  if (fresh) {
    UploadProgressStore::save(folder, progress);
  }

  auto tar_size = fs_.file_size(progress.tar_path);
  if (!tar_size) {
    throw UploadError::io("cannot stat archive " + progress.tar_path);
  }

  const uint64_t start_chunk = progress.next_chunk_number();
  ProgressSender sender(on_progress, *tar_size, progress.bytes_already_uploaded(), file_progress);
  sender.send_now();

  CAPSULE_LOG_INFO(
    "Starting upload" << kv("bytes", *tar_size) << kv("chunks", session.total_chunks)
                      << kv("chunk_size", session.chunk_size_bytes)
                      << kv("content_id", session.content_id) << kv("start_chunk", start_chunk)
  );

  auto stream = streams_.create_file_stream(progress.tar_path, std::ios::in | std::ios::binary);
  if (!stream) {
    throw UploadError::io("cannot open archive " + progress.tar_path);
  }
  if (start_chunk > 1) {
    const uint64_t offset = (start_chunk - 1) * session.chunk_size_bytes;
    stream->seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (stream->fail()) {
      throw UploadError::io("cannot seek archive to byte " + std::to_string(offset));
    }
    CAPSULE_LOG_INFO("Seeking archive to resume" << kv("offset", offset)
                                                 << kv("chunk", start_chunk));
  }

  std::vector<char> buffer(session.chunk_size_bytes);

  for (uint64_t chunk_number = start_chunk; chunk_number <= session.total_chunks; ++chunk_number) {
    if (pause_flag.load()) {
      // The chunk log already holds the session; it survives a failed snapshot
      guard.release();
      try {
        UploadProgressStore::save(folder, progress);
      } catch (const UploadError& e) {
        CAPSULE_LOG_ERROR("Failed to save upload progress on pause" << kv("error", e.what()));
        throw;
      }
      CAPSULE_LOG_INFO("Upload paused" << kv("next_chunk", chunk_number));
      return UploadResult{UploadOutcome::PAUSED, paused};
    }

    const int64_t current = now();
    if (progress.is_expired(current)) {
      CAPSULE_LOG_ERROR(
        "Upload session expired; if this is a fresh upload the system clock may be wrong"
        << kv("client_time", current) << kv("expires_at", session.expires_at)
        << kv("diff_s", current - session.expires_at)
      );
      guard.release();
      throw UploadError::sessionExpired(session.upload_id, current, session.expires_at);
    }
    const int64_t seconds_left = progress.seconds_until_expiration(current);
    if (seconds_left < 60 && chunk_number % 10 == 0) {
      CAPSULE_LOG_WARN("Upload session expires soon" << kv("seconds_left", seconds_left));
    }

    stream->read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const auto read = stream->gcount();
    if (stream->bad() || read <= 0) {
      throw UploadError::io(
        "cannot read chunk " + std::to_string(chunk_number) + " from " + progress.tar_path
      );
    }

    ChunkPayload payload;
    payload.chunk_number = chunk_number;
    payload.total_chunks = session.total_chunks;
    payload.data = buffer.data();
    payload.size = static_cast<size_t>(read);
    payload.sha256 = sha256_hex(payload.data, payload.size);

    CAPSULE_LOG_INFO("Uploading chunk" << kv("chunk", chunk_number)
                                       << kv("total", session.total_chunks));

    ChunkRecord record;
    try {
      record = chunk_uploader_.uploadChunk(session.upload_id, payload, sender);
    } catch (const UploadError& e) {
      if (is_resumable(e)) {
        guard.release();
      }
      throw;
    }

    progress.chunk_etags.push_back(record);
    UploadProgressStore::append_chunk(folder, record);
    CAPSULE_LOG_INFO("Uploaded chunk" << kv("chunk", chunk_number)
                                      << kv("total", session.total_chunks));
  }

  return complete(paused, guard);
}

UploadResult UploadOrchestrator::complete(PausedRecording& paused, AbortUploadGuard& guard) {
  const auto& session = paused.progress.session;

  CompleteUploadResponse response;
  try {
    response = client_.complete_upload(session.upload_id, paused.progress.chunk_etags);
  } catch (const UploadError& e) {
    guard.release();
    if (e.kind() == UploadErrorKind::SERVER_INVALIDATION) {
      auto invalid = lifecycle_.mark_server_invalid(paused, e.what());
      return UploadResult{UploadOutcome::SERVER_INVALID, invalid};
    }
    CAPSULE_LOG_ERROR("Complete failed, keeping progress for retry" << kv("error", e.what()));
    throw;
  }
  guard.release();

  if (!response.success) {
    CAPSULE_LOG_ERROR("Server refused completion" << kv("message", response.message));
    throw UploadError::completionFailed(response.message);
  }

  const std::string content_id =
    response.content_id.empty() ? session.content_id : response.content_id;
  CAPSULE_LOG_INFO(
    "Upload completed" << kv("content_id", content_id) << kv("object_key", response.object_key)
                       << kv("verified", response.verified.value_or(false))
  );

  auto uploaded = lifecycle_.mark_uploaded(paused, content_id);
  return UploadResult{UploadOutcome::SUCCESS, uploaded};
}

}  // namespace uploader
}  // namespace capsule

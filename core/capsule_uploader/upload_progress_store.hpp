// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CAPSULE_UPLOAD_PROGRESS_STORE_HPP
#define CAPSULE_UPLOAD_PROGRESS_STORE_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace capsule {
namespace uploader {

/**
 * A chunk the remote store has acknowledged
 */
struct ChunkRecord {
  uint64_t chunk_number = 0;  // 1-based
  std::string etag;

  bool operator==(const ChunkRecord& other) const {
    return chunk_number == other.chunk_number && etag == other.etag;
  }
};

/**
 * Server-side multipart session. chunk_size_bytes and expires_at are fixed
 * when the session is created.
 */
struct UploadSession {
  std::string upload_id;
  std::string content_id;
  uint64_t total_chunks = 0;
  uint64_t chunk_size_bytes = 0;
  int64_t expires_at = 0;  // unix seconds
};

/**
 * In-flight upload of one archive. Owned by the orchestrator for the
 * duration of an attempt.
 */
struct UploadProgressState {
  std::string tar_path;
  UploadSession session;
  std::vector<ChunkRecord> chunk_etags;  // ascending, no duplicates

  /**
   * max(chunk_number) + 1, or 1 when nothing has been acknowledged yet
   */
  uint64_t next_chunk_number() const;

  /**
   * Bytes covered by acknowledged chunks, assuming a contiguous run from 1
   */
  uint64_t bytes_already_uploaded() const;

  int64_t seconds_until_expiration(int64_t now_unix) const {
    return session.expires_at - now_unix;
  }

  bool is_expired(int64_t now_unix) const {
    return now_unix >= session.expires_at;
  }
};

inline uint64_t next_chunk_number(const UploadProgressState& state) {
  return state.next_chunk_number();
}

/**
 * Durable JSON-lines persistence of UploadProgressState.
 *
 * File layout (one JSON object per line):
 *   {"upload_id":..,"content_id":..,"tar_path":..,"total_chunks":..,"chunk_size_bytes":..,"expires_at":..}
 *   {"chunk_number":1,"etag":".."}
 *   {"chunk_number":2,"etag":".."}
 *
 * A file written by older builds keeps every chunk inside the header under
 * "chunk_etags". load() accepts it and rewrites the file in the layout above.
 *
 * Every I/O or parse failure throws UploadError (IO or SERIALIZATION).
 */
class UploadProgressStore {
public:
  static constexpr const char* kFileName = ".upload-progress";

  static std::string path_for(const std::string& folder);

  /**
   * Replace the progress file with a fresh snapshot: header line followed by
   * one line per acknowledged chunk.
   */
  static void save(const std::string& folder, const UploadProgressState& state);

  /**
   * Append one acknowledged chunk. The progress file must already exist.
   */
  static void append_chunk(const std::string& folder, const ChunkRecord& chunk);

  /**
   * Read a progress file. Duplicate chunk numbers keep their first occurrence.
   */
  static UploadProgressState load(const std::string& path);

  /**
   * Delete the progress file. A missing file counts as success.
   */
  static bool remove(const std::string& folder);

private:
  static void write_snapshot(const std::string& path, const UploadProgressState& state);
};

}  // namespace uploader
}  // namespace capsule

#endif  // CAPSULE_UPLOAD_PROGRESS_STORE_HPP

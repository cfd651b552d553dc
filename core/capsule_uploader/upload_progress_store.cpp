// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_progress_store.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <set>

#include "upload_error.hpp"

#define CAPSULE_LOG_COMPONENT "progress_store"
#include <capsule_log_macros.hpp>

namespace fs = std::filesystem;

namespace capsule {
namespace uploader {

using capsule::logging::kv;

namespace {

nlohmann::json header_to_json(const UploadProgressState& state) {
  return nlohmann::json{
    {"upload_id", state.session.upload_id},
    {"content_id", state.session.content_id},
    {"tar_path", state.tar_path},
    {"total_chunks", state.session.total_chunks},
    {"chunk_size_bytes", state.session.chunk_size_bytes},
    {"expires_at", state.session.expires_at},
  };
}

nlohmann::json chunk_to_json(const ChunkRecord& chunk) {
  return nlohmann::json{{"chunk_number", chunk.chunk_number}, {"etag", chunk.etag}};
}

ChunkRecord chunk_from_json(const nlohmann::json& j) {
  ChunkRecord chunk;
  chunk.chunk_number = j.at("chunk_number").get<uint64_t>();
  chunk.etag = j.at("etag").get<std::string>();
  return chunk;
}

}  // namespace

uint64_t UploadProgressState::next_chunk_number() const {
  uint64_t max_chunk = 0;
  for (const auto& chunk : chunk_etags) {
    max_chunk = std::max(max_chunk, chunk.chunk_number);
  }
  return max_chunk + 1;
}

uint64_t UploadProgressState::bytes_already_uploaded() const {
  return (next_chunk_number() - 1) * session.chunk_size_bytes;
}

std::string UploadProgressStore::path_for(const std::string& folder) {
  return (fs::path(folder) / kFileName).string();
}

void UploadProgressStore::write_snapshot(
  const std::string& path, const UploadProgressState& state
) {
  const std::string tmp_path = path + ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::trunc);
    if (!out) {
      throw UploadError::io("cannot open " + tmp_path + " for writing");
    }
    out << header_to_json(state).dump() << '\n';
    for (const auto& chunk : state.chunk_etags) {
      out << chunk_to_json(chunk).dump() << '\n';
    }
    out.flush();
    if (!out) {
      throw UploadError::io("failed writing " + tmp_path);
    }
  }

  std::error_code ec;
  fs::rename(tmp_path, path, ec);
  if (ec) {
    fs::remove(tmp_path, ec);
    throw UploadError::io("cannot replace " + path);
  }
}

void UploadProgressStore::save(const std::string& folder, const UploadProgressState& state) {
  write_snapshot(path_for(folder), state);
  CAPSULE_LOG_DEBUG(
    "Saved upload progress" << kv("folder", folder) << kv("chunks", state.chunk_etags.size())
  );
}

void UploadProgressStore::append_chunk(const std::string& folder, const ChunkRecord& chunk) {
  const std::string path = path_for(folder);
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    throw UploadError::io("progress file missing: " + path);
  }

  std::ofstream out(path, std::ios::app);
  if (!out) {
    throw UploadError::io("cannot open " + path + " for appending");
  }
  out << chunk_to_json(chunk).dump() << '\n';
  out.flush();
  if (!out) {
    throw UploadError::io("failed appending chunk " + std::to_string(chunk.chunk_number));
  }
}

UploadProgressState UploadProgressStore::load(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw UploadError::io("cannot open " + path);
  }

  UploadProgressState state;
  std::set<uint64_t> seen;
  bool have_header = false;
  bool legacy_layout = false;
  size_t line_number = 0;
  std::string line;

  auto add_chunk = [&](const ChunkRecord& chunk) {
    if (chunk.chunk_number == 0) {
      throw UploadError::serialization("chunk number 0 in " + path);
    }
    if (seen.insert(chunk.chunk_number).second) {
      state.chunk_etags.push_back(chunk);
    }
  };

  try {
    while (std::getline(in, line)) {
      ++line_number;
      if (line.find_first_not_of(" \t\r") == std::string::npos) {
        continue;
      }
      auto j = nlohmann::json::parse(line);

      if (!have_header) {
        state.session.upload_id = j.at("upload_id").get<std::string>();
        state.session.content_id = j.at("content_id").get<std::string>();
        state.tar_path = j.at("tar_path").get<std::string>();
        state.session.total_chunks = j.at("total_chunks").get<uint64_t>();
        state.session.chunk_size_bytes = j.at("chunk_size_bytes").get<uint64_t>();
        state.session.expires_at = j.at("expires_at").get<int64_t>();
        have_header = true;

        auto legacy = j.find("chunk_etags");
        if (legacy != j.end() && legacy->is_array() && !legacy->empty()) {
          legacy_layout = true;
          for (const auto& entry : *legacy) {
            add_chunk(chunk_from_json(entry));
          }
        }
        continue;
      }

      add_chunk(chunk_from_json(j));
    }
  } catch (const nlohmann::json::exception& e) {
    throw UploadError::serialization(
      path + " line " + std::to_string(line_number) + ": " + e.what()
    );
  }

  if (in.bad()) {
    throw UploadError::io("failed reading " + path);
  }
  if (!have_header) {
    throw UploadError::serialization("empty progress file " + path);
  }
  if (state.session.chunk_size_bytes == 0 || state.session.total_chunks == 0) {
    throw UploadError::serialization("progress file " + path + " has an empty session");
  }

  std::stable_sort(
    state.chunk_etags.begin(), state.chunk_etags.end(),
    [](const ChunkRecord& a, const ChunkRecord& b) {
      return a.chunk_number < b.chunk_number;
    }
  );

  if (legacy_layout) {
    CAPSULE_LOG_INFO(
      "Migrating single-object progress file" << kv("path", path)
                                              << kv("chunks", state.chunk_etags.size())
    );
    write_snapshot(path, state);
  }

  return state;
}

bool UploadProgressStore::remove(const std::string& folder) {
  std::error_code ec;
  fs::remove(path_for(folder), ec);
  if (ec) {
    CAPSULE_LOG_WARN("Failed to remove progress file" << kv("folder", folder)
                                                        << kv("error", ec.message()));
    return false;
  }
  return true;
}

}  // namespace uploader
}  // namespace capsule

// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "archive_builder.hpp"

#include <array>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <random>

#include "upload_error.hpp"

#define CAPSULE_LOG_COMPONENT "archive"
#include <capsule_log_macros.hpp>

namespace fs = std::filesystem;

namespace capsule {
namespace uploader {

using capsule::logging::kv;

namespace {

using HeaderBlock = std::array<char, ArchiveBuilder::kBlockSize>;

// Zero-padded octal, NUL terminated, filling the whole field
void write_octal(char* field, size_t width, uint64_t value) {
  std::snprintf(field, width, "%0*llo", static_cast<int>(width - 1),
                static_cast<unsigned long long>(value));
}

HeaderBlock make_header(const std::string& name, uint64_t size, int64_t mtime) {
  HeaderBlock block{};
  char* h = block.data();

  std::memcpy(h, name.data(), name.size());  // name[100]
  write_octal(h + 100, 8, 0644);             // mode
  write_octal(h + 108, 8, 0);                // uid
  write_octal(h + 116, 8, 0);                // gid
  write_octal(h + 124, 12, size);            // size
  write_octal(h + 136, 12, static_cast<uint64_t>(mtime));
  h[156] = '0';                              // regular file
  std::memcpy(h + 257, "ustar", 6);          // magic incl. NUL
  std::memcpy(h + 263, "00", 2);             // version

  // Checksum is computed with its own field set to spaces
  std::memset(h + 148, ' ', 8);
  unsigned int sum = 0;
  for (unsigned char c : block) {
    sum += c;
  }
  std::snprintf(h + 148, 7, "%06o", sum);
  h[154] = '\0';
  h[155] = ' ';
  return block;
}

void append_entry(std::ofstream& out, const std::string& path, int64_t mtime) {
  const std::string name = fs::path(path).filename().string();
  if (name.empty() || name.size() >= 100) {
    throw UploadError::io("cannot archive file with name '" + name + "'");
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw UploadError::io("cannot open " + path);
  }
  std::error_code ec;
  const uint64_t size = fs::file_size(path, ec);
  if (ec) {
    throw UploadError::io("cannot stat " + path + ": " + ec.message());
  }

  const auto header = make_header(name, size, mtime);
  out.write(header.data(), header.size());

  std::vector<char> buffer(64 * 1024);
  uint64_t copied = 0;
  while (in.read(buffer.data(), buffer.size()) || in.gcount() > 0) {
    out.write(buffer.data(), in.gcount());
    copied += static_cast<uint64_t>(in.gcount());
  }
  if (in.bad() || copied != size) {
    throw UploadError::io("short read from " + path);
  }

  const size_t padding = (ArchiveBuilder::kBlockSize - size % ArchiveBuilder::kBlockSize) %
                         ArchiveBuilder::kBlockSize;
  if (padding > 0) {
    const HeaderBlock zeros{};
    out.write(zeros.data(), padding);
  }
}

}  // namespace

std::string ArchiveBuilder::random_archive_name() {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  char buf[17];
  std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(rng()));
  return std::string(buf) + ".tar";
}

void ArchiveBuilder::write_archive(
  const std::string& archive_path, const std::vector<std::string>& files
) {
  const int64_t mtime = static_cast<int64_t>(std::time(nullptr));
  try {
    std::ofstream out(archive_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw UploadError::io("cannot create " + archive_path);
    }
    for (const auto& file : files) {
      append_entry(out, file, mtime);
    }
    const HeaderBlock zeros{};
    out.write(zeros.data(), zeros.size());
    out.write(zeros.data(), zeros.size());
    out.flush();
    if (!out) {
      throw UploadError::io("failed writing " + archive_path);
    }
  } catch (const UploadError&) {
    std::error_code ec;
    fs::remove(archive_path, ec);
    throw;
  }
}

std::string ArchiveBuilder::build(const std::string& folder, const RecordingArtifact& artifact) {
  const std::string archive_path = (fs::path(folder) / random_archive_name()).string();
  write_archive(archive_path, {artifact.video_path, artifact.inputs_path, artifact.metadata_path});
  CAPSULE_LOG_INFO("Created archive" << kv("path", archive_path));
  return archive_path;
}

}  // namespace uploader
}  // namespace capsule

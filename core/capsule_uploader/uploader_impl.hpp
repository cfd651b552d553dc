// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CAPSULE_UPLOADER_IMPL_HPP
#define CAPSULE_UPLOADER_IMPL_HPP

#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>

#include "uploader_interfaces.hpp"

namespace capsule {
namespace uploader {

/**
 * IFileSystem backed by std::filesystem. Never throws.
 */
class FileSystemImpl : public IFileSystem {
public:
  bool exists(const std::string& path) const override {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
  }

  bool is_file(const std::string& path) const override {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
  }

  bool is_directory(const std::string& path) const override {
    std::error_code ec;
    return std::filesystem::is_directory(path, ec);
  }

  std::optional<uint64_t> file_size(const std::string& path) const override {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
      return std::nullopt;
    }
    return static_cast<uint64_t>(size);
  }

  bool remove(const std::string& path) const override {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    return !ec;
  }

  bool remove_all(const std::string& path) const override {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    return !ec;
  }

  bool rename(const std::string& old_path, const std::string& new_path) const override {
    std::error_code ec;
    std::filesystem::rename(old_path, new_path, ec);
    return !ec;
  }

  bool create_directories(const std::string& path) const override {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    return !ec;
  }

  std::optional<std::string> read_file(const std::string& path) const override {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
      return std::nullopt;
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    if (in.bad()) {
      return std::nullopt;
    }
    return contents.str();
  }

  bool write_file(const std::string& path, const std::string& contents) const override {
    const std::string tmp_path = path + ".tmp";
    {
      std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
      if (!out) {
        return false;
      }
      out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
      out.flush();
      if (!out) {
        out.close();
        remove(tmp_path);
        return false;
      }
    }
    if (!rename(tmp_path, path)) {
      remove(tmp_path);
      return false;
    }
    return true;
  }

  std::vector<std::string> list_directory(const std::string& path) const override {
    std::vector<std::string> entries;
    std::error_code ec;
    std::filesystem::directory_iterator it(path, ec);
    if (ec) {
      return entries;
    }
    for (const auto& entry : it) {
      entries.push_back(entry.path().string());
    }
    return entries;
  }
};

class FileStreamImpl : public IFileStream {
public:
  FileStreamImpl(const std::string& path, std::ios_base::openmode mode)
      : stream_(path, mode) {}

  IFileStream& read(char* buffer, std::streamsize size) override {
    stream_.read(buffer, size);
    return *this;
  }

  IFileStream& seekg(std::streamoff offset, std::ios_base::seekdir origin) override {
    stream_.seekg(offset, origin);
    return *this;
  }

  std::streamsize gcount() const override {
    return stream_.gcount();
  }

  bool good() const override {
    return stream_.good();
  }

  bool fail() const override {
    return stream_.fail();
  }

  bool bad() const override {
    return stream_.bad();
  }

private:
  std::ifstream stream_;
};

class FileStreamFactoryImpl : public IFileStreamFactory {
public:
  std::unique_ptr<IFileStream> create_file_stream(
    const std::string& path, std::ios_base::openmode mode
  ) override {
    auto stream = std::make_unique<FileStreamImpl>(path, mode);
    if (!stream->good()) {
      return nullptr;
    }
    return stream;
  }
};

}  // namespace uploader
}  // namespace capsule

#endif  // CAPSULE_UPLOADER_IMPL_HPP

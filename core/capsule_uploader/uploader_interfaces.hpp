// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CAPSULE_UPLOADER_INTERFACES_HPP
#define CAPSULE_UPLOADER_INTERFACES_HPP

#include <cstdint>
#include <ios>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace capsule {
namespace uploader {

/**
 * Filesystem operations used for marker files and archive bookkeeping.
 * Allows tests to inject failures.
 */
class IFileSystem {
public:
  virtual ~IFileSystem() = default;

  virtual bool exists(const std::string& path) const = 0;
  virtual bool is_file(const std::string& path) const = 0;
  virtual bool is_directory(const std::string& path) const = 0;

  /**
   * Size of a regular file in bytes, or std::nullopt if it cannot be stat'ed
   */
  virtual std::optional<uint64_t> file_size(const std::string& path) const = 0;

  /**
   * Remove a single file. Removing a missing file counts as success.
   */
  virtual bool remove(const std::string& path) const = 0;

  /**
   * Remove a directory tree
   */
  virtual bool remove_all(const std::string& path) const = 0;

  virtual bool rename(const std::string& old_path, const std::string& new_path) const = 0;

  virtual bool create_directories(const std::string& path) const = 0;

  /**
   * Read a whole file, or std::nullopt if it cannot be read
   */
  virtual std::optional<std::string> read_file(const std::string& path) const = 0;

  /**
   * Replace the file's contents (write to a sibling temp file, then rename)
   */
  virtual bool write_file(const std::string& path, const std::string& contents) const = 0;

  /**
   * Full paths of the direct children of a directory; empty if unreadable
   */
  virtual std::vector<std::string> list_directory(const std::string& path) const = 0;
};

/**
 * Read-only byte stream over an archive
 */
class IFileStream {
public:
  virtual ~IFileStream() = default;

  virtual IFileStream& read(char* buffer, std::streamsize size) = 0;
  virtual IFileStream& seekg(std::streamoff offset, std::ios_base::seekdir origin) = 0;

  /**
   * Number of characters extracted by the last read
   */
  virtual std::streamsize gcount() const = 0;

  virtual bool good() const = 0;
  virtual bool fail() const = 0;
  virtual bool bad() const = 0;
};

class IFileStreamFactory {
public:
  virtual ~IFileStreamFactory() = default;

  /**
   * @return The opened stream, or nullptr if the file cannot be opened
   */
  virtual std::unique_ptr<IFileStream> create_file_stream(
    const std::string& path, std::ios_base::openmode mode
  ) = 0;
};

}  // namespace uploader
}  // namespace capsule

#endif  // CAPSULE_UPLOADER_INTERFACES_HPP

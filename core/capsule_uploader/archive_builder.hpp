// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CAPSULE_ARCHIVE_BUILDER_HPP
#define CAPSULE_ARCHIVE_BUILDER_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "recording_types.hpp"

namespace capsule {
namespace uploader {

/**
 * Packs a recording's artifacts into one POSIX ustar archive.
 *
 * Entries are stored flat under their file names. A fresh random name is
 * used for every build, so an archive rebuilt after a crash is never
 * mistaken for one a server session was created for.
 */
class ArchiveBuilder {
public:
  static constexpr size_t kBlockSize = 512;

  /**
   * Write <folder>/<16 hex>.tar holding the artifact's three files
   *
   * @return Path of the archive
   * @throws UploadError(IO) on any read/write failure; no partial archive is left
   */
  static std::string build(const std::string& folder, const RecordingArtifact& artifact);

  /**
   * Write an archive of arbitrary files to archive_path
   */
  static void write_archive(
    const std::string& archive_path, const std::vector<std::string>& files
  );

  static std::string random_archive_name();
};

}  // namespace uploader
}  // namespace capsule

#endif  // CAPSULE_ARCHIVE_BUILDER_HPP

// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "hardware_id.hpp"

#include "upload_error.hpp"

namespace capsule {
namespace uploader {

std::string read_hardware_id(const IFileSystem& fs, const std::vector<std::string>& candidates) {
  for (const auto& path : candidates) {
    auto contents = fs.read_file(path);
    if (!contents) {
      continue;
    }
    const auto first = contents->find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
      continue;
    }
    const auto last = contents->find_last_not_of(" \t\r\n");
    return contents->substr(first, last - first + 1);
  }
  throw UploadError::validation("no hardware id available");
}

}  // namespace uploader
}  // namespace capsule

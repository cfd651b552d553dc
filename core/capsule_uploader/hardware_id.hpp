// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CAPSULE_HARDWARE_ID_HPP
#define CAPSULE_HARDWARE_ID_HPP

#include <string>
#include <vector>

#include "uploader_interfaces.hpp"

namespace capsule {
namespace uploader {

/**
 * Stable machine identifier sent with every new upload session.
 *
 * Reads the first non-empty candidate file, trimmed of whitespace.
 * @throws UploadError(VALIDATION) when no candidate yields an id
 */
std::string read_hardware_id(
  const IFileSystem& fs,
  const std::vector<std::string>& candidates = {"/etc/machine-id", "/var/lib/dbus/machine-id"}
);

}  // namespace uploader
}  // namespace capsule

#endif  // CAPSULE_HARDWARE_ID_HPP

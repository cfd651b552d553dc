// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CAPSULE_DIGEST_HPP
#define CAPSULE_DIGEST_HPP

#include <cstddef>
#include <string>

namespace capsule {
namespace uploader {

/**
 * Lowercase hex SHA-256 of a byte range (64 characters).
 * Throws UploadError(IO) if the digest cannot be computed.
 */
std::string sha256_hex(const char* data, size_t size);

inline std::string sha256_hex(const std::string& data) {
  return sha256_hex(data.data(), data.size());
}

}  // namespace uploader
}  // namespace capsule

#endif  // CAPSULE_DIGEST_HPP

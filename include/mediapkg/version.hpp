#pragma once

// mediapkg/version.hpp - Version constants for every persisted format.
//
// INVARIANT:
//   All version constants are compile-time. A package written by this build
//   is readable by any build that carries the same PACKAGE_FORMAT_VERSION,
//   MANIFEST_ENCODING_VERSION and HASH_ALGORITHM_VERSION.

#include <cstdint>
#include <string>

namespace mediapkg {
namespace version {

// ---------------------------------------------------------------------------
// PACKAGE_FORMAT_VERSION
// Tracks the container layout: magic, manifest index, entry count, sorted
// (hash, length) index, blobs in index order, no trailing bytes.
// Any change to field widths, ordering or the magic marker requires a bump.
// ---------------------------------------------------------------------------
constexpr uint32_t PACKAGE_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// MANIFEST_ENCODING_VERSION
// Tracks the canonical CBOR encoding of the manifest. Because the manifest is
// addressed by its own hash, changing key names, key order or head widths
// changes every package's bytes and requires a bump.
// ---------------------------------------------------------------------------
constexpr uint32_t MANIFEST_ENCODING_VERSION = 1;

// ---------------------------------------------------------------------------
// HASH_ALGORITHM_VERSION
// Version 1 = BLAKE3, 32-byte output, hex-encoded to 64 chars.
// ---------------------------------------------------------------------------
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

struct VersionManifest {
  uint32_t package_format{PACKAGE_FORMAT_VERSION};
  uint32_t manifest_encoding{MANIFEST_ENCODING_VERSION};
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  std::string semver;           // e.g. "0.1.0" from CMake project version
  std::string hash_primitive;   // e.g. "blake3"
  std::string build_timestamp;  // from __DATE__/__TIME__
};

VersionManifest current_manifest(const std::string& semver = "");

// Serialize to compact JSON.
std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace mediapkg

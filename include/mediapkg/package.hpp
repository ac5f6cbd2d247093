#pragma once

// mediapkg/package.hpp - Package writer, loader and logical resolver.
//
// INVARIANTS of a loaded Package (enforced by load_package):
//   1. Every blob's bytes hash to its key. There is no way to obtain
//      unverified bytes from a Package.
//   2. The on-disk index was strictly ascending by raw hash bytes, so two
//      packagings of the same logical content are byte-identical.
//   3. files holds exactly the manifest's own serialized bytes plus every blob
//      the manifest references, and nothing else.
//
// A Package is immutable after load and safe for unsynchronized concurrent
// reads.

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "mediapkg/hash.hpp"
#include "mediapkg/manifest.hpp"
#include "mediapkg/types.hpp"

namespace mediapkg {

struct Package {
  std::map<Hash, std::string> files;
  Manifest manifest;

  bool operator==(const Package&) const = default;
};

// Caller-computed digest of a source file. The length is trusted by the
// writer and not re-checked against the file on disk.
struct FileEntry {
  Hash hash{};
  std::uint64_t length{0};
};

struct Resource {
  std::string content_type;
  std::string content;
};

// Parse and fully validate the package at `path`. On failure returns nullopt
// and fills *error with the first violation found.
std::optional<Package> load_package(const std::string& path, PackageError* error);

// Write `files` (relative path under `root` -> digest) plus the serialized
// manifest to `output` in canonical order. Creates or truncates `output`.
// Does not check that `output` lies outside `root`; callers do that.
bool save_package(const std::map<std::string, FileEntry>& files, const Manifest& manifest,
                  const std::string& output, const std::string& root, PackageError* error);

// Map a logical path to a blob:
//   App:   exact lookup in paths, content type guessed from the extension.
//   Comic: decimal page index, content type image/jpeg.
// Returns nullopt when nothing matches. Throws std::logic_error if the
// manifest names a hash absent from files, which load_package rules out.
std::optional<Resource> resolve_file(const Package& package, const std::string& path);

// Content type from the final extension of `path`, case-insensitive.
// Unknown or missing extensions give application/octet-stream.
std::string guess_content_type(const std::string& path);

}  // namespace mediapkg

#pragma once

// mediapkg/manifest.hpp - Logical description of a package's contents.
//
// A Manifest is a closed union of the resource kinds a package can hold.
// Adding a kind means adding an alternative here, a branch in each visitor
// in manifest.cpp, and a branch in the resolver.
//
// ENCODING:
//   encode_manifest() produces a canonical CBOR subset: definite lengths,
//   shortest-form heads, fixed key order, paths in byte-wise ascending order.
//   The same manifest value always encodes to the same bytes, so the manifest
//   hash stored in the package index is reproducible across runs and hosts.

#include <map>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include "mediapkg/hash.hpp"
#include "mediapkg/types.hpp"

namespace mediapkg {

// Path-addressed bundle, e.g. a web front-end that presents content of type
// `handles`.
struct AppManifest {
  Type handles{Type::comic};
  std::map<std::string, Hash> paths;

  bool operator==(const AppManifest&) const = default;
};

// Index-addressed bundle: page 0, 1, 2, ...
struct ComicManifest {
  std::vector<Hash> pages;

  bool operator==(const ComicManifest&) const = default;
};

using Manifest = std::variant<AppManifest, ComicManifest>;

Type manifest_type(const Manifest& manifest);

// Every blob hash the manifest refers to, not including its own hash.
std::set<Hash> manifest_references(const Manifest& manifest);

std::string encode_manifest(const Manifest& manifest);

// Returns nullopt and sets error->code = manifest_deserialize on any deviation
// from the canonical shape.
std::optional<Manifest> decode_manifest(const std::string& bytes, PackageError* error);

// Consistency check against a package's file map. The referenced set is the
// manifest's own hash plus manifest_references(). Files outside that set are
// extra; referenced hashes absent from `files` are missing. Extra files are
// reported first.
bool verify_manifest(const Manifest& manifest, const Hash& manifest_hash,
                     const std::map<Hash, std::string>& files, PackageError* error);

// JSON rendering served at /api/manifest. Hashes are lowercase hex.
std::string manifest_to_json(const Manifest& manifest);

}  // namespace mediapkg

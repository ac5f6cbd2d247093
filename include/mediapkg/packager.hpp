#pragma once

// mediapkg/packager.hpp - Build a package from a directory tree.
//
// The root directory carries a metadata.json describing what it holds:
//   {"type": "app", "handles": "comic"}   every file becomes an app path
//   {"type": "comic"}                     files 0.jpg .. N-1.jpg become pages

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "mediapkg/manifest.hpp"
#include "mediapkg/package.hpp"
#include "mediapkg/types.hpp"

namespace mediapkg {

inline constexpr char kMetadataFile[] = "metadata.json";

struct Metadata {
  Type type{Type::app};
  Type handles{Type::comic};  // meaningful only for apps
};

// Parse metadata.json text. Sets error->code = metadata_invalid on failure.
std::optional<Metadata> parse_metadata(const std::string& text, PackageError* error);

// Per-type rule turning the set of packaged files into a Manifest once their
// hashes are known.
struct Template {
  Type type{Type::app};
  Type handles{Type::comic};
  std::vector<std::string> pages;  // comic: relative path of each page in order

  Manifest manifest(const std::map<std::string, FileEntry>& hashes) const;
};

// Validate `paths` (relative, '/'-separated) against `metadata`.
std::optional<Template> build_template(const Metadata& metadata, const std::string& root,
                                       const std::set<std::string>& paths, PackageError* error);

// Package the contents of `root` into `output`.
bool package_directory(const std::string& root, const std::string& output, PackageError* error);

}  // namespace mediapkg

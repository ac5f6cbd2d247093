#include "mediapkg/packager.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "mediapkg/hash.hpp"
#include "mediapkg/jsonlite.hpp"
#include "mediapkg/observability.hpp"

namespace fs = std::filesystem;

namespace mediapkg {

namespace {

PackageError make_error(ErrorCode code) {
  PackageError e;
  e.code = code;
  return e;
}

// Lexical containment, component by component: "foo/bar" is inside "foo",
// "foobar" is not.
bool path_starts_with(const fs::path& path, const fs::path& prefix) {
  const fs::path p = path.lexically_normal();
  const fs::path r = prefix.lexically_normal();
  auto pi = p.begin();
  for (auto ri = r.begin(); ri != r.end(); ++ri) {
    if (ri->empty()) continue;  // trailing separator
    if (pi == p.end() || *pi != *ri) return false;
    ++pi;
  }
  return true;
}

bool walk(const fs::path& root, std::set<std::string>& out, PackageError& err) {
  std::error_code ec;
  fs::recursive_directory_iterator it(root, ec);
  const fs::recursive_directory_iterator end;
  for (; !ec && it != end; it.increment(ec)) {
    const auto& entry = *it;
    std::error_code type_ec;
    if (entry.is_directory(type_ec)) continue;
    if (entry.path().filename() == ".DS_Store") continue;
    const std::string relative = entry.path().lexically_relative(root).generic_string();
    if (relative == kMetadataFile) continue;
    out.insert(relative);
  }
  if (ec) {
    err = make_error(ErrorCode::io_error);
    err.path = root.string();
    err.detail = ec.message();
    return false;
  }
  return true;
}

std::optional<Template> comic_template(const std::string& root,
                                       const std::set<std::string>& paths, PackageError& err) {
  std::map<std::uint64_t, std::string> pages;
  for (const auto& path : paths) {
    const bool jpg = path.size() > 4 && path.compare(path.size() - 4, 4, ".jpg") == 0;
    const std::string stem = jpg ? path.substr(0, path.size() - 4) : std::string();
    const bool digits = !stem.empty() && std::all_of(stem.begin(), stem.end(), [](unsigned char c) {
      return std::isdigit(c) != 0;
    });
    if (!digits) {
      err = make_error(ErrorCode::unexpected_file);
      err.path = path;
      err.type = Type::comic;
      return std::nullopt;
    }

    std::uint64_t page = 0;
    const auto [ptr, ec] = std::from_chars(stem.data(), stem.data() + stem.size(), page);
    if (ec != std::errc() || ptr != stem.data() + stem.size()) {
      err = make_error(ErrorCode::invalid_page);
      err.path = path;
      return std::nullopt;
    }

    if (!pages.emplace(page, path).second) {
      err = make_error(ErrorCode::page_duplicated);
      err.value = page;
      return std::nullopt;
    }
  }

  if (pages.empty()) {
    err = make_error(ErrorCode::no_pages);
    err.root = root;
    return std::nullopt;
  }

  Template t;
  t.type = Type::comic;
  std::uint64_t expected = 0;
  for (const auto& [page, path] : pages) {
    if (page != expected) {
      err = make_error(ErrorCode::page_missing);
      err.value = expected;
      return std::nullopt;
    }
    t.pages.push_back(path);
    ++expected;
  }
  return t;
}

bool hash_files(const fs::path& root, const std::set<std::string>& paths,
                std::map<std::string, FileEntry>& out, PackageError& err) {
  for (const auto& relative : paths) {
    const std::string full = (root / relative).string();
    FileEntry entry;
    auto hash = hash_file(full, &entry.length);
    if (!hash) {
      err = make_error(ErrorCode::io_error);
      err.path = full;
      err.detail = "cannot hash";
      return false;
    }
    entry.hash = *hash;
    out.emplace(relative, entry);
  }
  return true;
}

bool package_impl(const std::string& root, const std::string& output, PackageError& err,
                  PackageEvent& ev) {
  if (path_starts_with(output, root)) {
    err = make_error(ErrorCode::output_in_root);
    err.path = output;
    err.root = root;
    return false;
  }

  std::error_code ec;
  if (fs::is_directory(output, ec)) {
    err = make_error(ErrorCode::output_is_dir);
    err.path = output;
    return false;
  }

  const fs::path metadata_path = fs::path(root) / kMetadataFile;
  if (!fs::exists(metadata_path, ec)) {
    err = make_error(ErrorCode::metadata_missing);
    err.root = root;
    return false;
  }

  std::ifstream metadata_in(metadata_path, std::ios::binary);
  if (!metadata_in) {
    err = make_error(ErrorCode::io_error);
    err.path = metadata_path.string();
    err.detail = "cannot open";
    return false;
  }
  std::ostringstream metadata_text;
  metadata_text << metadata_in.rdbuf();

  auto metadata = parse_metadata(metadata_text.str(), &err);
  if (!metadata) {
    err.path = metadata_path.string();
    return false;
  }

  std::set<std::string> paths;
  if (!walk(root, paths, err)) return false;

  auto tmpl = build_template(*metadata, root, paths, &err);
  if (!tmpl) return false;

  std::map<std::string, FileEntry> hashes;
  if (!hash_files(root, paths, hashes, err)) return false;
  ev.files = hashes.size();
  for (const auto& [path, entry] : hashes) {
    (void)path;
    ev.bytes += entry.length;
  }

  return save_package(hashes, tmpl->manifest(hashes), output, root, &err);
}

}  // namespace

std::optional<Metadata> parse_metadata(const std::string& text, PackageError* error) {
  auto invalid = [&](const std::string& detail) -> std::optional<Metadata> {
    if (error) {
      *error = make_error(ErrorCode::metadata_invalid);
      error->detail = detail;
    }
    return std::nullopt;
  };

  std::optional<jsonlite::JsonError> json_err;
  const auto obj = jsonlite::parse(text, &json_err);
  if (json_err) return invalid(json_err->message);

  for (const auto& [key, value] : obj) {
    (void)value;
    if (key != "type" && key != "handles") return invalid("unknown field \"" + key + "\"");
  }

  const auto type = type_from_string(jsonlite::get_string(obj, "type"));
  if (!type) return invalid("missing or unknown \"type\"");

  Metadata m;
  m.type = *type;
  if (m.type == Type::app) {
    const auto handles = type_from_string(jsonlite::get_string(obj, "handles"));
    if (!handles) return invalid("missing or unknown \"handles\"");
    m.handles = *handles;
  } else if (jsonlite::has_key(obj, "handles")) {
    return invalid("\"handles\" is only valid for apps");
  }
  return m;
}

Manifest Template::manifest(const std::map<std::string, FileEntry>& hashes) const {
  if (type == Type::app) {
    AppManifest app;
    app.handles = handles;
    for (const auto& [path, entry] : hashes) {
      app.paths.emplace(path, entry.hash);
    }
    return app;
  }

  ComicManifest comic;
  for (const auto& page : pages) {
    comic.pages.push_back(hashes.at(page).hash);
  }
  return comic;
}

std::optional<Template> build_template(const Metadata& metadata, const std::string& root,
                                       const std::set<std::string>& paths, PackageError* error) {
  PackageError err;
  std::optional<Template> t;
  if (metadata.type == Type::app) {
    if (!paths.contains("index.html")) {
      err = make_error(ErrorCode::index_missing);
      err.root = root;
    } else {
      t = Template{Type::app, metadata.handles, {}};
    }
  } else {
    t = comic_template(root, paths, err);
  }
  if (!t && error) *error = err;
  return t;
}

bool package_directory(const std::string& root, const std::string& output, PackageError* error) {
  PackageEvent ev;
  ev.operation = "package";
  ev.path = output;

  PackageError err;
  bool ok = false;
  {
    ScopeTimer timer(ev.duration_ns);
    ok = package_impl(root, output, err, ev);
  }

  ev.ok = ok;
  ev.error_code = to_string(err.code);
  emit_package_event(ev);

  if (!ok && error) *error = err;
  return ok;
}

}  // namespace mediapkg

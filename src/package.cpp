#include "mediapkg/package.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <vector>

#include "mediapkg/codec.hpp"
#include "mediapkg/observability.hpp"

namespace fs = std::filesystem;

namespace mediapkg {

namespace {

constexpr std::size_t kCopyBufferSize = 65536;

bool fits_size_t(std::uint64_t value) {
  return value <= static_cast<std::uint64_t>(std::numeric_limits<std::size_t>::max());
}

PackageError make_error(ErrorCode code, const std::string& path) {
  PackageError e;
  e.code = code;
  e.path = path;
  return e;
}

PackageError eof_error(const std::string& path, const std::string& field) {
  PackageError e = make_error(ErrorCode::unexpected_eof, path);
  e.detail = "while reading " + field;
  return e;
}

// ---------------------------------------------------------------------------
// Loader
// ---------------------------------------------------------------------------

std::optional<Package> load_impl(const std::string& path, PackageError& err,
                                 PackageEvent& ev) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    err = make_error(ErrorCode::io_error, path);
    err.detail = "cannot open";
    return std::nullopt;
  }

  std::error_code ec;
  const std::uint64_t file_len = fs::file_size(path, ec);
  if (ec) {
    err = make_error(ErrorCode::io_error, path);
    err.detail = ec.message();
    return std::nullopt;
  }

  // 1. Magic marker. A truncated file reports only the bytes it had.
  char magic[codec::kMagicLen];
  const std::size_t magic_read = codec::read_fully(in, magic, sizeof(magic));
  if (magic_read != codec::kMagicLen || std::memcmp(magic, codec::kMagic, codec::kMagicLen) != 0) {
    err = make_error(ErrorCode::magic_bytes, path);
    err.bytes.assign(magic, magic_read);
    return std::nullopt;
  }
  std::uint64_t offset = codec::kMagicLen;

  // 2. Header.
  std::uint64_t raw_index = 0;
  if (!codec::read_u64(in, raw_index)) {
    err = eof_error(path, "manifest index");
    return std::nullopt;
  }
  if (!fits_size_t(raw_index)) {
    err = make_error(ErrorCode::manifest_index_range, path);
    err.value = raw_index;
    return std::nullopt;
  }
  const auto manifest_index = static_cast<std::size_t>(raw_index);

  std::uint64_t count = 0;
  if (!codec::read_u64(in, count)) {
    err = eof_error(path, "entry count");
    return std::nullopt;
  }
  offset += 16;

  // 3. Index: strictly ascending, no duplicates, representable lengths.
  std::vector<FileEntry> entries;
  for (std::uint64_t i = 0; i < count; ++i) {
    FileEntry entry;
    if (!codec::read_hash(in, entry.hash) || !codec::read_u64(in, entry.length)) {
      err = eof_error(path, "index entry " + std::to_string(i));
      return std::nullopt;
    }
    offset += kHashLen + 8;

    if (!fits_size_t(entry.length)) {
      err = make_error(ErrorCode::file_length_range, path);
      err.value = entry.length;
      return std::nullopt;
    }

    if (!entries.empty()) {
      const Hash& last = entries.back().hash;
      if (entry.hash < last) {
        err = make_error(ErrorCode::file_hash_order, path);
        err.hash = entry.hash;
        return std::nullopt;
      }
      if (entry.hash == last) {
        err = make_error(ErrorCode::file_hash_duplicated, path);
        err.hash = entry.hash;
        return std::nullopt;
      }
    }

    entries.push_back(entry);
  }

  if (manifest_index >= entries.size()) {
    err = make_error(ErrorCode::manifest_index_out_of_bounds, path);
    err.value = manifest_index;
    return std::nullopt;
  }
  const Hash manifest_hash = entries[manifest_index].hash;

  // 4. Blobs, each authenticated before it enters the file map.
  Package package;
  for (const auto& entry : entries) {
    const std::uint64_t remaining = file_len > offset ? file_len - offset : 0;
    if (entry.length > remaining) {
      err = eof_error(path, "blob " + to_hex(entry.hash));
      return std::nullopt;
    }

    std::string buffer(static_cast<std::size_t>(entry.length), '\0');
    if (codec::read_fully(in, buffer.data(), buffer.size()) != buffer.size()) {
      err = eof_error(path, "blob " + to_hex(entry.hash));
      return std::nullopt;
    }
    offset += entry.length;

    const Hash actual = blake3(buffer);
    if (actual != entry.hash) {
      err = make_error(ErrorCode::file_hash_invalid, path);
      err.hash = entry.hash;
      err.actual = actual;
      return std::nullopt;
    }

    ev.bytes += entry.length;
    package.files.emplace(entry.hash, std::move(buffer));
  }
  ev.files = package.files.size();

  // 5. Exact consumption.
  if (offset != file_len) {
    err = make_error(ErrorCode::trailing_bytes, path);
    err.value = file_len > offset ? file_len - offset : 0;
    return std::nullopt;
  }

  // 6. Manifest decode and consistency check.
  auto manifest = decode_manifest(package.files.at(manifest_hash), &err);
  if (!manifest) {
    err.path = path;
    return std::nullopt;
  }

  if (!verify_manifest(*manifest, manifest_hash, package.files, &err)) {
    err.path = path;
    return std::nullopt;
  }

  package.manifest = std::move(*manifest);
  return package;
}

// ---------------------------------------------------------------------------
// Writer
// ---------------------------------------------------------------------------

bool copy_file_into(const std::string& source, std::ostream& out, PackageError& err) {
  std::ifstream in(source, std::ios::binary);
  if (!in) {
    err = make_error(ErrorCode::file_io, source);
    err.detail = "cannot open";
    return false;
  }

  std::vector<char> buffer(kCopyBufferSize);
  while (in.good()) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const std::streamsize count = in.gcount();
    if (count > 0) {
      out.write(buffer.data(), count);
      if (!out) {
        err = make_error(ErrorCode::io_copy, source);
        err.detail = "write failed";
        return false;
      }
    }
  }
  if (in.bad()) {
    err = make_error(ErrorCode::io_copy, source);
    err.detail = "read failed";
    return false;
  }
  return true;
}

bool save_impl(const std::map<std::string, FileEntry>& files, const Manifest& manifest,
               const std::string& output, const std::string& root, PackageError& err,
               PackageEvent& ev) {
  const std::string manifest_bytes = encode_manifest(manifest);
  const Hash manifest_hash = blake3(manifest_bytes);

  // Keyed by hash: std::map gives the canonical ascending order and collapses
  // blobs with identical content into one entry.
  std::map<Hash, std::uint64_t> index;
  std::map<Hash, const std::string*> sources;
  for (const auto& [relative, entry] : files) {
    index.emplace(entry.hash, entry.length);
    sources.emplace(entry.hash, &relative);
  }
  index[manifest_hash] = manifest_bytes.size();

  const auto manifest_pos =
      static_cast<std::uint64_t>(std::distance(index.begin(), index.find(manifest_hash)));

  std::ofstream out(output, std::ios::binary | std::ios::trunc);
  if (!out) {
    err = make_error(ErrorCode::io_error, output);
    err.detail = "cannot create";
    return false;
  }

  codec::write_magic(out);
  codec::write_u64(out, manifest_pos);
  codec::write_u64(out, index.size());
  for (const auto& [hash, length] : index) {
    codec::write_hash(out, hash);
    codec::write_u64(out, length);
  }
  if (!out) {
    err = make_error(ErrorCode::io_error, output);
    err.detail = "write failed";
    return false;
  }

  for (const auto& [hash, length] : index) {
    if (hash == manifest_hash) {
      out.write(manifest_bytes.data(), static_cast<std::streamsize>(manifest_bytes.size()));
      if (!out) {
        err = make_error(ErrorCode::io_error, output);
        err.detail = "write failed";
        return false;
      }
    } else {
      const std::string source = (fs::path(root) / *sources.at(hash)).string();
      if (!copy_file_into(source, out, err)) return false;
    }
    ev.bytes += length;
  }

  out.flush();
  if (!out) {
    err = make_error(ErrorCode::io_error, output);
    err.detail = "flush failed";
    return false;
  }
  ev.files = index.size();
  return true;
}

// Decimal page index, optional leading '+'. Anything else is not a page.
std::optional<std::size_t> parse_page_index(const std::string& path) {
  const char* first = path.data();
  const char* last = path.data() + path.size();
  if (first != last && *first == '+') ++first;
  if (first == last) return std::nullopt;
  std::size_t value = 0;
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last) return std::nullopt;
  return value;
}

const std::string& blob(const Package& package, const Hash& hash) {
  auto it = package.files.find(hash);
  if (it == package.files.end()) {
    throw std::logic_error("package has no blob for manifest hash " + to_hex(hash));
  }
  return it->second;
}

struct ContentType {
  const char* extension;
  const char* type;
};

constexpr ContentType kContentTypes[] = {
    {"css", "text/css"},
    {"csv", "text/csv"},
    {"gif", "image/gif"},
    {"htm", "text/html"},
    {"html", "text/html"},
    {"ico", "image/x-icon"},
    {"jpeg", "image/jpeg"},
    {"jpg", "image/jpeg"},
    {"js", "text/javascript"},
    {"json", "application/json"},
    {"map", "application/json"},
    {"md", "text/markdown"},
    {"mjs", "text/javascript"},
    {"mp3", "audio/mpeg"},
    {"mp4", "video/mp4"},
    {"otf", "font/otf"},
    {"pdf", "application/pdf"},
    {"png", "image/png"},
    {"svg", "image/svg+xml"},
    {"ttf", "font/ttf"},
    {"txt", "text/plain"},
    {"wasm", "application/wasm"},
    {"webm", "video/webm"},
    {"webp", "image/webp"},
    {"woff", "font/woff"},
    {"woff2", "font/woff2"},
    {"xml", "text/xml"},
};

}  // namespace

std::optional<Package> load_package(const std::string& path, PackageError* error) {
  PackageEvent ev;
  ev.operation = "load";
  ev.path = path;

  PackageError err;
  std::optional<Package> package;
  {
    ScopeTimer timer(ev.duration_ns);
    package = load_impl(path, err, ev);
  }

  ev.ok = package.has_value();
  ev.error_code = to_string(err.code);
  emit_package_event(ev);

  if (!package && error) *error = err;
  return package;
}

bool save_package(const std::map<std::string, FileEntry>& files, const Manifest& manifest,
                  const std::string& output, const std::string& root, PackageError* error) {
  PackageEvent ev;
  ev.operation = "save";
  ev.path = output;

  PackageError err;
  bool ok = false;
  {
    ScopeTimer timer(ev.duration_ns);
    ok = save_impl(files, manifest, output, root, err, ev);
  }

  ev.ok = ok;
  ev.error_code = to_string(err.code);
  emit_package_event(ev);

  if (!ok && error) *error = err;
  return ok;
}

std::optional<Resource> resolve_file(const Package& package, const std::string& path) {
  if (const auto* app = std::get_if<AppManifest>(&package.manifest)) {
    auto it = app->paths.find(path);
    if (it == app->paths.end()) return std::nullopt;
    return Resource{guess_content_type(path), blob(package, it->second)};
  }

  const auto& pages = std::get<ComicManifest>(package.manifest).pages;
  const auto index = parse_page_index(path);
  if (!index || *index >= pages.size()) return std::nullopt;
  return Resource{"image/jpeg", blob(package, pages[*index])};
}

std::string guess_content_type(const std::string& path) {
  const auto slash = path.find_last_of('/');
  const auto dot = path.find_last_of('.');
  if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
    return "application/octet-stream";
  }
  std::string ext = path.substr(dot + 1);
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  for (const auto& ct : kContentTypes) {
    if (ext == ct.extension) return ct.type;
  }
  return "application/octet-stream";
}

}  // namespace mediapkg

#include "mediapkg/manifest.hpp"

#include <cstdint>
#include <sstream>

#include "mediapkg/jsonlite.hpp"

namespace mediapkg {

namespace {

// CBOR major types used by the manifest encoding.
constexpr std::uint8_t kMajorBytes = 2;
constexpr std::uint8_t kMajorText = 3;
constexpr std::uint8_t kMajorArray = 4;
constexpr std::uint8_t kMajorMap = 5;

// Shortest-form head: the argument is stored inline below 24, otherwise in
// the smallest of 1, 2, 4 or 8 big-endian bytes that holds it.
void put_head(std::string& out, std::uint8_t major, std::uint64_t arg) {
  const auto ib = static_cast<char>(major << 5);
  if (arg < 24) {
    out += static_cast<char>(ib | static_cast<char>(arg));
    return;
  }
  int width;
  if (arg <= 0xff) {
    out += static_cast<char>(ib | 24);
    width = 1;
  } else if (arg <= 0xffff) {
    out += static_cast<char>(ib | 25);
    width = 2;
  } else if (arg <= 0xffffffffULL) {
    out += static_cast<char>(ib | 26);
    width = 4;
  } else {
    out += static_cast<char>(ib | 27);
    width = 8;
  }
  for (int i = width - 1; i >= 0; --i) {
    out += static_cast<char>((arg >> (8 * i)) & 0xff);
  }
}

void put_text(std::string& out, const std::string& s) {
  put_head(out, kMajorText, s.size());
  out += s;
}

void put_hash(std::string& out, const Hash& h) {
  put_head(out, kMajorBytes, h.size());
  out.append(reinterpret_cast<const char*>(h.data()), h.size());
}

struct Decoder {
  const std::string& s;
  std::size_t i{0};
  std::string err;

  bool fail(const std::string& message) {
    if (err.empty()) err = message + " at offset " + std::to_string(i);
    return false;
  }

  bool head(std::uint8_t expected_major, std::uint64_t& arg) {
    if (i >= s.size()) return fail("unexpected end of manifest");
    const auto ib = static_cast<std::uint8_t>(s[i]);
    const std::uint8_t major = ib >> 5;
    const std::uint8_t info = ib & 0x1f;
    if (major != expected_major) {
      return fail("expected major type " + std::to_string(expected_major) + ", found " +
                  std::to_string(major));
    }
    ++i;
    if (info < 24) {
      arg = info;
      return true;
    }
    int width;
    std::uint64_t min;
    switch (info) {
      case 24: width = 1; min = 24; break;
      case 25: width = 2; min = 0x100; break;
      case 26: width = 4; min = 0x10000; break;
      case 27: width = 8; min = 0x100000000ULL; break;
      default: return fail("indefinite or reserved length");
    }
    if (s.size() - i < static_cast<std::size_t>(width)) return fail("unexpected end of manifest");
    arg = 0;
    for (int k = 0; k < width; ++k) {
      arg = (arg << 8) | static_cast<std::uint8_t>(s[i++]);
    }
    if (arg < min) return fail("non-canonical length");
    return true;
  }

  bool text(std::string& out) {
    std::uint64_t len = 0;
    if (!head(kMajorText, len)) return false;
    if (len > s.size() - i) return fail("text string runs past end of manifest");
    out.assign(s, i, static_cast<std::size_t>(len));
    i += static_cast<std::size_t>(len);
    return true;
  }

  bool key(const char* want) {
    std::string k;
    if (!text(k)) return false;
    if (k != want) return fail(std::string("expected key \"") + want + "\", found \"" + k + "\"");
    return true;
  }

  bool type(Type& out) {
    std::string name;
    if (!text(name)) return false;
    auto t = type_from_string(name);
    if (!t) return fail("unknown type \"" + name + "\"");
    out = *t;
    return true;
  }

  bool hash(Hash& out) {
    std::uint64_t len = 0;
    if (!head(kMajorBytes, len)) return false;
    if (len != out.size()) return fail("hash must be 32 bytes, found " + std::to_string(len));
    if (s.size() - i < out.size()) return fail("hash runs past end of manifest");
    for (auto& b : out) b = static_cast<std::uint8_t>(s[i++]);
    return true;
  }

  std::optional<Manifest> manifest() {
    std::uint64_t fields = 0;
    if (!head(kMajorMap, fields)) return std::nullopt;
    if (!key("type")) return std::nullopt;
    Type ty{Type::app};
    if (!type(ty)) return std::nullopt;

    if (ty == Type::app) {
      if (fields != 3) {
        fail("app manifest must have 3 fields");
        return std::nullopt;
      }
      AppManifest app;
      if (!key("handles") || !type(app.handles)) return std::nullopt;
      if (!key("paths")) return std::nullopt;
      std::uint64_t n = 0;
      if (!head(kMajorMap, n)) return std::nullopt;
      for (std::uint64_t k = 0; k < n; ++k) {
        std::string path;
        Hash h{};
        if (!text(path) || !hash(h)) return std::nullopt;
        if (!app.paths.empty() && !(app.paths.rbegin()->first < path)) {
          fail("paths not in canonical order");
          return std::nullopt;
        }
        app.paths.emplace_hint(app.paths.end(), std::move(path), h);
      }
      return Manifest{std::move(app)};
    }

    if (fields != 2) {
      fail("comic manifest must have 2 fields");
      return std::nullopt;
    }
    ComicManifest comic;
    if (!key("pages")) return std::nullopt;
    std::uint64_t n = 0;
    if (!head(kMajorArray, n)) return std::nullopt;
    for (std::uint64_t k = 0; k < n; ++k) {
      Hash h{};
      if (!hash(h)) return std::nullopt;
      comic.pages.push_back(h);
    }
    return Manifest{std::move(comic)};
  }
};

}  // namespace

Type manifest_type(const Manifest& manifest) {
  return std::holds_alternative<AppManifest>(manifest) ? Type::app : Type::comic;
}

std::set<Hash> manifest_references(const Manifest& manifest) {
  std::set<Hash> out;
  if (const auto* app = std::get_if<AppManifest>(&manifest)) {
    for (const auto& [path, hash] : app->paths) {
      (void)path;
      out.insert(hash);
    }
  } else {
    const auto& comic = std::get<ComicManifest>(manifest);
    out.insert(comic.pages.begin(), comic.pages.end());
  }
  return out;
}

std::string encode_manifest(const Manifest& manifest) {
  std::string out;
  if (const auto* app = std::get_if<AppManifest>(&manifest)) {
    put_head(out, kMajorMap, 3);
    put_text(out, "type");
    put_text(out, to_string(Type::app));
    put_text(out, "handles");
    put_text(out, to_string(app->handles));
    put_text(out, "paths");
    put_head(out, kMajorMap, app->paths.size());
    for (const auto& [path, hash] : app->paths) {
      put_text(out, path);
      put_hash(out, hash);
    }
  } else {
    const auto& comic = std::get<ComicManifest>(manifest);
    put_head(out, kMajorMap, 2);
    put_text(out, "type");
    put_text(out, to_string(Type::comic));
    put_text(out, "pages");
    put_head(out, kMajorArray, comic.pages.size());
    for (const auto& hash : comic.pages) {
      put_hash(out, hash);
    }
  }
  return out;
}

std::optional<Manifest> decode_manifest(const std::string& bytes, PackageError* error) {
  Decoder d{bytes};
  auto manifest = d.manifest();
  if (manifest && d.i != bytes.size()) {
    d.fail("trailing data");
    manifest.reset();
  }
  if (!manifest) {
    if (error) {
      *error = PackageError{};
      error->code = ErrorCode::manifest_deserialize;
      error->detail = d.err;
    }
    return std::nullopt;
  }
  return manifest;
}

bool verify_manifest(const Manifest& manifest, const Hash& manifest_hash,
                     const std::map<Hash, std::string>& files, PackageError* error) {
  std::set<Hash> referenced = manifest_references(manifest);
  referenced.insert(manifest_hash);

  std::uint64_t extra = 0;
  for (const auto& [hash, bytes] : files) {
    (void)bytes;
    if (!referenced.contains(hash)) ++extra;
  }

  std::uint64_t missing = 0;
  for (const auto& hash : referenced) {
    if (!files.contains(hash)) ++missing;
  }

  if (extra == 0 && missing == 0) return true;

  if (error) {
    *error = PackageError{};
    error->code = extra > 0 ? ErrorCode::manifest_extra_files : ErrorCode::manifest_missing_files;
    error->value = extra > 0 ? extra : missing;
  }
  return false;
}

std::string manifest_to_json(const Manifest& manifest) {
  std::ostringstream o;
  if (const auto* app = std::get_if<AppManifest>(&manifest)) {
    o << "{\"type\":\"app\",\"handles\":\"" << to_string(app->handles) << "\",\"paths\":{";
    bool first = true;
    for (const auto& [path, hash] : app->paths) {
      if (!first) o << ",";
      first = false;
      o << "\"" << jsonlite::escape(path) << "\":\"" << to_hex(hash) << "\"";
    }
    o << "}}";
  } else {
    o << "{\"type\":\"comic\",\"pages\":[";
    const auto& pages = std::get<ComicManifest>(manifest).pages;
    for (std::size_t i = 0; i < pages.size(); ++i) {
      if (i > 0) o << ",";
      o << "\"" << to_hex(pages[i]) << "\"";
    }
    o << "]}";
  }
  return o.str();
}

}  // namespace mediapkg

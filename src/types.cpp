#include "mediapkg/types.hpp"

#include <sstream>

namespace mediapkg {

namespace {

// Lossy rendering of raw bytes for diagnostics: printable ASCII kept, the rest
// replaced with '?'.
std::string printable(const std::string& bytes) {
  std::string out;
  out.reserve(bytes.size());
  for (unsigned char c : bytes) {
    out += (c >= 0x20 && c < 0x7f) ? static_cast<char>(c) : '?';
  }
  return out;
}

std::string bytes_hex(const std::string& bytes) {
  static const char* hc = "0123456789abcdef";
  std::string out;
  for (unsigned char c : bytes) {
    out.push_back(hc[c >> 4]);
    out.push_back(hc[c & 0xf]);
  }
  return out;
}

}  // namespace

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::io_error: return "io_error";
    case ErrorCode::file_io: return "file_io";
    case ErrorCode::io_copy: return "io_copy";
    case ErrorCode::unexpected_eof: return "unexpected_eof";
    case ErrorCode::magic_bytes: return "magic_bytes";
    case ErrorCode::manifest_index_range: return "manifest_index_range";
    case ErrorCode::manifest_index_out_of_bounds: return "manifest_index_out_of_bounds";
    case ErrorCode::file_hash_order: return "file_hash_order";
    case ErrorCode::file_hash_duplicated: return "file_hash_duplicated";
    case ErrorCode::file_length_range: return "file_length_range";
    case ErrorCode::file_hash_invalid: return "file_hash_invalid";
    case ErrorCode::trailing_bytes: return "trailing_bytes";
    case ErrorCode::manifest_deserialize: return "manifest_deserialize";
    case ErrorCode::manifest_extra_files: return "manifest_extra_files";
    case ErrorCode::manifest_missing_files: return "manifest_missing_files";
    case ErrorCode::output_in_root: return "output_in_root";
    case ErrorCode::output_is_dir: return "output_is_dir";
    case ErrorCode::metadata_missing: return "metadata_missing";
    case ErrorCode::metadata_invalid: return "metadata_invalid";
    case ErrorCode::index_missing: return "index_missing";
    case ErrorCode::no_pages: return "no_pages";
    case ErrorCode::page_missing: return "page_missing";
    case ErrorCode::page_duplicated: return "page_duplicated";
    case ErrorCode::unexpected_file: return "unexpected_file";
    case ErrorCode::invalid_page: return "invalid_page";
    case ErrorCode::package_load: return "package_load";
    case ErrorCode::app_type: return "app_type";
    case ErrorCode::content_type: return "content_type";
    case ErrorCode::bind_failed: return "bind_failed";
  }
  return "";
}

std::string to_string(Type type) {
  switch (type) {
    case Type::app: return "app";
    case Type::comic: return "comic";
  }
  return "";
}

std::optional<Type> type_from_string(const std::string& name) {
  if (name == "app") return Type::app;
  if (name == "comic") return Type::comic;
  return std::nullopt;
}

std::string PackageError::message() const {
  std::ostringstream o;
  switch (code) {
    case ErrorCode::none:
      break;
    case ErrorCode::io_error:
      o << "I/O error on `" << path << "`";
      break;
    case ErrorCode::file_io:
      o << "I/O error reading file `" << path << "`";
      break;
    case ErrorCode::io_copy:
      o << "I/O error copying from `" << path << "`";
      break;
    case ErrorCode::unexpected_eof:
      o << "unexpected end of package `" << path << "`";
      break;
    case ErrorCode::magic_bytes:
      o << "unexpected package magic bytes " << bytes_hex(bytes) << " (\""
        << printable(bytes) << "\")";
      break;
    case ErrorCode::manifest_index_range:
      o << "could not convert manifest index " << value << " to size_t";
      break;
    case ErrorCode::manifest_index_out_of_bounds:
      o << "manifest index " << value << " out of bounds of hash array";
      break;
    case ErrorCode::file_hash_order:
      o << "package file hash `" << to_hex(hash) << "` out of order";
      break;
    case ErrorCode::file_hash_duplicated:
      o << "package file hash `" << to_hex(hash) << "` duplicated";
      break;
    case ErrorCode::file_length_range:
      o << "package file length `" << value << "` cannot be converted to size_t";
      break;
    case ErrorCode::file_hash_invalid:
      o << "package file hash actually `" << to_hex(actual) << "` but expected `"
        << to_hex(hash) << "`";
      break;
    case ErrorCode::trailing_bytes:
      o << "package has trailing " << value << " bytes";
      break;
    case ErrorCode::manifest_deserialize:
      o << "failed to deserialize manifest";
      break;
    case ErrorCode::manifest_extra_files:
      o << "package contains " << value << " extra files not accounted for in manifest";
      break;
    case ErrorCode::manifest_missing_files:
      o << "package missing " << value << " files from manifest";
      break;
    case ErrorCode::output_in_root:
      o << "output `" << path << "` may not be inside of root `" << root << "`";
      break;
    case ErrorCode::output_is_dir:
      o << "output `" << path << "` is a directory";
      break;
    case ErrorCode::metadata_missing:
      o << "metadata missing from `" << root << "`";
      break;
    case ErrorCode::metadata_invalid:
      o << "invalid metadata `" << path << "`";
      break;
    case ErrorCode::index_missing:
      o << "app in `" << root << "` has no index.html";
      break;
    case ErrorCode::no_pages:
      o << "comic in `" << root << "` has no pages";
      break;
    case ErrorCode::page_missing:
      o << "comic missing page " << value;
      break;
    case ErrorCode::page_duplicated:
      o << "comic page " << value << " duplicated";
      break;
    case ErrorCode::unexpected_file:
      o << "unexpected file `" << path << "` in " << to_string(type) << " package";
      break;
    case ErrorCode::invalid_page:
      o << "invalid page `" << path << "`";
      break;
    case ErrorCode::package_load:
      o << "failed to load package `" << path << "`";
      break;
    case ErrorCode::app_type:
      o << "app package has type `" << to_string(type) << "`";
      break;
    case ErrorCode::content_type:
      o << "app handles `" << to_string(handles) << "` but content has type `"
        << to_string(type) << "`";
      break;
    case ErrorCode::bind_failed:
      o << "failed to bind `" << path << "`";
      break;
  }
  if (!detail.empty()) o << ": " << detail;
  return o.str();
}

}  // namespace mediapkg

#pragma once

// mediapkg/types.hpp - Error taxonomy and shared value types.
//
// Errors are reported as values: operations return std::optional<T> or bool
// and fill a caller-supplied PackageError. The first violation aborts the
// whole operation; there is no partial result.

#include <cstdint>
#include <optional>
#include <string>

#include "mediapkg/hash.hpp"

namespace mediapkg {

enum class ErrorCode {
  none,
  // I/O
  io_error,
  file_io,
  io_copy,
  unexpected_eof,
  // Package loader
  magic_bytes,
  manifest_index_range,
  manifest_index_out_of_bounds,
  file_hash_order,
  file_hash_duplicated,
  file_length_range,
  file_hash_invalid,
  trailing_bytes,
  manifest_deserialize,
  manifest_extra_files,
  manifest_missing_files,
  // Packager
  output_in_root,
  output_is_dir,
  metadata_missing,
  metadata_invalid,
  index_missing,
  no_pages,
  page_missing,
  page_duplicated,
  unexpected_file,
  invalid_page,
  // Server
  package_load,
  app_type,
  content_type,
  bind_failed,
};

std::string to_string(ErrorCode code);

// Kind of resource a package holds. An app package also names the Type of
// content it can present.
enum class Type {
  app,
  comic,
};

std::string to_string(Type type);
std::optional<Type> type_from_string(const std::string& name);

struct PackageError {
  ErrorCode code{ErrorCode::none};

  std::string path;    // file the error refers to (source, output, package)
  std::string root;    // packaging root
  Hash hash{};         // offending or expected hash
  Hash actual{};       // computed hash for file_hash_invalid
  std::uint64_t value{0};  // index, length, page or byte/file count
  std::string bytes;   // magic bytes actually read
  Type type{Type::app};
  Type handles{Type::app};
  std::string detail;  // decoder message or underlying error text
  ErrorCode cause{ErrorCode::none};  // underlying code for package_load

  explicit operator bool() const { return code != ErrorCode::none; }

  // Human-readable rendering with every diagnostic field relevant to `code`.
  std::string message() const;
};

}  // namespace mediapkg

#pragma once

// mediapkg/codec.hpp - Fixed-width primitives of the package file format.
//
// Layout (byte-exact):
//   magic marker     10 bytes  "MEDIA📦\0"
//   manifest_index   u64 LE
//   entry_count      u64 LE
//   entry_count x { hash (32 raw bytes), length u64 LE }
//   entry_count x { blob bytes }
//
// There is no framing beyond this and no version field; the magic marker is
// the only format identifier.

#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>

#include "mediapkg/hash.hpp"

namespace mediapkg::codec {

// "MEDIA" + U+1F4E6 PACKAGE in UTF-8. The implicit terminator is part of the
// marker on disk.
inline constexpr char kMagic[] = "MEDIA\xF0\x9F\x93\xA6";
inline constexpr std::size_t kMagicLen = sizeof(kMagic);

inline std::string_view magic() { return std::string_view(kMagic, kMagicLen); }

// Append primitives to an in-memory buffer.
void append_u64(std::string& out, std::uint64_t value);
void append_hash(std::string& out, const Hash& hash);

// Write primitives to a stream. Failures surface through the stream state.
void write_magic(std::ostream& out);
void write_u64(std::ostream& out, std::uint64_t value);
void write_hash(std::ostream& out, const Hash& hash);

// Read up to `n` bytes, looping on short reads until EOF.
// Returns the number of bytes actually read.
std::size_t read_fully(std::istream& in, char* buf, std::size_t n);

// Return false if the stream ends before the field is complete.
bool read_u64(std::istream& in, std::uint64_t& out);
bool read_hash(std::istream& in, Hash& out);

// Decode a little-endian u64 from the first 8 bytes of `p`.
std::uint64_t load_u64_le(const unsigned char* p);

}  // namespace mediapkg::codec

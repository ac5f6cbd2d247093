#pragma once

// mediapkg/hash.hpp - BLAKE3 content hashing.
//
// A Hash is the raw 32-byte BLAKE3 output. It is the sole durable identifier
// of a blob inside a package. Ordering is lexicographic over the raw bytes,
// which is the canonical on-disk index order.

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mediapkg {

constexpr std::size_t kHashLen = 32;

using Hash = std::array<std::uint8_t, kHashLen>;

struct HashRuntimeInfo {
  std::string primitive;
  std::string backend;
  std::string version;
};

HashRuntimeInfo hash_runtime_info();

// Core BLAKE3 hashing
Hash blake3(std::string_view payload);
std::string blake3_hex(std::string_view payload);

// Stream-hash a file in 64 KB chunks. Returns nullopt if the file cannot be
// opened or a read fails. `len_out` receives the number of bytes hashed.
std::optional<Hash> hash_file(const std::string& path, std::uint64_t* len_out = nullptr);

// Incremental hasher for callers that feed data piecewise.
class Hasher {
 public:
  Hasher();
  ~Hasher();
  Hasher(const Hasher&) = delete;
  Hasher& operator=(const Hasher&) = delete;

  void update(const void* data, std::size_t len);
  Hash finalize() const;

 private:
  struct State;
  std::unique_ptr<State> state_;
};

std::string to_hex(const Hash& hash);

// Parse 64 hex characters (either case). Returns nullopt on bad length or digit.
std::optional<Hash> hash_from_hex(std::string_view hex);

}  // namespace mediapkg

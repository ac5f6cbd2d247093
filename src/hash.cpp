#include "mediapkg/hash.hpp"

// BLAKE3 is the only hash primitive. Package indexes, manifest references and
// content verification all depend on it; there is no fallback.

#include <fstream>

extern "C" {
#include <blake3.h>
}

namespace mediapkg {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

// Decode a single hex character to its nibble value.
// Returns 0xFF on invalid character.
inline std::uint8_t hex_nibble(char c) {
  if (c >= '0' && c <= '9') return static_cast<std::uint8_t>(c - '0');
  if (c >= 'a' && c <= 'f') return static_cast<std::uint8_t>(c - 'a' + 10);
  if (c >= 'A' && c <= 'F') return static_cast<std::uint8_t>(c - 'A' + 10);
  return 0xFF;
}

}  // namespace

struct Hasher::State {
  blake3_hasher hasher;
};

Hasher::Hasher() : state_(std::make_unique<State>()) {
  blake3_hasher_init(&state_->hasher);
}

Hasher::~Hasher() = default;

void Hasher::update(const void* data, std::size_t len) {
  blake3_hasher_update(&state_->hasher, data, len);
}

Hash Hasher::finalize() const {
  Hash out{};
  blake3_hasher_finalize(&state_->hasher, out.data(), out.size());
  return out;
}

HashRuntimeInfo hash_runtime_info() {
  HashRuntimeInfo info;
  info.primitive = "blake3";
  info.backend = "libblake3";
  info.version = blake3_version();
  return info;
}

Hash blake3(std::string_view payload) {
  Hasher hasher;
  hasher.update(payload.data(), payload.size());
  return hasher.finalize();
}

std::string blake3_hex(std::string_view payload) {
  return to_hex(blake3(payload));
}

std::optional<Hash> hash_file(const std::string& path, std::uint64_t* len_out) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return std::nullopt;
  }

  Hasher hasher;
  std::uint64_t total = 0;

  constexpr std::size_t buffer_size = 65536;
  char buffer[buffer_size];
  while (file.good()) {
    file.read(buffer, buffer_size);
    const std::streamsize count = file.gcount();
    if (count > 0) {
      hasher.update(buffer, static_cast<std::size_t>(count));
      total += static_cast<std::uint64_t>(count);
    }
  }
  if (file.bad()) {
    return std::nullopt;
  }

  if (len_out) *len_out = total;
  return hasher.finalize();
}

std::string to_hex(const Hash& hash) {
  std::string out;
  out.resize(hash.size() * 2);
  for (std::size_t i = 0; i < hash.size(); ++i) {
    out[i * 2]     = kHexChars[hash[i] >> 4];
    out[i * 2 + 1] = kHexChars[hash[i] & 0x0f];
  }
  return out;
}

std::optional<Hash> hash_from_hex(std::string_view hex) {
  if (hex.size() != kHashLen * 2) return std::nullopt;
  Hash out{};
  for (std::size_t i = 0; i < kHashLen; ++i) {
    const std::uint8_t hi = hex_nibble(hex[i * 2]);
    const std::uint8_t lo = hex_nibble(hex[i * 2 + 1]);
    if (hi == 0xFF || lo == 0xFF) return std::nullopt;
    out[i] = static_cast<std::uint8_t>((hi << 4) | lo);
  }
  return out;
}

}  // namespace mediapkg

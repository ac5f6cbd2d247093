#include "mediapkg/codec.hpp"

namespace mediapkg::codec {

namespace {

void store_u64_le(std::uint64_t value, char* out) {
  for (int i = 0; i < 8; ++i) {
    out[i] = static_cast<char>((value >> (8 * i)) & 0xff);
  }
}

}  // namespace

std::uint64_t load_u64_le(const unsigned char* p) {
  std::uint64_t v = 0;
  for (int i = 7; i >= 0; --i) {
    v = (v << 8) | p[i];
  }
  return v;
}

void append_u64(std::string& out, std::uint64_t value) {
  char buf[8];
  store_u64_le(value, buf);
  out.append(buf, sizeof(buf));
}

void append_hash(std::string& out, const Hash& hash) {
  out.append(reinterpret_cast<const char*>(hash.data()), hash.size());
}

void write_magic(std::ostream& out) {
  out.write(kMagic, static_cast<std::streamsize>(kMagicLen));
}

void write_u64(std::ostream& out, std::uint64_t value) {
  char buf[8];
  store_u64_le(value, buf);
  out.write(buf, sizeof(buf));
}

void write_hash(std::ostream& out, const Hash& hash) {
  out.write(reinterpret_cast<const char*>(hash.data()),
            static_cast<std::streamsize>(hash.size()));
}

std::size_t read_fully(std::istream& in, char* buf, std::size_t n) {
  std::size_t read = 0;
  while (read < n && in.good()) {
    in.read(buf + read, static_cast<std::streamsize>(n - read));
    const std::streamsize got = in.gcount();
    if (got <= 0) break;
    read += static_cast<std::size_t>(got);
  }
  return read;
}

bool read_u64(std::istream& in, std::uint64_t& out) {
  unsigned char buf[8];
  if (read_fully(in, reinterpret_cast<char*>(buf), sizeof(buf)) != sizeof(buf)) {
    return false;
  }
  out = load_u64_le(buf);
  return true;
}

bool read_hash(std::istream& in, Hash& out) {
  return read_fully(in, reinterpret_cast<char*>(out.data()), out.size()) == out.size();
}

}  // namespace mediapkg::codec

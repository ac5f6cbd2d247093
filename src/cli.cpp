#include <charconv>
#include <cstdint>
#include <iostream>
#include <map>
#include <string>

#include "mediapkg/hash.hpp"
#include "mediapkg/jsonlite.hpp"
#include "mediapkg/manifest.hpp"
#include "mediapkg/package.hpp"
#include "mediapkg/packager.hpp"
#include "mediapkg/server.hpp"
#include "mediapkg/version.hpp"

namespace {

int report(const mediapkg::PackageError &err) {
  std::cerr << "{\"error\":\"" << mediapkg::to_string(err.code)
            << "\",\"message\":\"" << mediapkg::jsonlite::escape(err.message())
            << "\"}\n";
  return 2;
}

int usage_error(const std::string &message) {
  std::cerr << "{\"error\":\"usage\",\"message\":\""
            << mediapkg::jsonlite::escape(message) << "\"}\n";
  return 2;
}

// Collect `--flag value` pairs after the subcommand. A flag with no value
// following it is returned in `missing`.
std::map<std::string, std::string> parse_flags(int argc, char **argv,
                                               std::string &missing) {
  std::map<std::string, std::string> flags;
  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg.rfind("--", 0) != 0)
      continue;
    if (i + 1 >= argc || std::string(argv[i + 1]).rfind("--", 0) == 0) {
      if (missing.empty())
        missing = arg;
      continue;
    }
    flags[arg.substr(2)] = argv[++i];
  }
  return flags;
}

// "host:port", "[v6]:port". Returns false on a missing or out-of-range port.
bool parse_address(const std::string &text, std::string &host,
                   std::uint16_t &port) {
  const auto colon = text.rfind(':');
  if (colon == std::string::npos || colon + 1 == text.size())
    return false;
  host = text.substr(0, colon);
  if (host.size() >= 2 && host.front() == '[' && host.back() == ']')
    host = host.substr(1, host.size() - 2);
  const char *first = text.data() + colon + 1;
  const char *last = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(first, last, port);
  return ec == std::errc() && ptr == last && !host.empty();
}

// Known BLAKE3 test vectors
bool verify_hash_vectors() {
  if (mediapkg::blake3_hex("") !=
      "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262") {
    return false;
  }
  if (mediapkg::blake3_hex("hello") !=
      "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f") {
    return false;
  }
  return true;
}

} // namespace

int main(int argc, char **argv) {
  if (argc < 2)
    return 1;
  const std::string cmd = argv[1];
  std::string missing_value;
  auto flags = parse_flags(argc, argv, missing_value);
  const bool takes_flags = cmd == "package" || cmd == "server" ||
                           cmd == "verify" || cmd == "hash";
  if (takes_flags && !missing_value.empty())
    return usage_error("flag " + missing_value + " has no value");

  if (cmd == "health") {
    const auto h = mediapkg::hash_runtime_info();
    std::cout << "{\"hash_primitive\":\"" << h.primitive
              << "\",\"hash_backend\":\"" << h.backend
              << "\",\"hash_version\":\"" << h.version
              << "\",\"hash_vectors_ok\":"
              << (verify_hash_vectors() ? "true" : "false") << "}\n";
    return 0;
  }

  if (cmd == "version") {
    auto manifest = mediapkg::version::current_manifest(PROJECT_VERSION);
    std::cout << mediapkg::version::manifest_to_json(manifest) << "\n";
    return 0;
  }

  if (cmd == "hash") {
    if (!flags.contains("file"))
      return usage_error("hash requires --file");
    std::uint64_t len = 0;
    auto h = mediapkg::hash_file(flags["file"], &len);
    if (!h) {
      mediapkg::PackageError err;
      err.code = mediapkg::ErrorCode::io_error;
      err.path = flags["file"];
      return report(err);
    }
    std::cout << "{\"hash\":\"" << mediapkg::to_hex(*h)
              << "\",\"length\":" << len << "}\n";
    return 0;
  }

  if (cmd == "package") {
    if (!flags.contains("root") || !flags.contains("output"))
      return usage_error("package requires --root and --output");
    mediapkg::PackageError err;
    if (!mediapkg::package_directory(flags["root"], flags["output"], &err))
      return report(err);
    std::cout << "{\"ok\":true,\"output\":\""
              << mediapkg::jsonlite::escape(flags["output"]) << "\"}\n";
    return 0;
  }

  if (cmd == "verify") {
    if (!flags.contains("package"))
      return usage_error("verify requires --package");
    mediapkg::PackageError err;
    auto package = mediapkg::load_package(flags["package"], &err);
    if (!package)
      return report(err);
    std::uint64_t bytes = 0;
    for (const auto &[hash, blob] : package->files) {
      (void)hash;
      bytes += blob.size();
    }
    std::cout << "{\"ok\":true,\"type\":\""
              << mediapkg::to_string(mediapkg::manifest_type(package->manifest))
              << "\",\"files\":" << package->files.size()
              << ",\"bytes\":" << bytes << ",\"manifest\":"
              << mediapkg::manifest_to_json(package->manifest) << "}\n";
    return 0;
  }

  if (cmd == "server") {
    if (!flags.contains("address") || !flags.contains("app") ||
        !flags.contains("content"))
      return usage_error("server requires --address, --app and --content");
    mediapkg::ServerConfig config;
    if (!parse_address(flags["address"], config.address, config.port))
      return usage_error("invalid address `" + flags["address"] + "`");
    config.app_package = flags["app"];
    config.content_package = flags["content"];

    mediapkg::PackageError err;
    auto server = mediapkg::Server::open(config, &err);
    if (!server)
      return report(err);
    if (!server->serve(&err))
      return report(err);
    return 0;
  }

  std::cerr << "{\"error\":\"unknown_command\",\"message\":\""
            << mediapkg::jsonlite::escape(cmd) << "\"}\n";
  return 1;
}

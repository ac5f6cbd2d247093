#include "mediapkg/version.hpp"

#include <sstream>

#include "mediapkg/hash.hpp"

namespace mediapkg {
namespace version {

VersionManifest current_manifest(const std::string& semver) {
  VersionManifest m;
  m.semver = semver.empty() ? "0.1.0" : semver;
  m.hash_primitive = hash_runtime_info().primitive;
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"package_format\":" << m.package_format
    << ",\"manifest_encoding\":" << m.manifest_encoding
    << ",\"hash_algorithm\":" << m.hash_algorithm
    << ",\"semver\":\"" << m.semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

}  // namespace version
}  // namespace mediapkg

#pragma once

// mediapkg/jsonlite.hpp - Minimal strict JSON reader and string escaping.
//
// Used for package metadata (metadata.json) and for JSON output of the CLI,
// server and event log. Objects are std::map so iteration is key-sorted.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mediapkg::jsonlite {

struct JsonError {
  std::string code;
  std::string message;
};

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Object, Array> v;
};

// Parse a JSON object. Duplicate keys and trailing data are errors.
// Returns an empty object and sets *error on failure.
Object parse(const std::string& text, std::optional<JsonError>* error);

std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool has_key(const Object& obj, const std::string& key);

std::string escape(const std::string& s);

}  // namespace mediapkg::jsonlite

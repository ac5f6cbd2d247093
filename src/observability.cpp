#include "mediapkg/observability.hpp"

#include <cstdio>
#include <cstdlib>

#include "mediapkg/jsonlite.hpp"

namespace mediapkg {

std::string event_to_json(const PackageEvent& ev) {
  std::string line;
  line.reserve(256);
  line += "{\"operation\":\"";
  line += jsonlite::escape(ev.operation);
  line += "\",\"path\":\"";
  line += jsonlite::escape(ev.path);
  line += "\",\"ok\":";
  line += ev.ok ? "true" : "false";
  line += ",\"error_code\":\"";
  line += ev.error_code;
  line += "\",\"duration_ns\":";
  line += std::to_string(ev.duration_ns);
  line += ",\"files\":";
  line += std::to_string(ev.files);
  line += ",\"bytes\":";
  line += std::to_string(ev.bytes);
  if (ev.status != 0) {
    line += ",\"status\":";
    line += std::to_string(ev.status);
  }
  line += '}';
  return line;
}

// ---------------------------------------------------------------------------
// PackageStats
// ---------------------------------------------------------------------------

void PackageStats::record(const PackageEvent& ev) {
  if (ev.operation == "load") {
    loads.fetch_add(1, std::memory_order_relaxed);
    if (!ev.ok) load_failures.fetch_add(1, std::memory_order_relaxed);
  } else if (ev.operation == "save") {
    saves.fetch_add(1, std::memory_order_relaxed);
    if (!ev.ok) save_failures.fetch_add(1, std::memory_order_relaxed);
  } else if (ev.operation == "package") {
    packaged.fetch_add(1, std::memory_order_relaxed);
    if (!ev.ok) package_failures.fetch_add(1, std::memory_order_relaxed);
  } else if (ev.operation == "serve") {
    requests.fetch_add(1, std::memory_order_relaxed);
    if (ev.status == 404) not_found.fetch_add(1, std::memory_order_relaxed);
    if (ev.ok) bytes_served.fetch_add(ev.bytes, std::memory_order_relaxed);
  }
}

std::string PackageStats::to_json() const {
  std::string out;
  out.reserve(256);
  out += "{\"loads\":";
  out += std::to_string(loads.load(std::memory_order_relaxed));
  out += ",\"load_failures\":";
  out += std::to_string(load_failures.load(std::memory_order_relaxed));
  out += ",\"saves\":";
  out += std::to_string(saves.load(std::memory_order_relaxed));
  out += ",\"save_failures\":";
  out += std::to_string(save_failures.load(std::memory_order_relaxed));
  out += ",\"packaged\":";
  out += std::to_string(packaged.load(std::memory_order_relaxed));
  out += ",\"package_failures\":";
  out += std::to_string(package_failures.load(std::memory_order_relaxed));
  out += ",\"requests\":";
  out += std::to_string(requests.load(std::memory_order_relaxed));
  out += ",\"not_found\":";
  out += std::to_string(not_found.load(std::memory_order_relaxed));
  out += ",\"bytes_served\":";
  out += std::to_string(bytes_served.load(std::memory_order_relaxed));
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// Global singleton + event emission
// ---------------------------------------------------------------------------

PackageStats& global_package_stats() {
  static PackageStats inst;
  return inst;
}

namespace {
std::atomic<PackageEventHook> g_event_hook{nullptr};
}

void set_package_event_hook(PackageEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void emit_package_event(const PackageEvent& ev) {
  global_package_stats().record(ev);

  PackageEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  const char* log_path = std::getenv("MEDIAPKG_EVENT_LOG");
  if (!log_path || !log_path[0]) return;

  std::string line = event_to_json(ev);
  line += '\n';

  // O_APPEND keeps concurrent single-line writes intact on POSIX.
  if (FILE* f = std::fopen(log_path, "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace mediapkg

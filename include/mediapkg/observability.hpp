#pragma once

// mediapkg/observability.hpp - Package events and process-wide counters.
//
// Every load, save, packaging run and served request emits one PackageEvent.
// Events are:
//   - always recorded in the global PackageStats counters;
//   - forwarded to an installed hook if one is set, otherwise
//   - appended as one JSON line to $MEDIAPKG_EVENT_LOG when that is set.
//
// Event emission never fails the operation that produced it.

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace mediapkg {

struct PackageEvent {
  std::string operation;   // "load", "save", "package" or "serve"
  std::string path;        // package file, or request target for "serve"
  bool ok{false};
  std::string error_code;  // to_string(ErrorCode) on failure
  std::uint64_t duration_ns{0};
  std::size_t files{0};    // blobs loaded or written
  std::uint64_t bytes{0};  // bytes loaded, written or served
  int status{0};           // HTTP status for "serve"
};

std::string event_to_json(const PackageEvent& ev);

// Thread-safe. All counters are atomic.
class PackageStats {
 public:
  void record(const PackageEvent& ev);
  std::string to_json() const;

  alignas(64) std::atomic<std::uint64_t> loads{0};
  alignas(64) std::atomic<std::uint64_t> load_failures{0};
  alignas(64) std::atomic<std::uint64_t> saves{0};
  alignas(64) std::atomic<std::uint64_t> save_failures{0};
  alignas(64) std::atomic<std::uint64_t> packaged{0};
  alignas(64) std::atomic<std::uint64_t> package_failures{0};
  alignas(64) std::atomic<std::uint64_t> requests{0};
  alignas(64) std::atomic<std::uint64_t> not_found{0};
  alignas(64) std::atomic<std::uint64_t> bytes_served{0};
};

// Singleton accessor
PackageStats& global_package_stats();

void emit_package_event(const PackageEvent& ev);

using PackageEventHook = void (*)(const PackageEvent&);
void set_package_event_hook(PackageEventHook hook);

// RAII duration capture
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  std::uint64_t& out_ns;
  explicit ScopeTimer(std::uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<std::uint64_t>(
        std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

}  // namespace mediapkg

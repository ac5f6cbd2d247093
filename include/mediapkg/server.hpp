#pragma once

// mediapkg/server.hpp - Read-only HTTP front-end for an app package and the
// content package it presents.
//
// ROUTES (GET only):
//   /                 app file index.html
//   /api/manifest     content manifest as JSON
//   /app/<path>       app package resolver
//   /content/<path>   content package resolver
//
// Other methods get 405, unknown routes and resolver misses get 404.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "mediapkg/package.hpp"
#include "mediapkg/types.hpp"

namespace mediapkg {

struct ServerConfig {
  std::string address{"127.0.0.1"};
  std::uint16_t port{8000};
  std::chrono::milliseconds io_timeout{5000};  // per-connection recv/send
  std::string app_package;
  std::string content_package;
};

struct HttpResponse {
  int status{200};
  std::string content_type;
  std::string body;
};

// Status line, Content-Type, Content-Length, Connection: close, body.
std::string render_response(const HttpResponse& response);

// Decode %XX escapes. Returns nullopt on a malformed escape.
std::optional<std::string> percent_decode(const std::string& s);

class Server {
 public:
  // Load both packages and check that the app can present the content.
  // Errors: package_load (path and cause set), app_type, content_type.
  static std::optional<Server> open(const ServerConfig& config, PackageError* error);

  // Route one request. Pure: touches no sockets and emits no events.
  HttpResponse handle(const std::string& method, const std::string& target) const;

  // Bind and listen on config().address:port. Port 0 picks an ephemeral
  // port, reported through `bound_port`. Returns the listening descriptor, or
  // -1 with bind_failed. The caller owns the descriptor.
  int open_listener(PackageError* error, std::uint16_t* bound_port = nullptr) const;

  // Accept connections on `listener` until `stop` is set. Each connection is
  // answered on its own thread with a receive/send timeout, so a stalled
  // client never holds up the others. Returns once every connection thread
  // has finished.
  void accept_loop(int listener, const std::atomic<bool>& stop) const;

  // open_listener() then accept_loop() until the process exits. Returns
  // false only if the socket cannot be set up.
  bool serve(PackageError* error) const;

  const ServerConfig& config() const { return config_; }
  const Package& app() const { return app_; }
  const Package& content() const { return content_; }

 private:
  Server(ServerConfig config, Package app, Package content)
      : config_(std::move(config)), app_(std::move(app)), content_(std::move(content)) {}

  void handle_client(int fd) const;

  ServerConfig config_;
  Package app_;
  Package content_;
};

}  // namespace mediapkg

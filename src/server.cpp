#include "mediapkg/server.hpp"

#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>

#include "mediapkg/manifest.hpp"
#include "mediapkg/observability.hpp"

namespace mediapkg {

namespace {

constexpr std::size_t kMaxRequestHead = 16384;

const char* reason_phrase(int status) {
  switch (status) {
    case 200: return "OK";
    case 400: return "Bad Request";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 408: return "Request Timeout";
    case 431: return "Request Header Fields Too Large";
    default: return "Internal Server Error";
  }
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

HttpResponse text_response(int status, const std::string& body) {
  return HttpResponse{status, "text/plain; charset=utf-8", body};
}

HttpResponse resolve(const Package& package, const std::string& prefix, const std::string& path) {
  auto resource = resolve_file(package, path);
  if (!resource) return text_response(404, prefix + path + " not found");
  return HttpResponse{200, std::move(resource->content_type), std::move(resource->content)};
}

void write_all(int fd, const void* buf, std::size_t n) {
  const char* p = static_cast<const char*>(buf);
  while (n) {
    ssize_t w = ::send(fd, p, n, MSG_NOSIGNAL);
    if (w <= 0) throw std::runtime_error("send failed");
    p += w;
    n -= static_cast<std::size_t>(w);
  }
}

// A request head that cannot be read. `status` is the reply it earns.
class RequestHeadError : public std::runtime_error {
 public:
  RequestHeadError(int status, const std::string& what)
      : std::runtime_error(what), status_(status) {}
  int status() const { return status_; }

 private:
  int status_;
};

// Read up to the end of the request head. Bodies are never needed since
// every route is a GET.
std::string read_request_head(int fd) {
  std::string head;
  char buf[1024];
  while (head.find("\r\n\r\n") == std::string::npos) {
    if (head.size() > kMaxRequestHead) throw RequestHeadError(431, "request head too large");
    ssize_t r = ::recv(fd, buf, sizeof(buf), 0);
    if (r < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      throw RequestHeadError(408, "request head timed out");
    }
    if (r <= 0) throw RequestHeadError(400, "incomplete request head");
    head.append(buf, static_cast<std::size_t>(r));
  }
  return head;
}

void set_io_timeout(int fd, std::chrono::milliseconds timeout) {
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
  ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

// RAII socket descriptor.
class Socket {
 public:
  explicit Socket(int fd) : fd_(fd) {}
  ~Socket() {
    if (fd_ >= 0) ::close(fd_);
  }
  Socket(const Socket&) = delete;
  Socket& operator=(const Socket&) = delete;
  int get() const { return fd_; }

 private:
  int fd_;
};

}  // namespace

std::string render_response(const HttpResponse& response) {
  std::string out = "HTTP/1.1 " + std::to_string(response.status) + " " +
                    reason_phrase(response.status) + "\r\n";
  out += "Content-Type: " + response.content_type + "\r\n";
  out += "Content-Length: " + std::to_string(response.body.size()) + "\r\n";
  out += "Connection: close\r\n\r\n";
  out += response.body;
  return out;
}

std::optional<std::string> percent_decode(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (s[i] != '%') {
      out += s[i];
      continue;
    }
    if (i + 2 >= s.size()) return std::nullopt;
    const int hi = hex_value(s[i + 1]);
    const int lo = hex_value(s[i + 2]);
    if (hi < 0 || lo < 0) return std::nullopt;
    out += static_cast<char>((hi << 4) | lo);
    i += 2;
  }
  return out;
}

std::optional<Server> Server::open(const ServerConfig& config, PackageError* error) {
  auto fail = [&](PackageError err) -> std::optional<Server> {
    if (error) *error = std::move(err);
    return std::nullopt;
  };

  auto load = [&](const std::string& path, PackageError& err) -> std::optional<Package> {
    PackageError cause;
    auto package = load_package(path, &cause);
    if (!package) {
      err.code = ErrorCode::package_load;
      err.path = path;
      err.cause = cause.code;
      err.detail = cause.message();
    }
    return package;
  };

  PackageError err;
  auto app = load(config.app_package, err);
  if (!app) return fail(err);
  auto content = load(config.content_package, err);
  if (!content) return fail(err);

  const auto* app_manifest = std::get_if<AppManifest>(&app->manifest);
  if (!app_manifest) {
    err.code = ErrorCode::app_type;
    err.type = manifest_type(app->manifest);
    return fail(err);
  }

  if (manifest_type(content->manifest) != app_manifest->handles) {
    err.code = ErrorCode::content_type;
    err.type = manifest_type(content->manifest);
    err.handles = app_manifest->handles;
    return fail(err);
  }

  return Server(config, std::move(*app), std::move(*content));
}

HttpResponse Server::handle(const std::string& method, const std::string& target) const {
  if (method != "GET") return text_response(405, "method not allowed");

  const std::string raw_path = target.substr(0, target.find('?'));
  const auto path = percent_decode(raw_path);
  if (!path) return text_response(400, "malformed path");

  if (*path == "/") return resolve(app_, "", "index.html");
  if (*path == "/api/manifest") {
    return HttpResponse{200, "application/json", manifest_to_json(content_.manifest)};
  }

  const std::string app_prefix = "/app/";
  const std::string content_prefix = "/content/";
  if (path->starts_with(app_prefix)) {
    return resolve(app_, app_prefix, path->substr(app_prefix.size()));
  }
  if (path->starts_with(content_prefix)) {
    return resolve(content_, content_prefix, path->substr(content_prefix.size()));
  }
  return text_response(404, *path + " not found");
}

void Server::handle_client(int fd) const {
  PackageEvent ev;
  ev.operation = "serve";

  HttpResponse response;
  bool sent = false;
  {
    ScopeTimer timer(ev.duration_ns);
    try {
      const std::string head = read_request_head(fd);
      const std::string line = head.substr(0, head.find("\r\n"));
      const auto sp1 = line.find(' ');
      const auto sp2 = sp1 == std::string::npos ? std::string::npos : line.find(' ', sp1 + 1);
      if (sp2 == std::string::npos) {
        response = text_response(400, "malformed request line");
      } else {
        ev.path = line.substr(sp1 + 1, sp2 - sp1 - 1);
        response = handle(line.substr(0, sp1), ev.path);
      }
    } catch (const RequestHeadError& e) {
      response = text_response(e.status(), e.what());
      ev.error_code = "request_head";
    }

    try {
      const std::string wire = render_response(response);
      write_all(fd, wire.data(), wire.size());
      sent = true;
    } catch (const std::runtime_error& e) {
      std::cerr << "client error: " << e.what() << "\n";
      ev.error_code = "send_failed";
    }
  }

  ev.status = response.status;
  ev.ok = sent && response.status == 200;
  ev.bytes = sent ? response.body.size() : 0;
  emit_package_event(ev);
}

int Server::open_listener(PackageError* error, std::uint16_t* bound_port) const {
  auto fail = [&](const std::string& detail) {
    if (error) {
      *error = PackageError{};
      error->code = ErrorCode::bind_failed;
      error->path = config_.address + ":" + std::to_string(config_.port);
      error->detail = detail;
    }
    return -1;
  };

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_PASSIVE | AI_NUMERICSERV;
  addrinfo* res = nullptr;
  const std::string port = std::to_string(config_.port);
  if (int rc = ::getaddrinfo(config_.address.c_str(), port.c_str(), &hints, &res); rc != 0) {
    return fail(::gai_strerror(rc));
  }

  const int fd = ::socket(res->ai_family, res->ai_socktype, res->ai_protocol);
  if (fd == -1) {
    ::freeaddrinfo(res);
    return fail(std::strerror(errno));
  }
  int yes = 1;
  ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
  const int bound = ::bind(fd, res->ai_addr, res->ai_addrlen);
  ::freeaddrinfo(res);
  if (bound != 0 || ::listen(fd, 16) != 0) {
    const std::string detail = std::strerror(errno);
    ::close(fd);
    return fail(detail);
  }

  if (bound_port) {
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
      const std::string detail = std::strerror(errno);
      ::close(fd);
      return fail(detail);
    }
    *bound_port = addr.ss_family == AF_INET6
                      ? ntohs(reinterpret_cast<sockaddr_in6*>(&addr)->sin6_port)
                      : ntohs(reinterpret_cast<sockaddr_in*>(&addr)->sin_port);
  }
  return fd;
}

void Server::accept_loop(int listener, const std::atomic<bool>& stop) const {
  // Connection threads are detached; this tracks them so the loop can wait
  // for every one before returning.
  std::mutex mu;
  std::condition_variable cv;
  std::size_t active = 0;

  while (!stop.load(std::memory_order_acquire)) {
    pollfd pfd{listener, POLLIN, 0};
    const int ready = ::poll(&pfd, 1, 100);
    if (ready < 0) {
      if (errno == EINTR) continue;
      std::cerr << "poll: " << std::strerror(errno) << "\n";
      break;
    }
    if (ready == 0) continue;

    const int client = ::accept(listener, nullptr, nullptr);
    if (client < 0) {
      std::cerr << "accept: " << std::strerror(errno) << "\n";
      continue;
    }
    set_io_timeout(client, config_.io_timeout);

    {
      std::lock_guard<std::mutex> lock(mu);
      ++active;
    }
    std::thread([this, client, &mu, &cv, &active] {
      {
        Socket socket(client);
        handle_client(socket.get());
      }
      std::lock_guard<std::mutex> lock(mu);
      --active;
      cv.notify_all();
    }).detach();
  }

  std::unique_lock<std::mutex> lock(mu);
  cv.wait(lock, [&] { return active == 0; });
}

bool Server::serve(PackageError* error) const {
  const int fd = open_listener(error);
  if (fd < 0) return false;
  Socket listener(fd);

  std::cerr << "mediapkg server listening on " << config_.address << ":" << config_.port << "\n";
  const std::atomic<bool> never{false};
  accept_loop(listener.get(), never);
  return true;
}

}  // namespace mediapkg

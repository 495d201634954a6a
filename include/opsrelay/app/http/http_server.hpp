#pragma once

#include "opsrelay/app/http/http_types.hpp"
#include "opsrelay/app/http/sse_channel.hpp"
#include "opsrelay/core/coroutine.hpp"
#include "opsrelay/core/error.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace opsrelay {
class Runtime;
}

namespace opsrelay::http {

class Router;

/// Takes over a connection whose GET request matched a stream route. The
/// handler owns the channel from then on: it must open() or reject() it.
using StreamHandler = std::move_only_function<task<void>(
    HttpRequest request, std::shared_ptr<SseChannel> channel)>;

class HttpServer {
public:
  explicit HttpServer(Runtime &runtime);
  ~HttpServer();

  HttpServer(const HttpServer &) = delete;
  auto operator=(const HttpServer &) -> HttpServer & = delete;

  auto router() -> Router &;

  /// Registers a long-lived event-stream endpoint. `max_pending` bounds the
  /// frames queued per connection.
  auto add_stream_route(std::string pattern, std::size_t max_pending,
                        StreamHandler handler) -> void;

  auto start(std::string_view host, uint16_t port) -> Result<void>;
  auto stop() -> void;

  [[nodiscard]] auto is_running() const -> bool;
  /// Port actually bound; differs from the requested one when that was 0.
  [[nodiscard]] auto local_port() const -> uint16_t;

private:
  struct Impl;
  std::shared_ptr<Impl> impl_;
};

} // namespace opsrelay::http

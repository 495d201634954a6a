#pragma once

#include "opsrelay/core/error.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <system_error>

namespace opsrelay {

class Application;

namespace http {
class HttpServer;
enum class HttpStatus : std::uint16_t;
} // namespace http

/// HTTP status for a service error code.
[[nodiscard]] auto status_from_error(const std::error_code &ec)
    -> http::HttpStatus;

/// Message sent with a 429 when the queue refuses a unit.
[[nodiscard]] auto queue_full_message(std::size_t max_queue_size)
    -> std::string;

class ApiServer {
public:
  explicit ApiServer(Application &app);
  ~ApiServer();

  ApiServer(const ApiServer &) = delete;
  auto operator=(const ApiServer &) -> ApiServer & = delete;

  [[nodiscard]] auto start() -> Result<void>;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const -> bool;
  [[nodiscard]] auto port() const -> std::uint16_t;
  [[nodiscard]] auto http_server() -> http::HttpServer &;

private:
  struct Impl;
  std::shared_ptr<Impl> impl_;
};

} // namespace opsrelay

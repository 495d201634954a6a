#pragma once

#include "opsrelay/core/error.hpp"
#include "opsrelay/util/string_hash.hpp"

#include <cstdint>
#include <format>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace opsrelay::http {

enum class HttpMethod : std::uint8_t {
  GET,
  POST,
  PUT,
  DELETE,
  PATCH,
  OPTIONS,
  HEAD
};

enum class HttpStatus : std::uint16_t {
  Ok = 200,
  Created = 201,
  Accepted = 202,
  NoContent = 204,

  BadRequest = 400,
  NotFound = 404,
  MethodNotAllowed = 405,
  Conflict = 409,
  PayloadTooLarge = 413,
  TooManyRequests = 429,

  InternalServerError = 500,
  NotImplemented = 501,
  ServiceUnavailable = 503
};

using HttpHeaders = std::unordered_map<std::string, std::string,
                                       opsrelay::StringHash,
                                       opsrelay::StringEqual>;

struct HttpRequest {
  HttpMethod method{HttpMethod::GET};
  std::string path;
  std::string query_string;
  int version_major{1};
  int version_minor{1};
  HttpHeaders headers;
  std::vector<uint8_t> body;
  // Mutable: populated by Router during route matching
  mutable std::unordered_map<std::string, std::string, opsrelay::StringHash,
                             opsrelay::StringEqual>
      path_params;

  [[nodiscard]] auto body_as_string() const -> std::string_view;
  [[nodiscard]] auto path_param(std::string_view key) const
      -> Result<std::string>;
};

struct HttpResponse {
  HttpStatus status{HttpStatus::Ok};
  HttpHeaders headers;
  std::vector<uint8_t> body;

  [[nodiscard]] static auto json(std::string_view json_str) -> HttpResponse;
  [[nodiscard]] static auto json(HttpStatus status, std::string_view json_str)
      -> HttpResponse;

  [[nodiscard]] auto body_as_string() const -> std::string_view;

  /// HTTP/1.1 wire form, for connections that leave the Beast server loop.
  [[nodiscard]] auto serialize() const -> std::string;
};

[[nodiscard]] auto status_reason_phrase(HttpStatus status) -> std::string_view;

} // namespace opsrelay::http

template <>
struct std::formatter<opsrelay::http::HttpMethod>
    : std::formatter<std::string_view> {
  auto format(opsrelay::http::HttpMethod method, auto &ctx) const {
    using enum opsrelay::http::HttpMethod;
    std::string_view name = [method] {
      switch (method) {
      case GET:
        return "GET";
      case POST:
        return "POST";
      case PUT:
        return "PUT";
      case DELETE:
        return "DELETE";
      case PATCH:
        return "PATCH";
      case OPTIONS:
        return "OPTIONS";
      case HEAD:
        return "HEAD";
      }
      return "UNKNOWN";
    }();
    return std::formatter<std::string_view>::format(name, ctx);
  }
};

template <>
struct std::formatter<opsrelay::http::HttpStatus>
    : std::formatter<std::uint16_t> {
  auto format(opsrelay::http::HttpStatus status, auto &ctx) const {
    return std::formatter<std::uint16_t>::format(
        static_cast<std::uint16_t>(status), ctx);
  }
};

#pragma once

#include "opsrelay/app/http/http_types.hpp"
#include "opsrelay/core/coroutine.hpp"

#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace opsrelay::http {

using RouteHandler =
    std::move_only_function<opsrelay::task<HttpResponse>(HttpRequest)>;

/// Matches one `{name}` pattern against req.path, filling req.path_params
/// on success.
[[nodiscard]] auto match_path(std::string_view pattern, const HttpRequest &req)
    -> bool;

/// Method + path dispatch. Patterns are literal segments or `{name}`
/// placeholders captured into HttpRequest::path_params. Literal routes win
/// over placeholder routes; among placeholder routes registration order wins.
/// A path known under another method answers 405, anything else 404.
class Router {
public:
  Router();
  ~Router();

  Router(const Router &) = delete;
  auto operator=(const Router &) -> Router & = delete;

  auto add_route(HttpMethod method, std::string pattern, RouteHandler handler)
      -> void;

  auto get(std::string pattern, RouteHandler handler) -> void;
  auto post(std::string pattern, RouteHandler handler) -> void;
  auto del(std::string pattern, RouteHandler handler) -> void;

  [[nodiscard]] auto route_count() const -> std::size_t;

  [[nodiscard]] auto route(HttpRequest req) -> opsrelay::task<HttpResponse>;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace opsrelay::http

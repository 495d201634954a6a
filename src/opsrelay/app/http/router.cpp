#include "opsrelay/app/http/router.hpp"

#include <ankerl/unordered_dense.h>

#include <algorithm>
#include <format>
#include <ranges>
#include <string_view>
#include <vector>

namespace opsrelay::http {

namespace {

struct Segment {
  std::string text; // literal text, or the placeholder name
  bool is_param{false};
};

struct Route {
  HttpMethod method{HttpMethod::GET};
  std::vector<Segment> segments;
  RouteHandler handler;
};

[[nodiscard]] auto split_path(std::string_view path)
    -> std::vector<std::string_view> {
  std::vector<std::string_view> parts;
  for (auto part : path | std::views::split('/')) {
    parts.emplace_back(std::string_view(part));
  }
  return parts;
}

[[nodiscard]] auto parse_pattern(std::string_view pattern)
    -> std::vector<Segment> {
  std::vector<Segment> out;
  for (auto part : split_path(pattern)) {
    if (part.size() >= 2 && part.starts_with('{') && part.ends_with('}')) {
      out.push_back({.text = std::string(part.substr(1, part.size() - 2)),
                     .is_param = true});
    } else {
      out.push_back({.text = std::string(part), .is_param = false});
    }
  }
  return out;
}

// Fills req.path_params only on a full match.
[[nodiscard]] auto match(const std::vector<Segment> &segments,
                         const std::vector<std::string_view> &parts,
                         const HttpRequest &req) -> bool {
  if (segments.size() != parts.size()) {
    return false;
  }
  for (auto &&[seg, part] : std::views::zip(segments, parts)) {
    if (!seg.is_param && seg.text != part) {
      return false;
    }
    if (seg.is_param && part.empty()) {
      return false;
    }
  }
  req.path_params.clear();
  for (auto &&[seg, part] : std::views::zip(segments, parts)) {
    if (seg.is_param) {
      req.path_params.emplace(seg.text, part);
    }
  }
  return true;
}

} // namespace

auto match_path(std::string_view pattern, const HttpRequest &req) -> bool {
  return match(parse_pattern(pattern), split_path(req.path), req);
}

struct Router::Impl {
  // Literal routes keyed by "METHOD path".
  ankerl::unordered_dense::map<std::string, std::size_t, StringHash,
                               StringEqual>
      literal_index;
  std::vector<Route> routes;

  [[nodiscard]] static auto literal_key(HttpMethod method,
                                        std::string_view path) -> std::string {
    return std::format("{} {}", method, path);
  }
};

Router::Router() : impl_(std::make_unique<Impl>()) {}

Router::~Router() = default;

auto Router::add_route(HttpMethod method, std::string pattern,
                       RouteHandler handler) -> void {
  auto segments = parse_pattern(pattern);
  const bool literal = std::ranges::none_of(
      segments, [](const Segment &s) { return s.is_param; });
  if (literal) {
    impl_->literal_index.insert_or_assign(Impl::literal_key(method, pattern),
                                          impl_->routes.size());
  }
  impl_->routes.push_back(Route{.method = method,
                                .segments = std::move(segments),
                                .handler = std::move(handler)});
}

auto Router::get(std::string pattern, RouteHandler handler) -> void {
  add_route(HttpMethod::GET, std::move(pattern), std::move(handler));
}

auto Router::post(std::string pattern, RouteHandler handler) -> void {
  add_route(HttpMethod::POST, std::move(pattern), std::move(handler));
}

auto Router::del(std::string pattern, RouteHandler handler) -> void {
  add_route(HttpMethod::DELETE, std::move(pattern), std::move(handler));
}

auto Router::route_count() const -> std::size_t {
  return impl_->routes.size();
}

auto Router::route(HttpRequest req) -> opsrelay::task<HttpResponse> {
  if (auto it = impl_->literal_index.find(
          Impl::literal_key(req.method, req.path));
      it != impl_->literal_index.end()) {
    req.path_params.clear();
    co_return co_await impl_->routes[it->second].handler(std::move(req));
  }

  const auto parts = split_path(req.path);
  bool path_known = false;
  for (auto &route : impl_->routes) {
    if (!match(route.segments, parts, req)) {
      continue;
    }
    if (route.method == req.method) {
      co_return co_await route.handler(std::move(req));
    }
    path_known = true;
  }

  if (path_known) {
    co_return HttpResponse::json(HttpStatus::MethodNotAllowed,
                                 R"({"error":"Method not allowed"})");
  }
  co_return HttpResponse::json(HttpStatus::NotFound,
                               R"({"error":"Not found"})");
}

} // namespace opsrelay::http

#include "opsrelay/app/http/http_types.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/beast/http/status.hpp>

#include <format>
#include <iterator>
#include <utility>

namespace opsrelay::http {

auto HttpRequest::body_as_string() const -> std::string_view {
  return {reinterpret_cast<const char *>(body.data()), body.size()};
}

auto HttpRequest::path_param(std::string_view key) const
    -> Result<std::string> {
  if (auto it = path_params.find(key); it != path_params.end()) {
    return ok(it->second);
  }
  return fail(Error::NotFound);
}

auto HttpResponse::json(std::string_view json_str) -> HttpResponse {
  return json(HttpStatus::Ok, json_str);
}

auto HttpResponse::json(HttpStatus status, std::string_view json_str)
    -> HttpResponse {
  HttpResponse resp{.status = status, .headers = {}, .body = {}};
  resp.headers["Content-Type"] = "application/json";
  resp.body.assign(json_str.begin(), json_str.end());
  return resp;
}

auto HttpResponse::body_as_string() const -> std::string_view {
  return {reinterpret_cast<const char *>(body.data()), body.size()};
}

auto HttpResponse::serialize() const -> std::string {
  std::string out;
  out.reserve(256 + body.size());
  std::format_to(std::back_inserter(out), "HTTP/1.1 {} {}\r\n", status,
                 status_reason_phrase(status));

  bool has_content_length = false;
  for (const auto &[key, value] : headers) {
    std::format_to(std::back_inserter(out), "{}: {}\r\n", key, value);
    if (boost::algorithm::iequals(key, "Content-Length")) {
      has_content_length = true;
    }
  }
  if (!has_content_length && !headers.contains("Transfer-Encoding")) {
    std::format_to(std::back_inserter(out), "Content-Length: {}\r\n",
                   body.size());
  }
  out += "\r\n";
  out.append(body_as_string());
  return out;
}

auto status_reason_phrase(HttpStatus status) -> std::string_view {
  namespace beast_http = boost::beast::http;
  const auto reason =
      beast_http::obsolete_reason(static_cast<beast_http::status>(status));
  return {reason.data(), reason.size()};
}

} // namespace opsrelay::http

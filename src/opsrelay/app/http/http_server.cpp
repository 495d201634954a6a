#include "opsrelay/app/http/http_server.hpp"

#include "opsrelay/app/http/router.hpp"
#include "opsrelay/core/runtime.hpp"
#include "opsrelay/util/log.hpp"

#include <boost/asio/cancel_after.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/socket_base.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/url/parse.hpp>

#include <atomic>
#include <chrono>
#include <format>
#include <utility>
#include <vector>

namespace opsrelay::http {

namespace {
constexpr auto kHttpIoTimeout = std::chrono::seconds(30);
constexpr std::uint32_t kParserHeaderLimit = 64 * 1024;
constexpr std::uint64_t kParserBodyLimit = 1024ULL * 1024ULL;

namespace beast = boost::beast;
namespace beast_http = beast::http;
using tcp = boost::asio::ip::tcp;

using BeastRequest = beast_http::request<beast_http::vector_body<uint8_t>>;
using BeastResponse = beast_http::response<beast_http::vector_body<uint8_t>>;

auto to_method(beast_http::verb verb) noexcept -> HttpMethod {
  switch (verb) {
  case beast_http::verb::get:
    return HttpMethod::GET;
  case beast_http::verb::post:
    return HttpMethod::POST;
  case beast_http::verb::put:
    return HttpMethod::PUT;
  case beast_http::verb::delete_:
    return HttpMethod::DELETE;
  case beast_http::verb::patch:
    return HttpMethod::PATCH;
  case beast_http::verb::options:
    return HttpMethod::OPTIONS;
  case beast_http::verb::head:
    return HttpMethod::HEAD;
  default:
    return HttpMethod::GET;
  }
}

auto to_request(const BeastRequest &msg) -> HttpRequest {
  HttpRequest out;
  out.method = to_method(msg.method());
  out.version_major = msg.version() / 10;
  out.version_minor = msg.version() % 10;

  std::string target(msg.target());
  if (auto parsed = boost::urls::parse_origin_form(target); parsed) {
    out.path = std::string(parsed->encoded_path());
    if (auto query = parsed->encoded_query(); !query.empty()) {
      out.query_string.assign(query.data(), query.size());
    }
  } else {
    out.path = std::move(target);
  }

  for (const auto &field : msg.base()) {
    out.headers.emplace(field.name_string(), field.value());
  }
  out.body = msg.body();
  return out;
}

auto to_beast_response(const HttpResponse &resp, unsigned version,
                       bool keep_alive) -> BeastResponse {
  BeastResponse out{static_cast<beast_http::status>(resp.status), version};
  out.keep_alive(keep_alive);
  for (const auto &[k, v] : resp.headers) {
    out.set(k, v);
  }
  out.body() = resp.body;
  out.prepare_payload();
  return out;
}

auto error_body(HttpStatus status, std::string_view code,
                std::string_view message) -> HttpResponse {
  return HttpResponse::json(
      status, std::format(R"({{"error":{{"code":"{}","message":"{}"}}}})",
                          code, message));
}
} // namespace

struct HttpServer::Impl : std::enable_shared_from_this<HttpServer::Impl> {
  struct StreamRoute {
    std::string pattern;
    std::size_t max_pending{0};
    StreamHandler handler;
  };

  Runtime &runtime;
  Router router_;
  std::vector<StreamRoute> stream_routes_;
  std::shared_ptr<tcp::acceptor> acceptor_;
  std::atomic<bool> running{false};
  std::atomic<uint16_t> port_{0};

  explicit Impl(Runtime &rt) : runtime(rt) {}

  [[nodiscard]] auto find_stream_route(const HttpRequest &req)
      -> StreamRoute * {
    if (req.method != HttpMethod::GET) {
      return nullptr;
    }
    for (auto &route : stream_routes_) {
      if (match_path(route.pattern, req)) {
        return &route;
      }
    }
    return nullptr;
  }

  auto handle_connection(tcp::socket socket) -> spawn_task {
    auto self = shared_from_this();
    const int fd_num = socket.native_handle();
    beast::flat_buffer read_buffer;

    log::debug("HTTP connection start: fd={}", fd_num);

    try {
      while (running.load(std::memory_order_acquire)) {
        beast_http::request_parser<beast_http::vector_body<uint8_t>> parser;
        parser.header_limit(kParserHeaderLimit);
        parser.body_limit(kParserBodyLimit);

        auto [read_ec, read_n] = co_await beast_http::async_read(
            socket, read_buffer, parser,
            boost::asio::cancel_after(kHttpIoTimeout, use_nothrow));
        (void)read_n;
        if (read_ec) {
          if (read_ec == beast_http::error::body_limit) {
            auto resp = to_beast_response(
                error_body(HttpStatus::PayloadTooLarge, "PAYLOAD_TOO_LARGE",
                           "Request body too large"),
                11, false);
            auto [ignored_ec, ignored_n] = co_await beast_http::async_write(
                socket, resp,
                boost::asio::cancel_after(kHttpIoTimeout, use_nothrow));
            (void)ignored_ec;
            (void)ignored_n;
          } else if (read_ec != boost::asio::error::eof &&
                     read_ec != beast::error::timeout &&
                     read_ec != beast_http::error::end_of_stream &&
                     read_ec != boost::asio::error::operation_aborted) {
            log::warn("HTTP read failed: fd={} err={}", fd_num,
                      read_ec.message());
          }
          break;
        }

        auto beast_req = parser.release();
        auto req = to_request(beast_req);
        log::debug("HTTP request: {} {} (fd={})", req.method, req.path, fd_num);

        if (auto *stream = find_stream_route(req)) {
          auto channel =
              std::make_shared<SseChannel>(std::move(socket), stream->max_pending);
          co_await stream->handler(std::move(req), std::move(channel));
          co_return;
        }

        auto resp = co_await router_.route(std::move(req));
        auto beast_resp = to_beast_response(resp, beast_req.version(),
                                            beast_req.keep_alive());
        log::debug("HTTP response: {} (fd={})", resp.status, fd_num);

        auto [write_ec, written] = co_await beast_http::async_write(
            socket, beast_resp,
            boost::asio::cancel_after(kHttpIoTimeout, use_nothrow));
        (void)written;
        if (write_ec) {
          log::warn("HTTP write failed: fd={} err={}", fd_num,
                    write_ec.message());
          break;
        }

        if (!beast_req.keep_alive()) {
          break;
        }
      }
    } catch (const std::exception &e) {
      log::error("Exception in connection handler: {}", e.what());
    }

    boost::system::error_code close_ec;
    socket.shutdown(tcp::socket::shutdown_both, close_ec);
    log::debug("HTTP connection close: fd={}", fd_num);
  }

  auto accept_loop(std::shared_ptr<tcp::acceptor> acceptor) -> spawn_task {
    auto self = shared_from_this();
    while (running.load(std::memory_order_acquire)) {
      tcp::socket socket(runtime.context());
      auto [accept_ec] = co_await acceptor->async_accept(socket, use_nothrow);
      if (accept_ec) {
        if (running && accept_ec != boost::asio::error::operation_aborted) {
          log::error("Accept failed: {}", accept_ec.message());
        }
        break;
      }

      boost::system::error_code nodelay_ec;
      socket.set_option(tcp::no_delay(true), nodelay_ec);
      if (nodelay_ec) {
        log::warn("Failed to set TCP_NODELAY: {}", nodelay_ec.message());
      }

      log::debug("Accepted connection: fd={}", socket.native_handle());
      runtime.spawn(handle_connection(std::move(socket)));
    }
  }
};

HttpServer::HttpServer(Runtime &runtime)
    : impl_(std::make_shared<Impl>(runtime)) {}

HttpServer::~HttpServer() { stop(); }

auto HttpServer::router() -> Router & { return impl_->router_; }

auto HttpServer::add_stream_route(std::string pattern, std::size_t max_pending,
                                  StreamHandler handler) -> void {
  impl_->stream_routes_.push_back(Impl::StreamRoute{
      .pattern = std::move(pattern),
      .max_pending = max_pending,
      .handler = std::move(handler)});
}

auto HttpServer::start(std::string_view host, uint16_t port) -> Result<void> {
  if (impl_->running.load()) {
    return fail(Error::AlreadyExists);
  }

  boost::system::error_code ec;
  boost::asio::ip::address bind_address;
  if (host == "0.0.0.0" || host.empty()) {
    bind_address = boost::asio::ip::address_v4::any();
  } else {
    bind_address = boost::asio::ip::make_address(std::string(host), ec);
  }
  if (ec) {
    log::error("Invalid host address '{}': {}", host, ec.message());
    return fail(Error::InvalidArgument);
  }

  auto acceptor = std::make_shared<tcp::acceptor>(impl_->runtime.context());
  acceptor->open(bind_address.is_v6() ? tcp::v6() : tcp::v4(), ec);
  if (ec) {
    log::error("Failed to open acceptor: {}", ec.message());
    return fail(ec);
  }

  acceptor->set_option(boost::asio::socket_base::reuse_address(true), ec);
  if (ec) {
    log::warn("Failed to set SO_REUSEADDR: {}", ec.message());
    ec.clear();
  }

  acceptor->bind({bind_address, port}, ec);
  if (ec) {
    log::error("Failed to bind {}:{}: {}", bind_address.to_string(), port,
               ec.message());
    return fail(ec);
  }

  acceptor->listen(boost::asio::socket_base::max_listen_connections, ec);
  if (ec) {
    log::error("Failed to listen on {}:{}: {}", bind_address.to_string(), port,
               ec.message());
    return fail(ec);
  }

  impl_->port_ = acceptor->local_endpoint(ec).port();
  impl_->acceptor_ = acceptor;
  impl_->running = true;
  impl_->runtime.spawn(impl_->accept_loop(std::move(acceptor)));

  log::info("HTTP server listening on {}:{}", host, impl_->port_.load());
  return ok();
}

auto HttpServer::stop() -> void {
  if (!impl_->running.exchange(false)) {
    return;
  }

  log::info("Stopping HTTP server...");
  boost::asio::post(impl_->runtime.context(), [impl = impl_]() {
    if (auto acc = std::exchange(impl->acceptor_, nullptr)) {
      boost::system::error_code close_ec;
      acc->cancel(close_ec);
      acc->close(close_ec);
    }
  });
  log::info("HTTP server stopped");
}

auto HttpServer::is_running() const -> bool { return impl_->running.load(); }

auto HttpServer::local_port() const -> uint16_t { return impl_->port_.load(); }

} // namespace opsrelay::http

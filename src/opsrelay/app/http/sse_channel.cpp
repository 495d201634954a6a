#include "opsrelay/app/http/sse_channel.hpp"

#include "opsrelay/util/log.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>

#include <array>
#include <utility>

namespace opsrelay::http {

namespace {

constexpr std::string_view kEventStreamHead =
    "HTTP/1.1 200 OK\r\n"
    "Content-Type: text/event-stream\r\n"
    "Cache-Control: no-cache\r\n"
    "Connection: keep-alive\r\n"
    "X-Accel-Buffering: no\r\n"
    "\r\n";

constexpr std::size_t kPeerReadBuffer = 512;

} // namespace

SseChannel::SseChannel(boost::asio::ip::tcp::socket socket,
                       std::size_t max_pending)
    : strand_(boost::asio::make_strand(socket.get_executor())),
      socket_(std::move(socket)), max_pending_(max_pending) {}

SseChannel::~SseChannel() = default;

auto SseChannel::open() -> void {
  {
    std::scoped_lock lock(mu_);
    if (closed_ || opened_) {
      return;
    }
    opened_ = true;
    queue_.emplace_front(kEventStreamHead);
    if (!writing_) {
      writing_ = true;
      co_spawn(strand_, drain(), detached);
    }
  }
  co_spawn(strand_, watch_peer(), detached);
}

auto SseChannel::reject(const HttpResponse &response) -> void {
  std::scoped_lock lock(mu_);
  if (closed_ || opened_) {
    return;
  }
  opened_ = true;
  close_requested_ = true;
  queue_.clear();
  queue_.push_back(response.serialize());
  writing_ = true;
  co_spawn(strand_, drain(), detached);
}

auto SseChannel::write(std::string_view frame) -> Result<void> {
  std::scoped_lock lock(mu_);
  if (closed_ || close_requested_) {
    return fail(Error::SubscriberWrite);
  }
  if (queue_.size() >= max_pending_) {
    return fail(Error::ResourceExhausted);
  }
  enqueue_locked(std::string(frame));
  return ok();
}

auto SseChannel::on_close(std::move_only_function<void()> callback) -> void {
  {
    std::scoped_lock lock(mu_);
    if (!closed_) {
      close_callbacks_.push_back(std::move(callback));
      return;
    }
  }
  callback();
}

auto SseChannel::close() -> void {
  std::scoped_lock lock(mu_);
  if (closed_ || close_requested_) {
    return;
  }
  close_requested_ = true;
  if (!writing_) {
    boost::asio::post(strand_,
                      [self = shared_from_this()] { self->shutdown(); });
  }
}

auto SseChannel::is_closed() const -> bool {
  std::scoped_lock lock(mu_);
  return closed_;
}

auto SseChannel::pending() const -> std::size_t {
  std::scoped_lock lock(mu_);
  return queue_.size();
}

auto SseChannel::enqueue_locked(std::string data) -> void {
  queue_.push_back(std::move(data));
  if (opened_ && !writing_) {
    writing_ = true;
    co_spawn(strand_, drain(), detached);
  }
}

auto SseChannel::drain() -> spawn_task {
  auto self = shared_from_this();
  while (true) {
    std::string next;
    bool idle = false;
    bool finish = false;
    {
      std::scoped_lock lock(mu_);
      if (closed_ || queue_.empty()) {
        writing_ = false;
        idle = true;
        finish = close_requested_ && !closed_;
      } else {
        next = std::move(queue_.front());
        queue_.pop_front();
      }
    }
    if (idle) {
      if (finish) {
        shutdown();
      }
      co_return;
    }

    auto [ec, written] = co_await boost::asio::async_write(
        socket_, boost::asio::buffer(next), use_nothrow);
    (void)written;
    if (ec) {
      log::debug("SSE write failed: {}", ec.message());
      finalize();
      co_return;
    }
  }
}

auto SseChannel::watch_peer() -> spawn_task {
  auto self = shared_from_this();
  std::array<char, kPeerReadBuffer> buffer{};
  while (true) {
    auto [ec, n] = co_await socket_.async_read_some(
        boost::asio::buffer(buffer), use_nothrow);
    (void)n;
    if (ec) {
      break;
    }
  }
  finalize();
}

auto SseChannel::shutdown() -> void {
  boost::system::error_code ec;
  socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  finalize();
}

auto SseChannel::finalize() -> void {
  std::vector<std::move_only_function<void()>> callbacks;
  {
    std::scoped_lock lock(mu_);
    if (closed_) {
      return;
    }
    closed_ = true;
    queue_.clear();
    callbacks = std::move(close_callbacks_);
  }
  boost::system::error_code ec;
  socket_.close(ec);
  for (auto &cb : callbacks) {
    if (cb) {
      cb();
    }
  }
}

} // namespace opsrelay::http

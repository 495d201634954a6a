#pragma once

#include "opsrelay/app/http/http_types.hpp"
#include "opsrelay/core/coroutine.hpp"
#include "opsrelay/streaming/subscriber_channel.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>

#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace opsrelay::http {

/// Server-sent events over a connection taken out of the HTTP server loop.
///
/// write() only enqueues; a writer coroutine drains the queue on the
/// channel's strand. A reader coroutine watches for the peer hanging up.
/// When more than max_pending frames are waiting the client is treated as
/// stalled and write() fails.
class SseChannel final : public ISubscriberChannel,
                         public std::enable_shared_from_this<SseChannel> {
public:
  using Strand = boost::asio::strand<boost::asio::any_io_executor>;

  SseChannel(boost::asio::ip::tcp::socket socket, std::size_t max_pending);
  ~SseChannel() override;

  SseChannel(const SseChannel &) = delete;
  auto operator=(const SseChannel &) -> SseChannel & = delete;

  /// Sends the `text/event-stream` response head and starts watching the
  /// peer. Frames written before open() are sent after the head.
  auto open() -> void;

  /// Answers with an ordinary response instead of a stream, then closes.
  auto reject(const HttpResponse &response) -> void;

  auto write(std::string_view frame) -> Result<void> override;
  auto on_close(std::move_only_function<void()> callback) -> void override;

  /// Closes after every queued frame has been written.
  auto close() -> void override;

  [[nodiscard]] auto is_closed() const -> bool;
  [[nodiscard]] auto pending() const -> std::size_t;

private:
  auto enqueue_locked(std::string data) -> void;
  auto drain() -> spawn_task;
  auto watch_peer() -> spawn_task;
  auto shutdown() -> void;
  auto finalize() -> void;

  Strand strand_;
  boost::asio::ip::tcp::socket socket_;
  std::size_t max_pending_;

  mutable std::mutex mu_;
  std::deque<std::string> queue_;
  bool opened_{false};
  bool writing_{false};
  bool close_requested_{false};
  bool closed_{false};
  std::vector<std::move_only_function<void()>> close_callbacks_;
};

} // namespace opsrelay::http

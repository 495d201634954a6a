#pragma once

#include "opsrelay/config/system_config.hpp"
#include "opsrelay/execution/execution_unit.hpp"
#include "opsrelay/streaming/stream_frame.hpp"
#include "opsrelay/streaming/subscriber_channel.hpp"
#include "opsrelay/util/id.hpp"
#include "opsrelay/util/json.hpp"

#include <boost/asio/any_io_executor.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace opsrelay {

/// Cuts `line` to at most `max_length` bytes, backing off to a UTF-8 code
/// point boundary, and appends `... [truncated N characters]` where N counts
/// the dropped bytes. Lines within the limit come back unchanged.
[[nodiscard]] auto truncate_line(std::string_view line, std::size_t max_length)
    -> std::string;

/// Warning text delivered once when an execution exceeds its output budget.
[[nodiscard]] auto output_limit_message(std::size_t max_output_size)
    -> std::string;

/// Per-execution subscriber registry and output fan-out.
///
/// All state lives on a strand of the supplied executor. Public mutators post
/// onto that strand and return immediately, so they are safe to call from any
/// thread. stdout/stderr chunks pass through the output budget and line cap,
/// then a per-stream trailing debounce of buffer_ms coalesces them into one
/// frame. Terminal frames flush both streams, then close every subscriber
/// after close_grace_ms and release the execution's state.
class StreamingHub {
public:
  StreamingHub(boost::asio::any_io_executor executor, StreamingConfig config);
  ~StreamingHub();

  StreamingHub(const StreamingHub &) = delete;
  auto operator=(const StreamingHub &) -> StreamingHub & = delete;

  /// Arms the heartbeat timer.
  auto start() -> void;

  /// Stops the heartbeat, cancels every timer and closes every subscriber.
  /// `done` runs on the hub's strand once that has happened.
  auto cleanup(std::move_only_function<void()> done = {}) -> void;

  auto subscribe(const ExecutionId &id,
                 std::shared_ptr<ISubscriberChannel> channel) -> void;
  auto unsubscribe(const ExecutionId &id,
                   const std::shared_ptr<ISubscriberChannel> &channel) -> void;

  auto emit(const ExecutionId &id, StreamFrame frame) -> void;
  auto emit_stdout(const ExecutionId &id, std::string chunk) -> void;
  auto emit_stderr(const ExecutionId &id, std::string chunk) -> void;
  auto emit_status(const ExecutionId &id, ExecutionStatus status) -> void;
  auto emit_command(const ExecutionId &id, std::string command) -> void;
  auto emit_complete(const ExecutionId &id, JsonValue result) -> void;
  auto emit_error(const ExecutionId &id, std::string error) -> void;
  /// Flushes both streams, then sends `status(status)` followed by
  /// `terminal` and schedules the close.
  auto emit_finished(const ExecutionId &id, ExecutionStatus status,
                     StreamFrame terminal) -> void;

  // Introspection. These read strand-owned state directly: call them from
  // the hub's executor, or while nothing else drives it.
  [[nodiscard]] auto subscriber_count(const ExecutionId &id) const
      -> std::size_t;
  [[nodiscard]] auto tracked_execution_count() const -> std::size_t;
  [[nodiscard]] auto tracked_bytes(const ExecutionId &id) const -> std::size_t;
  [[nodiscard]] auto limit_reached(const ExecutionId &id) const -> bool;
  [[nodiscard]] auto heartbeat_active() const -> bool;

  [[nodiscard]] auto config() const noexcept -> const StreamingConfig &;

private:
  struct Impl;
  std::shared_ptr<Impl> impl_;
};

} // namespace opsrelay

#pragma once

#include "opsrelay/config/system_config.hpp"
#include "opsrelay/core/error.hpp"
#include "opsrelay/execution/execution_unit.hpp"
#include "opsrelay/execution/transport.hpp"
#include "opsrelay/util/id.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace opsrelay {

/// Observer hooks for unit lifecycle and output. Invoked outside the queue
/// lock, possibly from several io threads at once.
struct ExecutionListener {
  std::function<void(const ExecutionUnit &unit)> on_started;
  std::function<void(const ExecutionId &id, std::string_view data)> on_stdout;
  std::function<void(const ExecutionId &id, std::string_view data)> on_stderr;
  std::function<void(const ExecutionId &id, std::string_view text)>
      on_command;
  std::function<void(const ExecutionUnit &unit)> on_finished;
  std::function<void(const ExecutionUnit &unit)> on_cancelled;
};

struct QueuedEntry {
  ExecutionId id;
  NodeId target;
  ActionType type{ActionType::Command};
  std::string action;
  std::chrono::system_clock::time_point enqueued_at{};
};

struct QueueStatus {
  std::size_t running{0};
  std::size_t queued{0};
  std::size_t limit{0};
  std::size_t max_queue_size{0};
  std::vector<QueuedEntry> queue; // oldest first
};

/// Admission control and FIFO dispatch for execution units.
///
/// A unit is admitted while queued + running < max_queue_size. Admitted units
/// wait in arrival order and are handed to the transport whenever fewer than
/// concurrent_limit units are running. Counter updates and list operations
/// happen under one mutex so neither bound can be exceeded by concurrent
/// submissions and completions.
class ExecutionQueue {
public:
  ExecutionQueue(ITransportExecutor &transport, ExecutionQueueConfig config,
                 ExecutionListener listener = {});
  ~ExecutionQueue();

  ExecutionQueue(const ExecutionQueue &) = delete;
  auto operator=(const ExecutionQueue &) -> ExecutionQueue & = delete;

  /// Admits `unit`. An empty unit id is replaced by a generated one. Returns
  /// Error::QueueFull when the queue is at capacity.
  [[nodiscard]] auto submit(ExecutionUnit unit) -> Result<ExecutionId>;

  /// Cancels a queued unit outright; for a running unit the request is
  /// recorded and forwarded to the transport, whose answer is returned.
  [[nodiscard]] auto cancel(const ExecutionId &id) -> Result<void>;

  [[nodiscard]] auto get_status(const ExecutionId &id) const
      -> Result<ExecutionStatus>;
  [[nodiscard]] auto get_unit(const ExecutionId &id) const
      -> Result<ExecutionUnit>;
  [[nodiscard]] auto queue_status() const -> QueueStatus;

  /// Cancels every unit still waiting. Returns how many were cancelled.
  auto clear_queue() -> std::size_t;

  [[nodiscard]] auto running_count() const -> std::size_t;
  [[nodiscard]] auto queued_count() const -> std::size_t;
  [[nodiscard]] auto config() const noexcept -> const ExecutionQueueConfig &;

private:
  struct Impl;
  std::shared_ptr<Impl> impl_;
};

} // namespace opsrelay

#pragma once

#include "opsrelay/config/config.hpp"
#include "opsrelay/core/error.hpp"
#include "opsrelay/core/runtime.hpp"
#include "opsrelay/execution/execution_queue.hpp"
#include "opsrelay/streaming/stream_frame.hpp"

#include <atomic>
#include <memory>
#include <string_view>

namespace opsrelay {

class ApiServer;
class BatchService;
class ProcessTransport;
class StaticInventory;
class StreamingHub;
class TargetExpander;

/// Frame that ends a finished unit's stream: complete with
/// `{status, target, exitCode, error?}` when the transport produced an exit
/// code, otherwise error with the unit's error text.
[[nodiscard]] auto terminal_frame_for(const ExecutionUnit &unit)
    -> StreamFrame;

/// Forwards queue lifecycle and transport output to the hub: a status frame
/// on start, stdout/stderr/command pass-through, and on finish the flushed
/// output, the final status, then a complete frame when the transport
/// produced an exit code and an error frame when it did not or the unit was
/// cancelled before it ran.
[[nodiscard]] auto make_stream_listener(StreamingHub &hub)
    -> ExecutionListener;

// Application facade - owns and wires every service
class Application {
public:
  explicit Application(Config config);
  ~Application();

  Application(const Application &) = delete;
  auto operator=(const Application &) -> Application & = delete;

  [[nodiscard]] auto config() const noexcept -> const Config &;

  // Lifecycle
  [[nodiscard]] auto init() -> Result<void>;
  [[nodiscard]] auto start() -> Result<void>;
  auto stop() noexcept -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  // Service access
  [[nodiscard]] auto runtime() -> Runtime &;
  [[nodiscard]] auto inventory() const -> const StaticInventory &;
  [[nodiscard]] auto expander() const -> const TargetExpander &;
  [[nodiscard]] auto queue() -> ExecutionQueue &;
  [[nodiscard]] auto hub() -> StreamingHub &;
  [[nodiscard]] auto batches() -> BatchService &;
  [[nodiscard]] auto api_server() -> ApiServer *;

private:
  std::atomic<bool> running_{false};
  Config config_;

  Runtime runtime_;
  std::unique_ptr<StaticInventory> inventory_;
  std::unique_ptr<TargetExpander> expander_;
  std::unique_ptr<ProcessTransport> transport_;
  std::unique_ptr<StreamingHub> hub_;
  std::unique_ptr<ExecutionQueue> queue_;
  std::unique_ptr<BatchService> batches_;
  std::unique_ptr<ApiServer> api_;
};

} // namespace opsrelay

#include "opsrelay/app/application.hpp"

#include "opsrelay/app/api/api_server.hpp"
#include "opsrelay/app/services/batch_service.hpp"
#include "opsrelay/execution/process_transport.hpp"
#include "opsrelay/execution/target_expander.hpp"
#include "opsrelay/inventory/inventory.hpp"
#include "opsrelay/streaming/streaming_hub.hpp"
#include "opsrelay/util/log.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <string>
#include <utility>

namespace opsrelay {

namespace {

constexpr std::string_view kCancelledMessage = "Execution cancelled";
constexpr auto kHubShutdownBudget = std::chrono::milliseconds(2000);

} // namespace

auto terminal_frame_for(const ExecutionUnit &unit) -> StreamFrame {
  if (!unit.exit_code.has_value()) {
    return make_frame(
        FrameType::Error, unit.id,
        JsonValue{{"error", unit.error.empty()
                                ? std::string(to_string_view(unit.status))
                                : unit.error}});
  }
  JsonValue result{{"status", std::string(to_string_view(unit.status))},
                   {"target", unit.target.str()},
                   {"exitCode", static_cast<std::int64_t>(*unit.exit_code)}};
  if (!unit.error.empty()) {
    result["error"] = unit.error;
  }
  return make_frame(FrameType::Complete, unit.id, std::move(result));
}

auto make_stream_listener(StreamingHub &hub) -> ExecutionListener {
  ExecutionListener listener;
  listener.on_started = [&hub](const ExecutionUnit &unit) {
    hub.emit_status(unit.id, ExecutionStatus::Running);
  };
  listener.on_stdout = [&hub](const ExecutionId &id, std::string_view data) {
    hub.emit_stdout(id, std::string(data));
  };
  listener.on_stderr = [&hub](const ExecutionId &id, std::string_view data) {
    hub.emit_stderr(id, std::string(data));
  };
  listener.on_command = [&hub](const ExecutionId &id, std::string_view text) {
    hub.emit_command(id, std::string(text));
  };
  listener.on_finished = [&hub](const ExecutionUnit &unit) {
    hub.emit_finished(unit.id, unit.status, terminal_frame_for(unit));
  };
  listener.on_cancelled = [&hub](const ExecutionUnit &unit) {
    hub.emit_finished(
        unit.id, ExecutionStatus::Cancelled,
        make_frame(FrameType::Error, unit.id,
                   JsonValue{{"error", std::string(kCancelledMessage)}}));
  };
  return listener;
}

Application::Application(Config config)
    : config_(std::move(config)),
      runtime_(static_cast<unsigned>(std::max(1, config_.server.threads))) {}

Application::~Application() { stop(); }

auto Application::config() const noexcept -> const Config & { return config_; }

auto Application::init() -> Result<void> {
  if (queue_) {
    return ok();
  }
  return StaticInventory::from_config(config_.inventory)
      .and_then([this](StaticInventory &&inventory) -> Result<void> {
        log::info("Inventory loaded: {} groups", inventory.group_count());
        inventory_ = std::make_unique<StaticInventory>(std::move(inventory));
        expander_ = std::make_unique<TargetExpander>(*inventory_);
        transport_ = std::make_unique<ProcessTransport>(runtime_.executor(),
                                                        config_.transport);
        hub_ = std::make_unique<StreamingHub>(runtime_.executor(),
                                              config_.streaming);
        queue_ = std::make_unique<ExecutionQueue>(
            *transport_, config_.execution_queue, make_stream_listener(*hub_));
        batches_ = std::make_unique<BatchService>(
            *expander_, *queue_,
            static_cast<std::size_t>(config_.execution_queue.history_limit));
        api_ = std::make_unique<ApiServer>(*this);
        return ok();
      });
}

auto Application::start() -> Result<void> {
  if (running_.exchange(true)) {
    return ok();
  }
  if (auto r = init(); !r) {
    running_ = false;
    return r;
  }

  if (auto r = runtime_.start(); !r) {
    running_ = false;
    return fail(r.error());
  }
  log::start();
  log::info("Runtime started with {} thread(s)", runtime_.thread_count());

  hub_->start();

  if (auto r = api_->start(); !r) {
    log::error("API server failed to start: {}", r.error().message());
    hub_->cleanup();
    runtime_.stop();
    running_ = false;
    return r;
  }

  log::info("opsrelay started: concurrent_limit={} max_queue_size={} "
            "transport='{}'",
            config_.execution_queue.concurrent_limit,
            config_.execution_queue.max_queue_size, config_.transport.program);
  return ok();
}

auto Application::stop() noexcept -> void {
  if (!running_.exchange(false)) {
    return;
  }

  log::info("Stopping opsrelay...");

  // Stop API server to reject new external requests.
  if (api_) {
    api_->stop();
  }

  if (queue_) {
    const auto dropped = queue_->clear_queue();
    if (dropped > 0) {
      log::info("Cancelled {} queued execution(s) on shutdown", dropped);
    }
  }

  if (hub_) {
    if (runtime_.is_running()) {
      auto closed = std::make_shared<std::promise<void>>();
      auto closed_future = closed->get_future();
      hub_->cleanup([closed] { closed->set_value(); });
      if (closed_future.wait_for(kHubShutdownBudget) !=
          std::future_status::ready) {
        log::warn("Streaming hub cleanup did not finish within {}ms",
                  kHubShutdownBudget.count());
      }
    } else {
      hub_->cleanup();
    }
  }

  runtime_.stop();
  log::info("opsrelay stopped");
}

auto Application::is_running() const noexcept -> bool {
  return running_.load();
}

auto Application::runtime() -> Runtime & { return runtime_; }

auto Application::inventory() const -> const StaticInventory & {
  return *inventory_;
}

auto Application::expander() const -> const TargetExpander & {
  return *expander_;
}

auto Application::queue() -> ExecutionQueue & { return *queue_; }

auto Application::hub() -> StreamingHub & { return *hub_; }

auto Application::batches() -> BatchService & { return *batches_; }

auto Application::api_server() -> ApiServer * { return api_.get(); }

} // namespace opsrelay

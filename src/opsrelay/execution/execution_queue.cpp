#include "opsrelay/execution/execution_queue.hpp"

#include "opsrelay/util/log.hpp"

#include <ankerl/unordered_dense.h>

#include <algorithm>
#include <deque>
#include <exception>
#include <mutex>
#include <utility>

namespace opsrelay {

namespace {

constexpr std::string_view kCancelledMessage = "Execution cancelled";

[[nodiscard]] auto failed_result(std::string error) -> TransportResult {
  return TransportResult{
      .status = ExecutionStatus::Failed, .exit_code = -1, .error = std::move(error)};
}

} // namespace

struct ExecutionQueue::Impl : std::enable_shared_from_this<Impl> {
  ITransportExecutor &transport_;
  ExecutionQueueConfig config_;
  ExecutionListener listener_;

  mutable std::mutex mu_;
  ankerl::unordered_dense::map<ExecutionId, ExecutionUnit> units_;
  std::deque<ExecutionId> waiting_;
  std::deque<ExecutionId> finished_;
  std::size_t running_{0};

  Impl(ITransportExecutor &transport, ExecutionQueueConfig config,
       ExecutionListener listener)
      : transport_(transport), config_(std::move(config)),
        listener_(std::move(listener)) {}

  [[nodiscard]] auto limit() const noexcept -> std::size_t {
    return static_cast<std::size_t>(std::max(config_.concurrent_limit, 1));
  }

  [[nodiscard]] auto capacity() const noexcept -> std::size_t {
    return static_cast<std::size_t>(std::max(config_.max_queue_size, 1));
  }

  // Pops waiting units into the running set while slots are free. Caller
  // holds mu_ and must launch the returned units after unlocking.
  [[nodiscard]] auto take_ready_locked() -> std::vector<ExecutionUnit> {
    std::vector<ExecutionUnit> ready;
    while (running_ < limit() && !waiting_.empty()) {
      auto id = std::move(waiting_.front());
      waiting_.pop_front();
      auto it = units_.find(id);
      if (it == units_.end()) {
        continue;
      }
      auto &unit = it->second;
      unit.status = ExecutionStatus::Running;
      unit.started_at = std::chrono::system_clock::now();
      ++running_;
      ready.push_back(unit);
    }
    return ready;
  }

  auto record_finished_locked(const ExecutionId &id) -> void {
    finished_.push_back(id);
    const auto keep = static_cast<std::size_t>(config_.history_limit);
    while (finished_.size() > keep) {
      units_.erase(finished_.front());
      finished_.pop_front();
    }
  }

  auto launch(std::vector<ExecutionUnit> ready) -> void {
    for (auto &unit : ready) {
      launch_one(std::move(unit));
    }
  }

  auto launch_one(ExecutionUnit unit) -> void {
    log::info("Dispatching execution {} ({} '{}') to {}", unit.id,
              to_string_view(unit.action.type), unit.action.action,
              unit.target);
    if (listener_.on_started) {
      listener_.on_started(unit);
    }

    std::weak_ptr<Impl> weak = weak_from_this();
    TransportSink sink;
    sink.on_stdout = [weak](const ExecutionId &id, std::string_view data) {
      if (auto self = weak.lock(); self && self->listener_.on_stdout) {
        self->listener_.on_stdout(id, data);
      }
    };
    sink.on_stderr = [weak](const ExecutionId &id, std::string_view data) {
      if (auto self = weak.lock(); self && self->listener_.on_stderr) {
        self->listener_.on_stderr(id, data);
      }
    };
    sink.on_command = [weak](const ExecutionId &id, std::string_view text) {
      if (auto self = weak.lock(); self && self->listener_.on_command) {
        self->listener_.on_command(id, text);
      }
    };
    sink.on_complete = [weak](const ExecutionId &id, TransportResult result) {
      if (auto self = weak.lock()) {
        self->finish(id, std::move(result));
      }
    };

    const auto id = unit.id;
    TransportRequest req{.execution_id = unit.id,
                         .target = std::move(unit.target),
                         .action = std::move(unit.action)};
    try {
      if (auto r = transport_.start(std::move(req), std::move(sink)); !r) {
        log::error("Transport refused execution {}: {}", id,
                   r.error().message());
        finish(id, failed_result(r.error().message()));
      }
    } catch (const std::exception &e) {
      log::error("Transport threw while starting execution {}: {}", id,
                 e.what());
      finish(id, failed_result(e.what()));
    }
  }

  auto finish(const ExecutionId &id, TransportResult result) -> void {
    ExecutionUnit snapshot;
    std::vector<ExecutionUnit> ready;
    {
      std::scoped_lock lock(mu_);
      auto it = units_.find(id);
      if (it == units_.end() || is_terminal(it->second.status)) {
        return;
      }
      auto &unit = it->second;
      if (unit.status == ExecutionStatus::Running && running_ > 0) {
        --running_;
      }
      unit.status = is_terminal(result.status) ? result.status
                                               : ExecutionStatus::Failed;
      unit.exit_code = result.exit_code;
      unit.error = std::move(result.error);
      unit.completed_at = std::chrono::system_clock::now();
      snapshot = unit;
      record_finished_locked(id);
      ready = take_ready_locked();
    }

    log::info("Execution {} finished: {}", id, to_string_view(snapshot.status));
    if (listener_.on_finished) {
      listener_.on_finished(snapshot);
    }
    launch(std::move(ready));
  }

  auto cancel_queued_locked(ExecutionUnit &unit) -> void {
    unit.status = ExecutionStatus::Cancelled;
    unit.cancel_requested = true;
    unit.error = std::string(kCancelledMessage);
    unit.completed_at = std::chrono::system_clock::now();
  }
};

ExecutionQueue::ExecutionQueue(ITransportExecutor &transport,
                               ExecutionQueueConfig config,
                               ExecutionListener listener)
    : impl_(std::make_shared<Impl>(transport, std::move(config),
                                   std::move(listener))) {}

ExecutionQueue::~ExecutionQueue() = default;

auto ExecutionQueue::submit(ExecutionUnit unit) -> Result<ExecutionId> {
  if (unit.id.empty()) {
    unit.id = generate_execution_id();
  }
  auto id = unit.id;

  std::vector<ExecutionUnit> ready;
  {
    std::scoped_lock lock(impl_->mu_);
    const auto occupied = impl_->waiting_.size() + impl_->running_;
    if (occupied >= impl_->capacity()) {
      log::warn("Execution queue is full ({} queued, {} running, max {}); "
                "rejecting {}",
                impl_->waiting_.size(), impl_->running_, impl_->capacity(),
                id);
      return fail(Error::QueueFull);
    }
    if (impl_->units_.contains(id)) {
      return fail(Error::AlreadyExists);
    }
    unit.status = ExecutionStatus::Queued;
    unit.submitted_at = std::chrono::system_clock::now();
    unit.started_at.reset();
    unit.completed_at.reset();
    impl_->units_.emplace(id, std::move(unit));
    impl_->waiting_.push_back(id);
    ready = impl_->take_ready_locked();
  }

  impl_->launch(std::move(ready));
  return ok(std::move(id));
}

auto ExecutionQueue::cancel(const ExecutionId &id) -> Result<void> {
  ExecutionUnit snapshot;
  {
    std::scoped_lock lock(impl_->mu_);
    auto it = impl_->units_.find(id);
    if (it == impl_->units_.end()) {
      return fail(Error::NotFound);
    }
    auto &unit = it->second;
    if (is_terminal(unit.status)) {
      return fail(Error::InvalidState);
    }
    if (unit.status == ExecutionStatus::Running) {
      unit.cancel_requested = true;
    } else {
      std::erase(impl_->waiting_, id);
      impl_->cancel_queued_locked(unit);
      snapshot = unit;
      impl_->record_finished_locked(id);
    }
  }

  if (snapshot.status == ExecutionStatus::Cancelled) {
    log::info("Cancelled queued execution {}", id);
    if (impl_->listener_.on_cancelled) {
      impl_->listener_.on_cancelled(snapshot);
    }
    return ok();
  }

  try {
    auto r = impl_->transport_.cancel(id);
    if (!r) {
      log::info("Transport could not cancel running execution {}: {}", id,
                r.error().message());
    }
    return r;
  } catch (const std::exception &e) {
    log::error("Transport threw while cancelling execution {}: {}", id,
               e.what());
    return fail(Error::TransportError);
  }
}

auto ExecutionQueue::get_status(const ExecutionId &id) const
    -> Result<ExecutionStatus> {
  std::scoped_lock lock(impl_->mu_);
  auto it = impl_->units_.find(id);
  if (it == impl_->units_.end()) {
    return fail(Error::NotFound);
  }
  return ok(it->second.status);
}

auto ExecutionQueue::get_unit(const ExecutionId &id) const
    -> Result<ExecutionUnit> {
  std::scoped_lock lock(impl_->mu_);
  auto it = impl_->units_.find(id);
  if (it == impl_->units_.end()) {
    return fail(Error::NotFound);
  }
  return ok(it->second);
}

auto ExecutionQueue::queue_status() const -> QueueStatus {
  std::scoped_lock lock(impl_->mu_);
  QueueStatus status{.running = impl_->running_,
                     .queued = impl_->waiting_.size(),
                     .limit = impl_->limit(),
                     .max_queue_size = impl_->capacity(),
                     .queue = {}};
  status.queue.reserve(impl_->waiting_.size());
  for (const auto &id : impl_->waiting_) {
    auto it = impl_->units_.find(id);
    if (it == impl_->units_.end()) {
      continue;
    }
    const auto &unit = it->second;
    status.queue.push_back(QueuedEntry{.id = unit.id,
                                       .target = unit.target,
                                       .type = unit.action.type,
                                       .action = unit.action.action,
                                       .enqueued_at = unit.submitted_at});
  }
  return status;
}

auto ExecutionQueue::clear_queue() -> std::size_t {
  std::vector<ExecutionUnit> cancelled;
  {
    std::scoped_lock lock(impl_->mu_);
    while (!impl_->waiting_.empty()) {
      auto id = std::move(impl_->waiting_.front());
      impl_->waiting_.pop_front();
      auto it = impl_->units_.find(id);
      if (it == impl_->units_.end()) {
        continue;
      }
      impl_->cancel_queued_locked(it->second);
      cancelled.push_back(it->second);
      impl_->record_finished_locked(id);
    }
  }

  if (!cancelled.empty()) {
    log::info("Cleared {} queued executions", cancelled.size());
  }
  if (impl_->listener_.on_cancelled) {
    for (const auto &unit : cancelled) {
      impl_->listener_.on_cancelled(unit);
    }
  }
  return cancelled.size();
}

auto ExecutionQueue::running_count() const -> std::size_t {
  std::scoped_lock lock(impl_->mu_);
  return impl_->running_;
}

auto ExecutionQueue::queued_count() const -> std::size_t {
  std::scoped_lock lock(impl_->mu_);
  return impl_->waiting_.size();
}

auto ExecutionQueue::config() const noexcept -> const ExecutionQueueConfig & {
  return impl_->config_;
}

} // namespace opsrelay

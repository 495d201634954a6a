#include "opsrelay/app/services/batch_service.hpp"

#include "opsrelay/util/log.hpp"

#include <ankerl/unordered_dense.h>

#include <cmath>
#include <deque>
#include <mutex>
#include <utility>

namespace opsrelay {

namespace {

struct BatchRecord {
  BatchId id;
  ActionDescriptor action;
  std::vector<NodeId> targets;
  std::vector<ExecutionId> execution_ids;
  std::chrono::system_clock::time_point created_at{};
  bool cancelled{false};
};

auto tally(BatchStats &stats, ExecutionStatus status) -> void {
  switch (status) {
  case ExecutionStatus::Queued:
    ++stats.queued;
    break;
  case ExecutionStatus::Running:
    ++stats.running;
    break;
  case ExecutionStatus::Succeeded:
    ++stats.success;
    break;
  case ExecutionStatus::Failed:
  case ExecutionStatus::Partial:
    ++stats.failed;
    break;
  case ExecutionStatus::Cancelled:
    ++stats.cancelled;
    break;
  }
}

[[nodiscard]] auto aggregate_state(const BatchStats &stats, bool cancelled)
    -> BatchState {
  if (cancelled) {
    return BatchState::Cancelled;
  }
  const auto done = stats.success + stats.failed + stats.cancelled;
  if (stats.total == 0 || done < stats.total) {
    return BatchState::Running;
  }
  if (stats.success == stats.total) {
    return BatchState::Success;
  }
  if (stats.success == 0) {
    return BatchState::Failed;
  }
  return BatchState::Partial;
}

} // namespace

struct BatchService::Impl {
  const TargetExpander &expander_;
  ExecutionQueue &queue_;
  std::size_t history_limit_;

  mutable std::mutex mu_;
  ankerl::unordered_dense::map<BatchId, BatchRecord> batches_;
  std::deque<BatchId> order_;

  Impl(const TargetExpander &expander, ExecutionQueue &queue,
       std::size_t history_limit)
      : expander_(expander), queue_(queue), history_limit_(history_limit) {}

  auto record(BatchRecord batch) -> void {
    std::scoped_lock lock(mu_);
    order_.push_back(batch.id);
    batches_.insert_or_assign(batch.id, std::move(batch));
    while (order_.size() > history_limit_) {
      batches_.erase(order_.front());
      order_.pop_front();
    }
  }
};

BatchService::BatchService(const TargetExpander &expander,
                           ExecutionQueue &queue, std::size_t history_limit)
    : impl_(std::make_unique<Impl>(expander, queue, history_limit)) {}

BatchService::~BatchService() = default;

auto BatchService::create_batch(BatchRequest request)
    -> Result<BatchResponse> {
  if (request.action.action.empty()) {
    log::warn("Rejecting batch: empty action");
    return fail(Error::InvalidArgument);
  }
  if (request.target_node_ids.empty() && request.target_group_ids.empty()) {
    log::warn("Rejecting batch: no targets or groups");
    return fail(Error::InvalidArgument);
  }

  auto expanded = impl_->expander_.expand(request.target_node_ids,
                                          request.target_group_ids);
  if (!expanded) {
    return fail(expanded.error());
  }
  if (expanded->targets.empty()) {
    log::warn("Rejecting batch: groups expanded to no nodes");
    return fail(Error::InvalidArgument);
  }

  BatchRecord batch{.id = generate_batch_id(),
                    .action = request.action,
                    .targets = expanded->targets,
                    .execution_ids = {},
                    .created_at = std::chrono::system_clock::now(),
                    .cancelled = false};
  batch.execution_ids.reserve(batch.targets.size());

  log::info("Creating batch {}: {} '{}' on {} targets", batch.id,
            to_string_view(batch.action.type), batch.action.action,
            batch.targets.size());

  for (std::size_t pos = 0; pos < batch.targets.size(); ++pos) {
    ExecutionUnit unit{.id = generate_execution_id(),
                       .batch_id = batch.id,
                       .batch_position = pos,
                       .target = batch.targets[pos],
                       .action = request.action};
    auto id = impl_->queue_.submit(std::move(unit));
    if (!id) {
      log::warn("Batch {} stopped at target {} of {}: {}", batch.id, pos + 1,
                batch.targets.size(), id.error().message());
      impl_->record(std::move(batch));
      return fail(id.error());
    }
    batch.execution_ids.push_back(std::move(*id));
  }

  BatchResponse response{.batch_id = batch.id,
                         .execution_ids = batch.execution_ids,
                         .target_count = batch.targets.size(),
                         .expanded_node_ids = batch.targets};
  impl_->record(std::move(batch));
  return ok(std::move(response));
}

auto BatchService::get_batch_status(const BatchId &id) const
    -> Result<BatchStatus> {
  BatchRecord batch;
  {
    std::scoped_lock lock(impl_->mu_);
    auto it = impl_->batches_.find(id);
    if (it == impl_->batches_.end()) {
      return fail(Error::NotFound);
    }
    batch = it->second;
  }

  BatchStatus status{.batch_id = batch.id,
                     .action = std::move(batch.action),
                     .targets = std::move(batch.targets),
                     .created_at = batch.created_at};
  status.executions.reserve(batch.execution_ids.size());
  for (const auto &exec_id : batch.execution_ids) {
    auto unit = impl_->queue_.get_unit(exec_id);
    if (!unit) {
      // Evicted from queue history.
      continue;
    }
    tally(status.stats, unit->status);
    status.executions.push_back(std::move(*unit));
  }
  status.stats.total = status.executions.size();

  const auto done =
      status.stats.success + status.stats.failed + status.stats.cancelled;
  status.progress =
      status.stats.total == 0
          ? 0
          : static_cast<int>(std::lround(100.0 * static_cast<double>(done) /
                                         static_cast<double>(status.stats.total)));
  status.status = aggregate_state(status.stats, batch.cancelled);
  return ok(std::move(status));
}

auto BatchService::cancel_batch(const BatchId &id) -> Result<std::size_t> {
  std::vector<ExecutionId> ids;
  {
    std::scoped_lock lock(impl_->mu_);
    auto it = impl_->batches_.find(id);
    if (it == impl_->batches_.end()) {
      return fail(Error::NotFound);
    }
    it->second.cancelled = true;
    ids = it->second.execution_ids;
  }

  // Waiting units go first so a stopped unit's slot is not handed to a
  // sibling from the same batch.
  std::size_t cancelled = 0;
  for (const bool queued_pass : {true, false}) {
    for (const auto &exec_id : ids) {
      auto status = impl_->queue_.get_status(exec_id);
      if (!status || is_terminal(*status) ||
          (*status == ExecutionStatus::Queued) != queued_pass) {
        continue;
      }
      if (auto r = impl_->queue_.cancel(exec_id); r) {
        ++cancelled;
      } else {
        log::debug("Batch {}: cancel of {} not honoured: {}", id, exec_id,
                   r.error().message());
      }
    }
  }
  log::info("Batch {} cancelled: {} of {} units", id, cancelled, ids.size());
  return ok(cancelled);
}

} // namespace opsrelay

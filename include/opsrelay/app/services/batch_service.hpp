#pragma once

#include "opsrelay/core/error.hpp"
#include "opsrelay/execution/execution_queue.hpp"
#include "opsrelay/execution/execution_unit.hpp"
#include "opsrelay/execution/target_expander.hpp"
#include "opsrelay/util/enum.hpp"
#include "opsrelay/util/id.hpp"

#include <boost/describe/enum.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace opsrelay {

struct BatchRequest {
  std::vector<NodeId> target_node_ids;
  std::vector<GroupId> target_group_ids;
  ActionDescriptor action;
};

struct BatchResponse {
  BatchId batch_id;
  std::vector<ExecutionId> execution_ids;
  std::size_t target_count{0};
  std::vector<NodeId> expanded_node_ids;
};

enum class BatchState : std::uint8_t {
  Running,
  Success,
  Failed,
  Partial,
  Cancelled,
};
BOOST_DESCRIBE_ENUM(BatchState, Running, Success, Failed, Partial, Cancelled)
OPSRELAY_DEFINE_ENUM_SERDE(BatchState, BatchState::Running)

struct BatchStats {
  std::size_t total{0};
  std::size_t queued{0};
  std::size_t running{0};
  std::size_t success{0};
  std::size_t failed{0};
  std::size_t cancelled{0};
};

struct BatchStatus {
  BatchId batch_id;
  ActionDescriptor action;
  std::vector<NodeId> targets;
  std::chrono::system_clock::time_point created_at{};
  std::vector<ExecutionUnit> executions; // batch order
  BatchStats stats;
  int progress{0}; // percent of units in a terminal state
  BatchState status{BatchState::Running};
};

/// Creates and tracks batches: one execution unit per expanded target, all
/// sharing a batch id. Each unit is admitted and completed independently.
class BatchService {
public:
  BatchService(const TargetExpander &expander, ExecutionQueue &queue,
               std::size_t history_limit = 1000);
  ~BatchService();

  BatchService(const BatchService &) = delete;
  auto operator=(const BatchService &) -> BatchService & = delete;

  /// Error::InvalidArgument for a malformed request, Error::TargetResolution
  /// for an unknown group (nothing is queued), Error::QueueFull when the
  /// queue rejects a unit. Units admitted before a rejection keep running.
  [[nodiscard]] auto create_batch(BatchRequest request)
      -> Result<BatchResponse>;

  [[nodiscard]] auto get_batch_status(const BatchId &id) const
      -> Result<BatchStatus>;

  /// Cancels queued units and asks the transport to stop running ones.
  /// Returns the number of units a cancellation was issued for.
  [[nodiscard]] auto cancel_batch(const BatchId &id) -> Result<std::size_t>;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace opsrelay

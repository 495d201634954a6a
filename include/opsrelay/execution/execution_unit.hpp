#pragma once

#include "opsrelay/util/enum.hpp"
#include "opsrelay/util/id.hpp"

#include <boost/describe/enum.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace opsrelay {

enum class ExecutionStatus : std::uint8_t {
  Queued,
  Running,
  Succeeded,
  Failed,
  Partial,
  Cancelled,
};
BOOST_DESCRIBE_ENUM(ExecutionStatus, Queued, Running, Succeeded, Failed,
                    Partial, Cancelled)
OPSRELAY_DEFINE_ENUM_SERDE(ExecutionStatus, ExecutionStatus::Queued)

enum class ActionType : std::uint8_t {
  Command,
  Task,
  Plan,
};
BOOST_DESCRIBE_ENUM(ActionType, Command, Task, Plan)
OPSRELAY_DEFINE_ENUM_SERDE(ActionType, ActionType::Command)

[[nodiscard]] constexpr auto is_terminal(ExecutionStatus s) noexcept -> bool {
  return s == ExecutionStatus::Succeeded || s == ExecutionStatus::Failed ||
         s == ExecutionStatus::Partial || s == ExecutionStatus::Cancelled;
}

/// What to run: a command line, a named task or a named plan, plus its
/// parameters.
struct ActionDescriptor {
  ActionType type{ActionType::Command};
  std::string action;
  std::map<std::string, std::string> parameters;
};

struct ExecutionUnit {
  ExecutionId id;
  std::optional<BatchId> batch_id;
  std::optional<std::size_t> batch_position;
  NodeId target;
  ActionDescriptor action;
  ExecutionStatus status{ExecutionStatus::Queued};
  std::chrono::system_clock::time_point submitted_at{};
  std::optional<std::chrono::system_clock::time_point> started_at;
  std::optional<std::chrono::system_clock::time_point> completed_at;
  std::optional<int> exit_code;
  std::string error;
  bool cancel_requested{false};
};

/// Terminal outcome reported by a transport.
struct TransportResult {
  ExecutionStatus status{ExecutionStatus::Succeeded};
  int exit_code{0};
  std::string error;
};

} // namespace opsrelay

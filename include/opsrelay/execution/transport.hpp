#pragma once

#include "opsrelay/core/error.hpp"
#include "opsrelay/execution/execution_unit.hpp"
#include "opsrelay/util/id.hpp"

#include <functional>
#include <string_view>

namespace opsrelay {

struct TransportRequest {
  ExecutionId execution_id;
  NodeId target;
  ActionDescriptor action;
};

/// Streaming callbacks a transport invokes while an action runs. Callbacks may
/// fire on any io thread; on_complete fires exactly once per successful
/// start().
struct TransportSink {
  std::move_only_function<void(const ExecutionId &id, std::string_view data)>
      on_stdout;
  std::move_only_function<void(const ExecutionId &id, std::string_view data)>
      on_stderr;
  std::move_only_function<void(const ExecutionId &id, std::string_view text)>
      on_command;
  std::move_only_function<void(const ExecutionId &id, TransportResult result)>
      on_complete;
};

class ITransportExecutor {
public:
  virtual ~ITransportExecutor() = default;

  /// Begins running `req`. A failure here means on_complete will never fire.
  virtual auto start(TransportRequest req, TransportSink sink)
      -> Result<void> = 0;

  /// Best-effort cancellation of a running action. Transports without
  /// cancellation support return Error::NotSupported.
  virtual auto cancel(const ExecutionId &id) -> Result<void> = 0;
};

} // namespace opsrelay

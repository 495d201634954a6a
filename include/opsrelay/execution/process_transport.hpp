#pragma once

#include "opsrelay/config/system_config.hpp"
#include "opsrelay/execution/transport.hpp"

#include <boost/asio/any_io_executor.hpp>

#include <memory>
#include <string>
#include <vector>

namespace opsrelay {

inline constexpr int kExitCodeTimeout = 124;

/// Arguments (without the program) for running `req` through a Bolt
/// compatible CLI:
///   command run <cmd>  --targets <node> --format json
///   task run <task>    --targets <node> --params <json> --format json
///   plan run <plan>    --targets <node> --params <json> --format json
[[nodiscard]] auto build_transport_args(const TransportConfig &config,
                                        const TransportRequest &req)
    -> std::vector<std::string>;

/// Human-readable command line; arguments with spaces or quotes are
/// double-quoted.
[[nodiscard]] auto render_command_line(const std::string &program,
                                       const std::vector<std::string> &args)
    -> std::string;

/// Runs each request as a child process and streams its stdout/stderr pipes
/// into the sink. Cancellation kills the child.
class ProcessTransport final : public ITransportExecutor {
public:
  ProcessTransport(boost::asio::any_io_executor executor,
                   TransportConfig config);
  ~ProcessTransport() override;

  ProcessTransport(const ProcessTransport &) = delete;
  auto operator=(const ProcessTransport &) -> ProcessTransport & = delete;

  auto start(TransportRequest req, TransportSink sink) -> Result<void> override;
  auto cancel(const ExecutionId &id) -> Result<void> override;

  [[nodiscard]] auto active_count() const -> std::size_t;

private:
  struct Impl;
  std::shared_ptr<Impl> impl_;
};

} // namespace opsrelay

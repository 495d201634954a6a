#include "opsrelay/execution/process_transport.hpp"

#include "opsrelay/core/coroutine.hpp"
#include "opsrelay/util/json.hpp"
#include "opsrelay/util/log.hpp"
#include "opsrelay/util/utf8.hpp"

#include <ankerl/unordered_dense.h>
#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/cancel_after.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/readable_pipe.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/process/v2/environment.hpp>
#include <boost/process/v2/process.hpp>
#include <boost/process/v2/stdio.hpp>

#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <exception>
#include <filesystem>
#include <format>
#include <mutex>
#include <optional>
#include <utility>

#include <unistd.h>

namespace opsrelay {

namespace {

namespace bp = boost::process::v2;

using Strand = boost::asio::strand<boost::asio::any_io_executor>;

inline constexpr std::size_t kReadBufferSize = 4096;
inline constexpr std::string_view kCancelledMessage = "Execution cancelled";
// How long pipes may stay open after the child exits (held by grandchildren).
inline constexpr auto kPipeDrainTimeout = std::chrono::milliseconds(200);

// Pipe-reader control for one child. Only touched on the child's strand.
struct ChildIo {
  explicit ChildIo(const Strand &strand) : drain_timer(strand) {}

  std::array<boost::asio::cancellation_signal, 2> read_cancel;
  boost::asio::steady_timer drain_timer;
  int open_readers{2};
  bool reads_stopped{false};

  auto stop_reading() -> void {
    if (std::exchange(reads_stopped, true)) {
      return;
    }
    for (auto &sig : read_cancel) {
      sig.emit(boost::asio::cancellation_type::total);
    }
  }
};

struct ActiveProcess {
  pid_t pid{-1};
  bool cancelled{false};
  Strand strand;
  std::shared_ptr<ChildIo> io;
};

struct WaitProcessResult {
  int exit_code{-1};
  bool timed_out{false};
};

// Runs in the child before exec: a group of its own, so a kill reaches
// everything it spawned.
struct NewProcessGroup {
  template <typename Launcher>
  auto on_exec_setup(Launcher &, const bp::filesystem::path &,
                     const char *const *&) -> boost::system::error_code {
    if (::setpgid(0, 0) != 0) {
      return {errno, boost::system::system_category()};
    }
    return {};
  }
};

auto kill_process_group(pid_t pid) -> void {
  if (pid <= 0) {
    return;
  }
  if (::kill(-pid, SIGKILL) != 0) {
    (void)::kill(pid, SIGKILL);
  }
}

[[nodiscard]] auto params_json(const ActionDescriptor &action) -> std::string {
  std::string out;
  if (auto ec = glz::write_json(action.parameters, out); ec) {
    return "{}";
  }
  return out;
}

[[nodiscard]] auto read_stream(boost::asio::readable_pipe &pipe,
                               std::shared_ptr<TransportSink> sink,
                               ExecutionId id, bool is_stderr,
                               std::shared_ptr<ChildIo> io) -> task<void> {
  auto &cb = is_stderr ? sink->on_stderr : sink->on_stdout;
  auto &cancel_sig = io->read_cancel[is_stderr ? 1 : 0];
  utf8::ChunkJoiner joiner;
  std::array<char, kReadBufferSize> buffer{};
  while (!io->reads_stopped) {
    auto [ec, bytes] = co_await pipe.async_read_some(
        boost::asio::buffer(buffer.data(), buffer.size()),
        boost::asio::bind_cancellation_slot(cancel_sig.slot(), use_nothrow));
    if (bytes > 0 && cb) {
      if (auto text = joiner.push(std::string_view(buffer.data(), bytes));
          !text.empty()) {
        cb(id, text);
      }
    }
    if (ec) {
      break;
    }
  }
  if (auto rest = joiner.flush(); !rest.empty() && cb) {
    cb(id, rest);
  }
  if (--io->open_readers == 0) {
    io->drain_timer.cancel();
  }
}

// Gives the readers a short window to reach EOF, then stops them.
[[nodiscard]] auto drain_pipes(ChildIo &io) -> task<void> {
  if (io.open_readers > 0 && !io.reads_stopped) {
    io.drain_timer.expires_after(kPipeDrainTimeout);
    auto [ec] = co_await io.drain_timer.async_wait(use_nothrow);
    (void)ec;
  }
  io.stop_reading();
}

[[nodiscard]] auto wait_process(bp::process &proc, int timeout_sec,
                                std::shared_ptr<ChildIo> io)
    -> task<WaitProcessResult> {
  if (timeout_sec <= 0) {
    auto [ec, exit_code] = co_await proc.async_wait(use_nothrow);
    co_await drain_pipes(*io);
    co_return WaitProcessResult{.exit_code = ec ? -1 : exit_code,
                                .timed_out = false};
  }

  auto [ec, exit_code] = co_await proc.async_wait(
      boost::asio::cancel_after(std::chrono::seconds(timeout_sec), use_nothrow));
  if (!ec) {
    co_await drain_pipes(*io);
    co_return WaitProcessResult{.exit_code = exit_code, .timed_out = false};
  }
  if (ec == boost::asio::error::operation_aborted) {
    io->stop_reading();
    kill_process_group(proc.id());
    boost::system::error_code ignored;
    proc.terminate(ignored);
    auto [wait_ec, ignored_exit] = co_await proc.async_wait(use_nothrow);
    (void)wait_ec;
    (void)ignored_exit;
    co_return WaitProcessResult{.exit_code = kExitCodeTimeout,
                                .timed_out = true};
  }
  co_await drain_pipes(*io);
  co_return WaitProcessResult{.exit_code = -1, .timed_out = false};
}

} // namespace

auto build_transport_args(const TransportConfig &config,
                          const TransportRequest &req)
    -> std::vector<std::string> {
  std::vector<std::string> args;
  args.reserve(8 + config.extra_args.size());
  args.emplace_back(to_string_view(req.action.type));
  args.emplace_back("run");
  args.push_back(req.action.action);
  args.emplace_back("--targets");
  args.push_back(req.target.str());
  if (req.action.type != ActionType::Command &&
      !req.action.parameters.empty()) {
    args.emplace_back("--params");
    args.push_back(params_json(req.action));
  }
  args.emplace_back("--format");
  args.emplace_back("json");
  args.insert(args.end(), config.extra_args.begin(), config.extra_args.end());
  return args;
}

auto render_command_line(const std::string &program,
                         const std::vector<std::string> &args) -> std::string {
  std::string out = program;
  for (const auto &arg : args) {
    out.push_back(' ');
    if (arg.find_first_of(" \"'") == std::string::npos) {
      out += arg;
      continue;
    }
    out.push_back('"');
    for (char c : arg) {
      if (c == '"') {
        out.push_back('\\');
      }
      out.push_back(c);
    }
    out.push_back('"');
  }
  return out;
}

struct ProcessTransport::Impl : std::enable_shared_from_this<Impl> {
  boost::asio::any_io_executor executor_;
  TransportConfig config_;
  mutable std::mutex mu_;
  ankerl::unordered_dense::map<ExecutionId, ActiveProcess> active_;

  Impl(boost::asio::any_io_executor executor, TransportConfig config)
      : executor_(std::move(executor)), config_(std::move(config)) {}

  [[nodiscard]] auto resolve_program() const -> bp::filesystem::path {
    if (config_.program.find('/') != std::string::npos) {
      if (!std::filesystem::exists(config_.program)) {
        return {};
      }
      return bp::filesystem::path(config_.program);
    }
    return bp::environment::find_executable(config_.program);
  }

  // Returns whether the process was cancelled while running.
  auto unregister(const ExecutionId &id) -> bool {
    std::scoped_lock lock(mu_);
    auto it = active_.find(id);
    if (it == active_.end()) {
      return false;
    }
    const bool cancelled = it->second.cancelled;
    active_.erase(it);
    return cancelled;
  }

  static auto supervise(std::shared_ptr<Impl> self, bp::process proc,
                        boost::asio::readable_pipe out,
                        boost::asio::readable_pipe err, ExecutionId id,
                        std::shared_ptr<TransportSink> sink,
                        std::shared_ptr<ChildIo> io) -> spawn_task {
    using namespace boost::asio::experimental::awaitable_operators;
    auto waited =
        co_await (read_stream(out, sink, id, false, io) &&
                  read_stream(err, sink, id, true, io) &&
                  wait_process(proc, self->config_.timeout_sec, io));

    const bool cancelled = self->unregister(id);
    TransportResult result{.status = ExecutionStatus::Succeeded,
                           .exit_code = waited.exit_code,
                           .error = {}};
    if (cancelled) {
      result.status = ExecutionStatus::Failed;
      result.error = std::string(kCancelledMessage);
    } else if (waited.timed_out) {
      result.status = ExecutionStatus::Failed;
      result.error = std::format("Execution timed out after {}s",
                                 self->config_.timeout_sec);
    } else if (waited.exit_code != 0) {
      result.status = ExecutionStatus::Failed;
      result.error =
          std::format("Command exited with code {}", waited.exit_code);
    }

    log::info("process finish: execution_id={} exit_code={} timed_out={} "
              "cancelled={}",
              id, result.exit_code, waited.timed_out, cancelled);
    if (sink->on_complete) {
      sink->on_complete(id, std::move(result));
    }
  }
};

ProcessTransport::ProcessTransport(boost::asio::any_io_executor executor,
                                   TransportConfig config)
    : impl_(std::make_shared<Impl>(std::move(executor), std::move(config))) {}

ProcessTransport::~ProcessTransport() = default;

auto ProcessTransport::start(TransportRequest req, TransportSink sink)
    -> Result<void> {
  if (req.action.action.empty() || req.target.empty()) {
    return fail(Error::InvalidArgument);
  }

  const auto exe = impl_->resolve_program();
  if (exe.empty()) {
    log::error("Transport program '{}' not found in PATH",
               impl_->config_.program);
    return fail(Error::FileNotFound);
  }

  auto args = build_transport_args(impl_->config_, req);
  auto shared_sink = std::make_shared<TransportSink>(std::move(sink));
  if (shared_sink->on_command) {
    shared_sink->on_command(req.execution_id,
                            render_command_line(impl_->config_.program, args));
  }

  // One strand per child so its two pipe readers never run concurrently.
  auto strand = boost::asio::make_strand(impl_->executor_);
  boost::asio::readable_pipe stdout_pipe(strand);
  boost::asio::readable_pipe stderr_pipe(strand);
  std::optional<bp::process> proc;
  try {
    proc.emplace(strand, exe, args,
                 bp::process_stdio{
                     .in = nullptr, .out = stdout_pipe, .err = stderr_pipe},
                 NewProcessGroup{});
  } catch (const std::exception &ex) {
    log::error("Failed to launch '{}' for execution {}: {}", exe.string(),
               req.execution_id, ex.what());
    return fail(Error::TransportError);
  }

  const auto pid = proc->id();
  auto io = std::make_shared<ChildIo>(strand);
  {
    std::scoped_lock lock(impl_->mu_);
    impl_->active_.insert_or_assign(
        req.execution_id,
        ActiveProcess{.pid = pid, .strand = strand, .io = io});
  }
  log::info("process started pid={} execution_id={} target={}", pid,
            req.execution_id, req.target);

  co_spawn(strand,
           Impl::supervise(impl_, std::move(*proc), std::move(stdout_pipe),
                           std::move(stderr_pipe), req.execution_id,
                           std::move(shared_sink), std::move(io)),
           detached);
  return ok();
}

auto ProcessTransport::cancel(const ExecutionId &id) -> Result<void> {
  std::scoped_lock lock(impl_->mu_);
  auto it = impl_->active_.find(id);
  if (it == impl_->active_.end() || it->second.pid <= 0) {
    return fail(Error::NotFound);
  }
  it->second.cancelled = true;
  kill_process_group(it->second.pid);
  boost::asio::post(it->second.strand,
                    [io = it->second.io] { io->stop_reading(); });
  log::info("Killed process group pid={} for execution {}", it->second.pid,
            id);
  return ok();
}

auto ProcessTransport::active_count() const -> std::size_t {
  std::scoped_lock lock(impl_->mu_);
  return impl_->active_.size();
}

} // namespace opsrelay

#include "opsrelay/streaming/streaming_hub.hpp"

#include "opsrelay/util/log.hpp"
#include "opsrelay/util/utf8.hpp"

#include <ankerl/unordered_dense.h>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <deque>
#include <exception>
#include <format>
#include <optional>
#include <utility>
#include <vector>

namespace opsrelay {

auto truncate_line(std::string_view line, std::size_t max_length)
    -> std::string {
  if (line.size() <= max_length) {
    return std::string(line);
  }
  const auto cut = utf8::floor_boundary(line, max_length);
  return std::format("{}... [truncated {} characters]", line.substr(0, cut),
                     line.size() - cut);
}

auto output_limit_message(std::size_t max_output_size) -> std::string {
  return std::format("\n[Output limit of {} bytes reached. Further output "
                     "will be truncated.]\n",
                     max_output_size);
}

namespace {

using Strand = boost::asio::strand<boost::asio::any_io_executor>;

constexpr std::string_view kLimitWarning = "output-limit-reached";
// Terminal frames remembered after teardown for subscribers that attach late.
constexpr std::size_t kRecentTerminalLimit = 256;

enum class StreamKind : std::uint8_t { Stdout, Stderr };

[[nodiscard]] constexpr auto frame_type_of(StreamKind kind) noexcept
    -> FrameType {
  return kind == StreamKind::Stdout ? FrameType::Stdout : FrameType::Stderr;
}

struct Subscriber {
  std::shared_ptr<ISubscriberChannel> channel;
  std::chrono::system_clock::time_point connected_at;
};

struct OutputBuffer {
  explicit OutputBuffer(const Strand &strand) : timer(strand) {}

  std::vector<std::string> chunks;
  std::size_t pending_bytes{0};
  boost::asio::steady_timer timer;
  // Bumped on every re-arm and flush; a handler whose generation is stale
  // does nothing.
  std::uint64_t generation{0};
};

struct ExecutionState {
  explicit ExecutionState(const Strand &strand)
      : stdout_buffer(strand), stderr_buffer(strand), close_timer(strand) {}

  [[nodiscard]] auto buffer(StreamKind kind) -> OutputBuffer & {
    return kind == StreamKind::Stdout ? stdout_buffer : stderr_buffer;
  }

  auto cancel_timers() -> void {
    ++stdout_buffer.generation;
    ++stderr_buffer.generation;
    stdout_buffer.timer.cancel();
    stderr_buffer.timer.cancel();
    close_timer.cancel();
  }

  std::vector<Subscriber> subscribers;
  OutputBuffer stdout_buffer;
  OutputBuffer stderr_buffer;
  std::size_t total_bytes{0};
  bool limit_reached{false};
  bool terminal{false};
  std::string terminal_frame;
  boost::asio::steady_timer close_timer;
};

auto close_channel(ISubscriberChannel &channel) -> void {
  try {
    channel.close();
  } catch (const std::exception &e) {
    log::warn("Subscriber channel close failed: {}", e.what());
  }
}

// One best-effort write. false means the subscriber is broken and has been
// closed.
[[nodiscard]] auto try_write(const ExecutionId &id, Subscriber &sub,
                             std::string_view payload) -> bool {
  try {
    if (auto r = sub.channel->write(payload); !r) {
      log::warn("Dropping subscriber of execution {}: {}", id,
                r.error().message());
      close_channel(*sub.channel);
      return false;
    }
    return true;
  } catch (const std::exception &e) {
    log::warn("Dropping subscriber of execution {}: write threw: {}", id,
              e.what());
    close_channel(*sub.channel);
    return false;
  }
}

} // namespace

struct StreamingHub::Impl : std::enable_shared_from_this<StreamingHub::Impl> {
  Strand strand_;
  StreamingConfig config_;
  ankerl::unordered_dense::map<ExecutionId, std::unique_ptr<ExecutionState>>
      executions_;
  std::deque<std::pair<ExecutionId, std::string>> recent_terminal_;
  boost::asio::steady_timer heartbeat_timer_;
  bool heartbeat_active_{false};

  Impl(boost::asio::any_io_executor executor, StreamingConfig config)
      : strand_(boost::asio::make_strand(std::move(executor))),
        config_(std::move(config)), heartbeat_timer_(strand_) {}

  template <typename F> auto post(F &&fn) -> void {
    boost::asio::post(strand_,
                      [self = shared_from_this(),
                       fn = std::forward<F>(fn)]() mutable { fn(*self); });
  }

  [[nodiscard]] auto find(const ExecutionId &id) -> ExecutionState * {
    auto it = executions_.find(id);
    return it == executions_.end() ? nullptr : it->second.get();
  }

  [[nodiscard]] auto find(const ExecutionId &id) const
      -> const ExecutionState * {
    auto it = executions_.find(id);
    return it == executions_.end() ? nullptr : it->second.get();
  }

  auto state_for(const ExecutionId &id) -> ExecutionState & {
    auto it = executions_.find(id);
    if (it == executions_.end()) {
      it = executions_.emplace(id, std::make_unique<ExecutionState>(strand_))
               .first;
    }
    return *it->second;
  }

  auto deliver(const ExecutionId &id, ExecutionState &state,
               std::string_view payload) -> void {
    std::erase_if(state.subscribers, [&](Subscriber &sub) {
      return !try_write(id, sub, payload);
    });
  }

  auto emit_frame(const ExecutionId &id, ExecutionState &state,
                  const StreamFrame &frame) -> void {
    if (state.subscribers.empty()) {
      return;
    }
    deliver(id, state, serialize_sse(frame));
  }

  // --- subscription -------------------------------------------------------

  auto subscribe(const ExecutionId &id,
                 std::shared_ptr<ISubscriberChannel> channel) -> void {
    Subscriber sub{.channel = std::move(channel),
                   .connected_at = std::chrono::system_clock::now()};

    const auto start = serialize_sse(make_frame(
        FrameType::Start, id,
        JsonValue{{"message", std::string(kConnectedMessage)}}));
    if (!try_write(id, sub, start)) {
      return;
    }

    auto *state = find(id);
    if (state == nullptr) {
      auto recent = std::ranges::find(recent_terminal_, id,
                                      &std::pair<ExecutionId, std::string>::first);
      if (recent != recent_terminal_.end()) {
        // Execution already torn down: replay its outcome and hang up.
        if (try_write(id, sub, recent->second)) {
          close_channel(*sub.channel);
        }
        return;
      }
      state = &state_for(id);
    } else if (state->terminal) {
      if (!try_write(id, sub, state->terminal_frame)) {
        return;
      }
    }

    std::weak_ptr<Impl> weak = weak_from_this();
    const ISubscriberChannel *key = sub.channel.get();
    sub.channel->on_close([weak, id, key] {
      if (auto self = weak.lock()) {
        self->post([id, key](Impl &impl) { impl.remove(id, key); });
      }
    });

    state->subscribers.push_back(std::move(sub));
    log::debug("Subscriber attached to execution {} ({} total)", id,
               state->subscribers.size());
  }

  auto remove(const ExecutionId &id, const ISubscriberChannel *key) -> void {
    auto *state = find(id);
    if (state == nullptr) {
      return;
    }
    const auto removed = std::erase_if(
        state->subscribers,
        [key](const Subscriber &sub) { return sub.channel.get() == key; });
    if (removed > 0) {
      log::debug("Subscriber detached from execution {} ({} left)", id,
                 state->subscribers.size());
    }
  }

  // --- output pipeline ----------------------------------------------------

  auto flush(const ExecutionId &id, ExecutionState &state, StreamKind kind)
      -> void {
    auto &buf = state.buffer(kind);
    ++buf.generation;
    buf.timer.cancel();
    if (buf.chunks.empty()) {
      return;
    }

    std::string combined;
    combined.reserve(buf.pending_bytes);
    for (const auto &chunk : buf.chunks) {
      combined += chunk;
    }
    buf.chunks.clear();
    buf.pending_bytes = 0;

    if (!combined.empty()) {
      emit_frame(id, state,
                 make_frame(frame_type_of(kind), id,
                            JsonValue{{"output", std::move(combined)}}));
    }
  }

  auto arm_flush(const ExecutionId &id, OutputBuffer &buf, StreamKind kind)
      -> void {
    const auto generation = ++buf.generation;
    buf.timer.expires_after(std::chrono::milliseconds(config_.buffer_ms));
    std::weak_ptr<Impl> weak = weak_from_this();
    buf.timer.async_wait(
        [weak, id, kind, generation](const boost::system::error_code &ec) {
          if (ec) {
            return;
          }
          auto self = weak.lock();
          if (!self) {
            return;
          }
          auto *state = self->find(id);
          if (state == nullptr ||
              state->buffer(kind).generation != generation) {
            return;
          }
          self->flush(id, *state, kind);
        });
  }

  auto emit_output(const ExecutionId &id, StreamKind kind, std::string chunk)
      -> void {
    auto &state = state_for(id);
    if (state.limit_reached || state.terminal) {
      return;
    }

    if (state.total_bytes + chunk.size() > config_.max_output_size) {
      state.limit_reached = true;
      log::warn("Execution {} exceeded output limit of {} bytes; further "
                "output is dropped",
                id, config_.max_output_size);
      flush(id, state, StreamKind::Stdout);
      flush(id, state, StreamKind::Stderr);
      emit_frame(
          id, state,
          make_frame(
              frame_type_of(kind), id,
              JsonValue{
                  {"output", output_limit_message(config_.max_output_size)},
                  {"warning", std::string(kLimitWarning)}}));
      return;
    }
    state.total_bytes += chunk.size();

    auto &buf = state.buffer(kind);
    auto line = chunk.size() > config_.max_line_length
                    ? truncate_line(chunk, config_.max_line_length)
                    : std::move(chunk);
    buf.pending_bytes += line.size();
    buf.chunks.push_back(std::move(line));
    arm_flush(id, buf, kind);
  }

  // --- terminal path ------------------------------------------------------

  auto finish(const ExecutionId &id, StreamFrame frame,
              std::optional<StreamFrame> status = std::nullopt) -> void {
    auto &state = state_for(id);
    if (state.terminal) {
      return;
    }
    flush(id, state, StreamKind::Stdout);
    flush(id, state, StreamKind::Stderr);
    if (status) {
      emit_frame(id, state, *status);
    }

    state.terminal = true;
    state.terminal_frame = serialize_sse(frame);
    deliver(id, state, state.terminal_frame);

    recent_terminal_.emplace_back(id, state.terminal_frame);
    while (recent_terminal_.size() > kRecentTerminalLimit) {
      recent_terminal_.pop_front();
    }

    state.close_timer.expires_after(
        std::chrono::milliseconds(config_.close_grace_ms));
    std::weak_ptr<Impl> weak = weak_from_this();
    state.close_timer.async_wait(
        [weak, id](const boost::system::error_code &ec) {
          if (ec) {
            return;
          }
          if (auto self = weak.lock()) {
            self->teardown(id);
          }
        });
  }

  auto teardown(const ExecutionId &id) -> void {
    auto it = executions_.find(id);
    if (it == executions_.end()) {
      return;
    }
    auto state = std::move(it->second);
    executions_.erase(it);

    state->cancel_timers();
    for (auto &sub : state->subscribers) {
      close_channel(*sub.channel);
    }
    log::debug("Released stream state for execution {} ({} subscribers "
               "closed)",
               id, state->subscribers.size());
  }

  // --- heartbeat ----------------------------------------------------------

  auto arm_heartbeat() -> void {
    heartbeat_timer_.expires_after(
        std::chrono::milliseconds(config_.heartbeat_interval_ms));
    std::weak_ptr<Impl> weak = weak_from_this();
    heartbeat_timer_.async_wait([weak](const boost::system::error_code &ec) {
      if (ec) {
        return;
      }
      auto self = weak.lock();
      if (!self || !self->heartbeat_active_) {
        return;
      }
      self->pulse();
      self->arm_heartbeat();
    });
  }

  auto pulse() -> void {
    for (auto &[id, state] : executions_) {
      deliver(id, *state, kHeartbeatFrame);
    }
  }

  auto cleanup() -> void {
    heartbeat_active_ = false;
    heartbeat_timer_.cancel();

    auto executions = std::move(executions_);
    executions_.clear();
    std::size_t closed = 0;
    for (auto &[id, state] : executions) {
      state->cancel_timers();
      for (auto &sub : state->subscribers) {
        close_channel(*sub.channel);
        ++closed;
      }
    }
    recent_terminal_.clear();
    log::info("Streaming hub cleaned up: {} executions, {} subscribers",
              executions.size(), closed);
  }
};

StreamingHub::StreamingHub(boost::asio::any_io_executor executor,
                           StreamingConfig config)
    : impl_(std::make_shared<Impl>(std::move(executor), std::move(config))) {}

StreamingHub::~StreamingHub() = default;

auto StreamingHub::start() -> void {
  impl_->post([](Impl &impl) {
    if (impl.heartbeat_active_) {
      return;
    }
    impl.heartbeat_active_ = true;
    impl.arm_heartbeat();
  });
}

auto StreamingHub::cleanup(std::move_only_function<void()> done) -> void {
  impl_->post([done = std::move(done)](Impl &impl) mutable {
    impl.cleanup();
    if (done) {
      done();
    }
  });
}

auto StreamingHub::subscribe(const ExecutionId &id,
                             std::shared_ptr<ISubscriberChannel> channel)
    -> void {
  if (!channel) {
    return;
  }
  impl_->post([id, channel = std::move(channel)](Impl &impl) mutable {
    impl.subscribe(id, std::move(channel));
  });
}

auto StreamingHub::unsubscribe(
    const ExecutionId &id, const std::shared_ptr<ISubscriberChannel> &channel)
    -> void {
  impl_->post(
      [id, key = channel.get()](Impl &impl) { impl.remove(id, key); });
}

auto StreamingHub::emit(const ExecutionId &id, StreamFrame frame) -> void {
  impl_->post([id, frame = std::move(frame)](Impl &impl) {
    if (auto *state = impl.find(id)) {
      impl.emit_frame(id, *state, frame);
    }
  });
}

auto StreamingHub::emit_stdout(const ExecutionId &id, std::string chunk)
    -> void {
  impl_->post([id, chunk = std::move(chunk)](Impl &impl) mutable {
    impl.emit_output(id, StreamKind::Stdout, std::move(chunk));
  });
}

auto StreamingHub::emit_stderr(const ExecutionId &id, std::string chunk)
    -> void {
  impl_->post([id, chunk = std::move(chunk)](Impl &impl) mutable {
    impl.emit_output(id, StreamKind::Stderr, std::move(chunk));
  });
}

auto StreamingHub::emit_status(const ExecutionId &id, ExecutionStatus status)
    -> void {
  emit(id, make_frame(FrameType::Status, id,
                      JsonValue{{"status", enum_to_string(status)}}));
}

auto StreamingHub::emit_command(const ExecutionId &id, std::string command)
    -> void {
  emit(id, make_frame(FrameType::Command, id,
                      JsonValue{{"command", std::move(command)}}));
}

auto StreamingHub::emit_complete(const ExecutionId &id, JsonValue result)
    -> void {
  impl_->post([id, result = std::move(result)](Impl &impl) mutable {
    impl.finish(id, make_frame(FrameType::Complete, id, std::move(result)));
  });
}

auto StreamingHub::emit_error(const ExecutionId &id, std::string error)
    -> void {
  impl_->post([id, error = std::move(error)](Impl &impl) mutable {
    impl.finish(id, make_frame(FrameType::Error, id,
                               JsonValue{{"error", std::move(error)}}));
  });
}

auto StreamingHub::emit_finished(const ExecutionId &id,
                                 ExecutionStatus status, StreamFrame terminal)
    -> void {
  auto status_frame = make_frame(FrameType::Status, id,
                                 JsonValue{{"status", enum_to_string(status)}});
  impl_->post([id, terminal = std::move(terminal),
               status_frame = std::move(status_frame)](Impl &impl) mutable {
    impl.finish(id, std::move(terminal), std::move(status_frame));
  });
}

auto StreamingHub::subscriber_count(const ExecutionId &id) const
    -> std::size_t {
  const auto *state = impl_->find(id);
  return state == nullptr ? 0 : state->subscribers.size();
}

auto StreamingHub::tracked_execution_count() const -> std::size_t {
  return impl_->executions_.size();
}

auto StreamingHub::tracked_bytes(const ExecutionId &id) const -> std::size_t {
  const auto *state = impl_->find(id);
  return state == nullptr ? 0 : state->total_bytes;
}

auto StreamingHub::limit_reached(const ExecutionId &id) const -> bool {
  const auto *state = impl_->find(id);
  return state != nullptr && state->limit_reached;
}

auto StreamingHub::heartbeat_active() const -> bool {
  return impl_->heartbeat_active_;
}

auto StreamingHub::config() const noexcept -> const StreamingConfig & {
  return impl_->config_;
}

} // namespace opsrelay

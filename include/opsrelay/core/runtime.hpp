#pragma once

#include "opsrelay/core/coroutine.hpp"
#include "opsrelay/core/error.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include <atomic>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

namespace opsrelay {

/// Owns the coordinating io_context and the worker threads that drive it.
/// Queue dispatch, hub timers, transport pipes and the HTTP server all run
/// here.
class Runtime {
public:
  explicit Runtime(unsigned num_threads = 1);
  ~Runtime() noexcept;

  Runtime(const Runtime &) = delete;
  Runtime &operator=(const Runtime &) = delete;

  [[nodiscard]] auto start() -> Result<void>;
  auto stop() noexcept -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  [[nodiscard]] auto thread_count() const noexcept -> unsigned {
    return num_threads_;
  }

  [[nodiscard]] auto context() noexcept -> boost::asio::io_context & {
    return ctx_;
  }

  [[nodiscard]] auto executor() noexcept -> boost::asio::any_io_executor {
    return ctx_.get_executor();
  }

  template <typename T> auto spawn(task<T> coro) -> void {
    co_spawn(ctx_.get_executor(), std::move(coro), detached);
  }

  template <typename F> auto post(F &&fn) -> void {
    boost::asio::post(ctx_.get_executor(), std::forward<F>(fn));
  }

private:
  unsigned num_threads_;
  boost::asio::io_context ctx_;
  std::optional<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::vector<std::jthread> threads_;
  std::atomic<bool> running_{false};
};

} // namespace opsrelay

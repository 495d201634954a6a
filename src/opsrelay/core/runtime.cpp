#include "opsrelay/core/runtime.hpp"

#include "opsrelay/util/log.hpp"

#include <ranges>

namespace opsrelay {

Runtime::Runtime(unsigned num_threads)
    : num_threads_(num_threads == 0 ? 1 : num_threads),
      ctx_(static_cast<int>(num_threads_)) {}

Runtime::~Runtime() noexcept { stop(); }

auto Runtime::start() -> Result<void> {
  if (running_.exchange(true))
    return ok();

  log::debug("Starting runtime with {} threads", num_threads_);

  ctx_.restart();
  work_guard_.emplace(ctx_.get_executor());
  threads_.reserve(num_threads_);
  for ([[maybe_unused]] auto i : std::views::iota(0U, num_threads_)) {
    threads_.emplace_back([this] { ctx_.run(); });
  }
  return ok();
}

auto Runtime::stop() noexcept -> void {
  if (!running_.exchange(false))
    return;

  if (work_guard_.has_value()) {
    work_guard_->reset();
    work_guard_.reset();
  }
  ctx_.stop();

  // std::jthread auto-joins on destruction, just clear the vector
  threads_.clear();
}

auto Runtime::is_running() const noexcept -> bool {
  return running_.load(std::memory_order_acquire);
}

} // namespace opsrelay

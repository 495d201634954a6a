#include "opsrelay/util/signals.hpp"

#include <csignal>

namespace opsrelay {

std::atomic<bool> g_shutdown_requested{false};

namespace {
void signal_handler(int) {
  g_shutdown_requested.store(true, std::memory_order_release);
  g_shutdown_requested.notify_one();
}
} // namespace

void setup_signal_handlers() {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);
  std::signal(SIGPIPE, SIG_IGN);
}

void wait_for_shutdown() {
  g_shutdown_requested.wait(false, std::memory_order_acquire);
}

} // namespace opsrelay

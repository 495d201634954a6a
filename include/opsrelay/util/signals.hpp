#pragma once

#include <atomic>

namespace opsrelay {

extern std::atomic<bool> g_shutdown_requested;

/// SIGINT/SIGTERM request shutdown; SIGPIPE is ignored so a vanished SSE
/// client surfaces as a write error instead of killing the process.
void setup_signal_handlers();

/// Blocks until a shutdown signal arrives.
void wait_for_shutdown();

} // namespace opsrelay

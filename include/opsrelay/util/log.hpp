#pragma once

#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace opsrelay::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error };

inline constexpr std::array<std::string_view, 5> level_names = {
    "trace", "debug", "info", "warn", "error"};

inline constexpr std::array<std::string_view, 5> level_colors = {
    "\o{33}[90m", // trace: gray
    "\o{33}[36m", // debug: cyan
    "\o{33}[32m", // info: green
    "\o{33}[33m", // warn: yellow
    "\o{33}[31m"  // error: red
};

[[nodiscard]] inline auto level_name(Level level) -> std::string_view {
  return level_names.at(std::to_underlying(level));
}

[[nodiscard]] inline auto level_color(Level level) -> std::string_view {
  return level_colors.at(std::to_underlying(level));
}

/// Parses a level name; unknown names map to Info.
[[nodiscard]] inline auto parse_level(std::string_view name) noexcept
    -> Level {
  const auto *it = std::ranges::find(level_names, name);
  return (it != level_names.end())
             ? static_cast<Level>(std::distance(level_names.begin(), it))
             : Level::Info;
}

// Async logger: callers format on their own thread, a single writer thread
// drains a bounded concurrent_channel and batches fwrite calls.
class Logger {
  static constexpr std::size_t kQueueCapacity = 8192;
  static constexpr std::size_t kBatchSize = 64;
  using LogChannel = boost::asio::experimental::concurrent_channel<
      boost::asio::io_context::executor_type,
      void(boost::system::error_code, std::string)>;

public:
  Logger() = default;
  ~Logger();

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  auto start() -> void;
  auto stop() -> void;

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }
  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  auto set_output_stderr() noexcept -> void;
  /// Redirects output to `path` (append). An empty path restores stdout.
  auto set_output_file(std::string_view path) -> bool;

  [[nodiscard]] auto dropped_messages() const noexcept -> std::uint64_t {
    return dropped_.load(std::memory_order_relaxed);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args &&...args)
      -> void {
    if (level < level_.load(std::memory_order_acquire))
      return;

    auto now = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
    submit(std::format("[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] {}\n", now,
                       level_color(level), level_name(level), "\o{33}[0m", tid,
                       std::format(fmt, std::forward<Args>(args)...)));
  }

private:
  auto submit(std::string line) -> void;
  auto write_direct(std::string_view line) -> void;
  auto writer_loop(std::shared_ptr<LogChannel> queue) -> void;
  auto apply_control(std::string_view msg) -> void;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<FILE *> output_{stdout};
  std::atomic<std::uint64_t> dropped_{0};
  FILE *file_{nullptr};
  boost::asio::io_context queue_ctx_{1};
  std::atomic<std::shared_ptr<LogChannel>> queue_;
  std::jthread writer_;
};

inline auto logger() -> Logger & {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name));
}

inline auto set_output_file(std::string_view path) -> bool {
  return logger().set_output_file(path);
}

inline auto set_output_stderr() noexcept -> void {
  logger().set_output_stderr();
}

inline auto start() -> void { logger().start(); }
inline auto stop() -> void { logger().stop(); }

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

} // namespace opsrelay::log

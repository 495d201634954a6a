#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace opsrelay {

struct ServerConfig {
  std::string host{"127.0.0.1"};
  uint16_t port{3000};
  int threads{1};

  auto operator==(const ServerConfig &) const -> bool = default;
};

struct LogConfig {
  std::string level{"info"};
  std::string file;

  auto operator==(const LogConfig &) const -> bool = default;
};

struct ExecutionQueueConfig {
  int concurrent_limit{5};
  int max_queue_size{50};
  // Finished units kept for status queries before the oldest is evicted.
  int history_limit{1000};

  auto operator==(const ExecutionQueueConfig &) const -> bool = default;
};

struct StreamingConfig {
  int buffer_ms{100};
  std::size_t max_output_size{10 * 1024 * 1024};
  std::size_t max_line_length{10000};
  int heartbeat_interval_ms{30000};
  int close_grace_ms{1000};
  // Frames queued per SSE connection before it is treated as stalled.
  std::size_t max_pending_frames{1024};

  auto operator==(const StreamingConfig &) const -> bool = default;
};

struct TransportConfig {
  std::string program{"bolt"};
  std::vector<std::string> extra_args;
  int timeout_sec{0}; // 0 = no timeout

  auto operator==(const TransportConfig &) const -> bool = default;
};

struct InventoryConfig {
  std::string file;
  // group name -> member node ids
  std::map<std::string, std::vector<std::string>> groups;

  auto operator==(const InventoryConfig &) const -> bool = default;
};

struct SystemConfig {
  ServerConfig server;
  LogConfig log;
  ExecutionQueueConfig execution_queue;
  StreamingConfig streaming;
  TransportConfig transport;
  InventoryConfig inventory;

  auto operator==(const SystemConfig &) const -> bool = default;
};

} // namespace opsrelay

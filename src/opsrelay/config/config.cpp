#include "opsrelay/config/config.hpp"
#include "opsrelay/config/toml_util.hpp"

#include "opsrelay/core/error.hpp"
#include "opsrelay/util/log.hpp"

#include <boost/lexical_cast.hpp>

#include <cstdlib>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace opsrelay {
namespace detail {

struct ServerToml {
  std::string host{"127.0.0.1"};
  uint16_t port{3000};
  int threads{1};
};

struct LogToml {
  std::string level{"info"};
  std::string file;
};

struct ExecutionQueueToml {
  int concurrent_limit{5};
  int max_queue_size{50};
  int history_limit{1000};
};

struct StreamingToml {
  int buffer_ms{100};
  std::size_t max_output_size{10 * 1024 * 1024};
  std::size_t max_line_length{10000};
  int heartbeat_interval_ms{30000};
  int close_grace_ms{1000};
  std::size_t max_pending_frames{1024};
};

struct TransportToml {
  std::string program{"bolt"};
  std::vector<std::string> extra_args;
  int timeout_sec{0};
};

struct InventoryToml {
  std::string file;
  std::map<std::string, std::vector<std::string>> groups;
};

struct SystemToml {
  ServerToml server{};
  LogToml log{};
  ExecutionQueueToml execution_queue{};
  StreamingToml streaming{};
  TransportToml transport{};
  InventoryToml inventory{};
};

} // namespace detail
} // namespace opsrelay

namespace glz {
template <> struct meta<opsrelay::detail::ServerToml> {
  using T = opsrelay::detail::ServerToml;
  static constexpr auto value =
      object("host", &T::host, "port", &T::port, "threads", &T::threads);
};

template <> struct meta<opsrelay::detail::LogToml> {
  using T = opsrelay::detail::LogToml;
  static constexpr auto value = object("level", &T::level, "file", &T::file);
};

template <> struct meta<opsrelay::detail::ExecutionQueueToml> {
  using T = opsrelay::detail::ExecutionQueueToml;
  static constexpr auto value =
      object("concurrent_limit", &T::concurrent_limit, "max_queue_size",
             &T::max_queue_size, "history_limit", &T::history_limit);
};

template <> struct meta<opsrelay::detail::StreamingToml> {
  using T = opsrelay::detail::StreamingToml;
  static constexpr auto value = object(
      "buffer_ms", &T::buffer_ms, "max_output_size", &T::max_output_size,
      "max_line_length", &T::max_line_length, "heartbeat_interval_ms",
      &T::heartbeat_interval_ms, "close_grace_ms", &T::close_grace_ms,
      "max_pending_frames", &T::max_pending_frames);
};

template <> struct meta<opsrelay::detail::TransportToml> {
  using T = opsrelay::detail::TransportToml;
  static constexpr auto value =
      object("program", &T::program, "extra_args", &T::extra_args,
             "timeout_sec", &T::timeout_sec);
};

template <> struct meta<opsrelay::detail::InventoryToml> {
  using T = opsrelay::detail::InventoryToml;
  static constexpr auto value =
      object("file", &T::file, "groups", &T::groups);
};

template <> struct meta<opsrelay::detail::SystemToml> {
  using T = opsrelay::detail::SystemToml;
  static constexpr auto value =
      object("server", &T::server, "log", &T::log, "execution_queue",
             &T::execution_queue, "streaming", &T::streaming, "transport",
             &T::transport, "inventory", &T::inventory);
};
} // namespace glz

namespace opsrelay {
namespace {

auto apply_env_overrides(SystemConfig &cfg) -> void {
  if (const char *v = std::getenv("OPSRELAY_SERVER_HOST"); v != nullptr) {
    cfg.server.host = v;
  }
  if (const char *v = std::getenv("OPSRELAY_SERVER_PORT"); v != nullptr) {
    cfg.server.port = boost::lexical_cast<uint16_t>(v);
  }
  if (const char *v = std::getenv("OPSRELAY_LOG_LEVEL"); v != nullptr) {
    cfg.log.level = v;
  }
  if (const char *v = std::getenv("OPSRELAY_CONCURRENT_LIMIT"); v != nullptr) {
    cfg.execution_queue.concurrent_limit = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("OPSRELAY_MAX_QUEUE_SIZE"); v != nullptr) {
    cfg.execution_queue.max_queue_size = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("OPSRELAY_STREAMING_BUFFER_MS");
      v != nullptr) {
    cfg.streaming.buffer_ms = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("OPSRELAY_STREAMING_MAX_OUTPUT_SIZE");
      v != nullptr) {
    cfg.streaming.max_output_size = boost::lexical_cast<std::size_t>(v);
  }
  if (const char *v = std::getenv("OPSRELAY_STREAMING_MAX_LINE_LENGTH");
      v != nullptr) {
    cfg.streaming.max_line_length = boost::lexical_cast<std::size_t>(v);
  }
  if (const char *v = std::getenv("OPSRELAY_TRANSPORT_PROGRAM");
      v != nullptr) {
    cfg.transport.program = v;
  }
  if (const char *v = std::getenv("OPSRELAY_INVENTORY_FILE"); v != nullptr) {
    cfg.inventory.file = v;
  }
}

[[nodiscard]] auto validate(const SystemConfig &cfg) -> Result<void> {
  const auto &q = cfg.execution_queue;
  const auto &s = cfg.streaming;
  if (cfg.server.threads <= 0 || q.concurrent_limit <= 0 ||
      q.max_queue_size <= 0 || q.history_limit < 0) {
    log::error("Invalid [server]/[execution_queue] settings");
    return fail(Error::ParseError);
  }
  if (s.buffer_ms < 0 || s.max_output_size == 0 || s.max_line_length == 0 ||
      s.heartbeat_interval_ms <= 0 || s.close_grace_ms < 0 ||
      s.max_pending_frames == 0) {
    log::error("Invalid [streaming] settings");
    return fail(Error::ParseError);
  }
  if (cfg.transport.program.empty() || cfg.transport.timeout_sec < 0) {
    log::error("Invalid [transport] settings");
    return fail(Error::ParseError);
  }
  return ok();
}

[[nodiscard]] auto convert_toml(std::string_view toml_text)
    -> Result<SystemConfig> {
  auto raw_result = toml_util::parse_toml<detail::SystemToml>(toml_text);
  if (!raw_result)
    return fail(raw_result.error());
  auto &raw = *raw_result;

  SystemConfig cfg{};
  cfg.server.host = std::move(raw.server.host);
  cfg.server.port = raw.server.port;
  cfg.server.threads = raw.server.threads;

  cfg.log.level = std::move(raw.log.level);
  cfg.log.file = std::move(raw.log.file);

  cfg.execution_queue.concurrent_limit = raw.execution_queue.concurrent_limit;
  cfg.execution_queue.max_queue_size = raw.execution_queue.max_queue_size;
  cfg.execution_queue.history_limit = raw.execution_queue.history_limit;

  cfg.streaming.buffer_ms = raw.streaming.buffer_ms;
  cfg.streaming.max_output_size = raw.streaming.max_output_size;
  cfg.streaming.max_line_length = raw.streaming.max_line_length;
  cfg.streaming.heartbeat_interval_ms = raw.streaming.heartbeat_interval_ms;
  cfg.streaming.close_grace_ms = raw.streaming.close_grace_ms;
  cfg.streaming.max_pending_frames = raw.streaming.max_pending_frames;

  cfg.transport.program = std::move(raw.transport.program);
  cfg.transport.extra_args = std::move(raw.transport.extra_args);
  cfg.transport.timeout_sec = raw.transport.timeout_sec;

  cfg.inventory.file = std::move(raw.inventory.file);
  cfg.inventory.groups = std::move(raw.inventory.groups);

  apply_env_overrides(cfg);

  if (auto r = validate(cfg); !r) {
    return fail(r.error());
  }
  return ok(std::move(cfg));
}

} // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  auto text = toml_util::read_file(path);
  if (!text) {
    return fail(text.error());
  }
  return load_from_string(*text);
}

auto ConfigLoader::load_from_string(std::string_view toml_str)
    -> Result<SystemConfig> {
  try {
    return convert_toml(toml_str);
  } catch (const boost::bad_lexical_cast &e) {
    log::error("Invalid OPSRELAY_* environment override: {}", e.what());
    return fail(Error::ParseError);
  } catch (const std::exception &e) {
    log::error("Failed to parse TOML system configuration: {}", e.what());
    return fail(Error::ParseError);
  }
}

} // namespace opsrelay

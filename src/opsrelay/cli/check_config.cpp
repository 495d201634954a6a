#include "opsrelay/cli/commands.hpp"
#include "opsrelay/config/config.hpp"
#include "opsrelay/inventory/inventory.hpp"
#include "opsrelay/util/json.hpp"
#include "opsrelay/util/log.hpp"

#include <cstdint>
#include <format>
#include <print>

namespace opsrelay::cli {

auto cmd_check_config(const CheckConfigOptions &opts) -> int {
  log::set_output_stderr();

  std::string error;
  std::size_t group_count = 0;
  auto config_res = ConfigLoader::load_from_file(opts.config_file);
  if (!config_res) {
    error = config_res.error().message();
  } else if (auto inventory = StaticInventory::from_config(config_res->inventory);
             !inventory) {
    error = std::format("inventory: {}", inventory.error().message());
  } else {
    group_count = inventory->group_count();
  }

  if (opts.json) {
    JsonValue out{{"file", opts.config_file}, {"valid", error.empty()}};
    if (!error.empty()) {
      out["error"] = error;
    } else {
      const auto &cfg = *config_res;
      out["server"] = JsonValue{{"host", cfg.server.host},
                                {"port", static_cast<std::int64_t>(
                                             cfg.server.port)}};
      out["concurrentLimit"] =
          static_cast<std::int64_t>(cfg.execution_queue.concurrent_limit);
      out["maxQueueSize"] =
          static_cast<std::int64_t>(cfg.execution_queue.max_queue_size);
      out["groups"] = static_cast<std::int64_t>(group_count);
    }
    std::println("{}", dump_json(out));
    return error.empty() ? 0 : 1;
  }

  if (!error.empty()) {
    std::println(stderr, "Error: {}", error);
    return 1;
  }

  const auto &cfg = *config_res;
  std::println("{} - OK", opts.config_file);
  std::println("  listen:           {}:{}", cfg.server.host, cfg.server.port);
  std::println("  concurrent_limit: {}", cfg.execution_queue.concurrent_limit);
  std::println("  max_queue_size:   {}", cfg.execution_queue.max_queue_size);
  std::println("  transport:        {}", cfg.transport.program);
  std::println("  groups:           {}", group_count);
  return 0;
}

} // namespace opsrelay::cli

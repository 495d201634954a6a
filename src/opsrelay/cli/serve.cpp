#include "opsrelay/app/application.hpp"
#include "opsrelay/cli/commands.hpp"
#include "opsrelay/config/config.hpp"
#include "opsrelay/util/log.hpp"
#include "opsrelay/util/signals.hpp"

#include <print>
#include <string>

namespace opsrelay::cli {
namespace {

auto load_config_or_print(std::string_view path) -> Result<Config> {
  return ConfigLoader::load_from_file(path).or_else(
      [&](std::error_code ec) -> Result<Config> {
        std::println(stderr, "Error: {}", ec.message());
        return fail(ec);
      });
}

} // namespace

auto cmd_serve(const ServeOptions &opts) -> int {
  auto config_res = load_config_or_print(opts.config_file);
  if (!config_res) {
    return 1;
  }
  auto config = std::move(*config_res);

  if (opts.log_level.has_value()) {
    config.log.level = *opts.log_level;
  }
  if (opts.host.has_value()) {
    config.server.host = *opts.host;
  }
  if (opts.port.has_value()) {
    if (*opts.port < 0 || *opts.port > 65535) {
      std::println(stderr, "Error: Invalid port: {}", *opts.port);
      return 1;
    }
    config.server.port = static_cast<uint16_t>(*opts.port);
  }

  const auto log_file = opts.log_file.value_or(config.log.file);
  if (!log_file.empty() && !log::set_output_file(log_file)) {
    std::println(stderr, "Error: Failed to open log file: {}", log_file);
    return 1;
  }
  if (log_file.empty()) {
    log::set_output_file("");
  }
  log::set_level(config.log.level);

  Application app(std::move(config));

  if (auto r = app.init(); !r.has_value()) {
    log::error("Initialization failed: {}", r.error().message());
    log::stop();
    return 1;
  }
  if (auto r = app.start(); !r.has_value()) {
    log::error("Failed to start: {}", r.error().message());
    log::stop();
    return 1;
  }

  setup_signal_handlers();

  const auto &cfg = app.config();
  log::info("opsrelay listening on {}:{}", cfg.server.host, cfg.server.port);

  wait_for_shutdown();
  app.stop();
  log::info("opsrelay stopped.");
  log::stop();
  return 0;
}

} // namespace opsrelay::cli

#include "opsrelay/cli/commands.hpp"
#include "opsrelay/util/log.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <string>

namespace {
auto default_config() -> std::string {
  if (const char *env = std::getenv("OPSRELAY_CONFIG"); env && *env) {
    return env;
  }
  return {};
}
} // namespace

int main(int argc, char *argv[]) {
  // Keep non-serve CLI output clean by default.
  opsrelay::log::set_output_stderr();
  opsrelay::log::set_level(opsrelay::log::Level::Warn);

  CLI::App app{"opsrelay", "Batch execution relay with live output streaming"};
  app.require_subcommand(1);
  app.footer("\nExamples:\n"
             "  opsrelay serve -c opsrelay.toml\n"
             "  opsrelay check-config -c opsrelay.toml --json\n"
             "\nTip: Set OPSRELAY_CONFIG=opsrelay.toml to skip -c on every "
             "command.");

  const std::string env_config = default_config();

  opsrelay::cli::ServeOptions serve_opts;
  auto *serve = app.add_subcommand("serve", "Run the HTTP API server");
  serve_opts.config_file = env_config;
  auto *serve_cfg = serve
                        ->add_option("-c,--config", serve_opts.config_file,
                                     "System config file")
                        ->check(CLI::ExistingFile);
  if (env_config.empty())
    serve_cfg->required();
  serve->add_option("--log-file", serve_opts.log_file, "Log file path");
  serve->add_option("--log-level", serve_opts.log_level,
                    "Log level override: trace|debug|info|warn|error");
  serve->add_option("--host", serve_opts.host, "Listen address override");
  serve->add_option("-p,--port", serve_opts.port, "Listen port override");
  serve->callback(
      [&serve_opts]() { std::exit(opsrelay::cli::cmd_serve(serve_opts)); });

  opsrelay::cli::CheckConfigOptions check_opts;
  auto *check = app.add_subcommand(
      "check-config", "Validate the system config and inventory");
  check_opts.config_file = env_config;
  auto *check_cfg = check
                        ->add_option("-c,--config", check_opts.config_file,
                                     "System config file")
                        ->check(CLI::ExistingFile);
  if (env_config.empty())
    check_cfg->required();
  check->add_flag("--json", check_opts.json, "Output JSON");
  check->callback([&check_opts]() {
    std::exit(opsrelay::cli::cmd_check_config(check_opts));
  });

  CLI11_PARSE(app, argc, argv);
  return 0;
}

#pragma once

#include <optional>
#include <string>

namespace opsrelay::cli {

struct ServeOptions {
  std::string config_file;
  std::optional<std::string> log_file;
  std::optional<std::string> log_level;
  std::optional<std::string> host;
  std::optional<int> port;
};

struct CheckConfigOptions {
  std::string config_file;
  bool json{false};
};

auto cmd_serve(const ServeOptions &opts) -> int;
auto cmd_check_config(const CheckConfigOptions &opts) -> int;

} // namespace opsrelay::cli

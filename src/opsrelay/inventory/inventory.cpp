#include "opsrelay/inventory/inventory.hpp"

#include "opsrelay/config/toml_util.hpp"
#include "opsrelay/util/log.hpp"

#include <map>
#include <string>

namespace opsrelay {
namespace detail {

struct InventoryFileToml {
  std::map<std::string, std::vector<std::string>> groups;
};

} // namespace detail
} // namespace opsrelay

namespace glz {
template <> struct meta<opsrelay::detail::InventoryFileToml> {
  using T = opsrelay::detail::InventoryFileToml;
  static constexpr auto value = object("groups", &T::groups);
};
} // namespace glz

namespace opsrelay {
namespace {

[[nodiscard]] auto
build_inventory(const std::map<std::string, std::vector<std::string>> &groups)
    -> Result<StaticInventory> {
  StaticInventory inventory;
  for (const auto &[name, nodes] : groups) {
    if (!is_valid_id_text(name)) {
      log::error("Inventory group has an invalid name");
      return fail(Error::ParseError);
    }
    std::vector<NodeId> members;
    members.reserve(nodes.size());
    for (const auto &node : nodes) {
      if (!is_valid_id_text(node)) {
        log::error("Inventory group '{}' lists an invalid node id", name);
        return fail(Error::ParseError);
      }
      members.emplace_back(node);
    }
    inventory.set_group(GroupId{name}, std::move(members));
  }
  return ok(std::move(inventory));
}

} // namespace

auto StaticInventory::from_config(const InventoryConfig &cfg)
    -> Result<StaticInventory> {
  auto inventory = build_inventory(cfg.groups);
  if (!inventory || cfg.file.empty()) {
    return inventory;
  }
  auto from_file = load_from_file(cfg.file);
  if (!from_file) {
    return from_file;
  }
  // File groups override inline groups of the same name.
  for (auto &[group, members] : from_file->groups_) {
    inventory->set_group(group, std::move(members));
  }
  return inventory;
}

auto StaticInventory::load_from_file(std::string_view path)
    -> Result<StaticInventory> {
  auto raw = toml_util::load_toml_file<detail::InventoryFileToml>(path);
  if (!raw) {
    return fail(raw.error());
  }
  log::info("Loaded inventory file {} ({} groups)", path, raw->groups.size());
  return build_inventory(raw->groups);
}

auto StaticInventory::load_from_string(std::string_view toml_str)
    -> Result<StaticInventory> {
  auto raw = toml_util::parse_toml<detail::InventoryFileToml>(toml_str);
  if (!raw) {
    return fail(raw.error());
  }
  return build_inventory(raw->groups);
}

auto StaticInventory::set_group(GroupId group, std::vector<NodeId> members)
    -> void {
  groups_.insert_or_assign(std::move(group), std::move(members));
}

auto StaticInventory::resolve_group(const GroupId &group) const
    -> Result<std::vector<NodeId>> {
  auto it = groups_.find(group);
  if (it == groups_.end()) {
    return fail(Error::TargetResolution);
  }
  return ok(it->second);
}

} // namespace opsrelay

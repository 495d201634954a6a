#pragma once

#include "opsrelay/config/system_config.hpp"
#include "opsrelay/core/error.hpp"
#include "opsrelay/util/id.hpp"

#include <ankerl/unordered_dense.h>

#include <string_view>
#include <vector>

namespace opsrelay {

/// Resolves inventory groups to their member nodes.
class IInventoryResolver {
public:
  virtual ~IInventoryResolver() = default;

  /// Error::TargetResolution when the group does not exist.
  [[nodiscard]] virtual auto resolve_group(const GroupId &group) const
      -> Result<std::vector<NodeId>> = 0;
};

/// Fixed group table, filled from config or an inventory TOML file.
class StaticInventory final : public IInventoryResolver {
public:
  StaticInventory() = default;

  [[nodiscard]] static auto from_config(const InventoryConfig &cfg)
      -> Result<StaticInventory>;

  /// Parses a file of the form `[groups]\nweb = ["node1", "node2"]`.
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<StaticInventory>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str)
      -> Result<StaticInventory>;

  auto set_group(GroupId group, std::vector<NodeId> members) -> void;

  [[nodiscard]] auto resolve_group(const GroupId &group) const
      -> Result<std::vector<NodeId>> override;

  [[nodiscard]] auto group_count() const noexcept -> std::size_t {
    return groups_.size();
  }

private:
  ankerl::unordered_dense::map<GroupId, std::vector<NodeId>> groups_;
};

} // namespace opsrelay

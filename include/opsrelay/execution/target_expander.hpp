#pragma once

#include "opsrelay/core/error.hpp"
#include "opsrelay/inventory/inventory.hpp"
#include "opsrelay/util/id.hpp"

#include <span>
#include <vector>

namespace opsrelay {

struct ExpandedTargets {
  std::vector<NodeId> targets; // first-seen order, no duplicates
  std::vector<GroupId> groups; // groups that were resolved
};

/// Turns a batch's node and group selections into a deduplicated, ordered
/// target list. Direct nodes come first in request order, then each group's
/// members in group order. Node ids are not checked against the inventory;
/// an unknown group fails the whole expansion with Error::TargetResolution.
class TargetExpander {
public:
  explicit TargetExpander(const IInventoryResolver &inventory)
      : inventory_(inventory) {}

  [[nodiscard]] auto expand(std::span<const NodeId> node_ids,
                            std::span<const GroupId> group_ids) const
      -> Result<ExpandedTargets>;

private:
  const IInventoryResolver &inventory_;
};

} // namespace opsrelay

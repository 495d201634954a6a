#include "opsrelay/execution/target_expander.hpp"

#include "opsrelay/util/log.hpp"

#include <ankerl/unordered_dense.h>

namespace opsrelay {

auto TargetExpander::expand(std::span<const NodeId> node_ids,
                            std::span<const GroupId> group_ids) const
    -> Result<ExpandedTargets> {
  ExpandedTargets out;
  ankerl::unordered_dense::set<NodeId> seen;
  seen.reserve(node_ids.size());

  auto add = [&](const NodeId &node) {
    if (node.empty()) {
      return;
    }
    if (seen.insert(node).second) {
      out.targets.push_back(node);
    }
  };

  for (const auto &node : node_ids) {
    add(node);
  }

  ankerl::unordered_dense::set<GroupId> seen_groups;
  for (const auto &group : group_ids) {
    if (!seen_groups.insert(group).second) {
      continue;
    }
    auto members = inventory_.resolve_group(group);
    if (!members) {
      log::warn("Target expansion failed: group '{}' is unknown", group);
      return fail(members.error());
    }
    log::debug("Group '{}' expanded to {} nodes", group, members->size());
    for (const auto &node : *members) {
      add(node);
    }
    out.groups.push_back(group);
  }

  return ok(std::move(out));
}

} // namespace opsrelay

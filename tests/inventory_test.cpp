#include "opsrelay/execution/target_expander.hpp"
#include "opsrelay/inventory/inventory.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>

#include "gtest/gtest.h"

using namespace opsrelay;

namespace {

auto nodes(std::initializer_list<const char *> names) -> std::vector<NodeId> {
  std::vector<NodeId> out;
  for (const auto *n : names) {
    out.emplace_back(n);
  }
  return out;
}

auto groups(std::initializer_list<const char *> names)
    -> std::vector<GroupId> {
  std::vector<GroupId> out;
  for (const auto *n : names) {
    out.emplace_back(n);
  }
  return out;
}

class TargetExpanderTest : public ::testing::Test {
protected:
  void SetUp() override {
    inventory_.set_group(GroupId{"web"}, nodes({"web1", "web2", "shared"}));
    inventory_.set_group(GroupId{"db"}, nodes({"db1", "shared"}));
    inventory_.set_group(GroupId{"empty"}, {});
  }

  StaticInventory inventory_;
  TargetExpander expander_{inventory_};
};

} // namespace

TEST(StaticInventoryTest, UnknownGroupIsTargetResolutionError) {
  StaticInventory inventory;
  auto r = inventory.resolve_group(GroupId{"missing"});
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::TargetResolution);
}

TEST(StaticInventoryTest, LoadFromString) {
  auto inventory = StaticInventory::load_from_string(R"(
[groups]
web = ["web1", "web2"]
db = ["db1"]
)");
  ASSERT_TRUE(inventory.has_value()) << inventory.error().message();
  EXPECT_EQ(inventory->group_count(), 2u);
  auto web = inventory->resolve_group(GroupId{"web"});
  ASSERT_TRUE(web.has_value());
  EXPECT_EQ(*web, nodes({"web1", "web2"}));
}

TEST(StaticInventoryTest, FileGroupsOverrideInlineGroups) {
  auto path = std::filesystem::temp_directory_path() /
              "opsrelay_inventory_test.toml";
  {
    std::ofstream out(path);
    out << "[groups]\nweb = [\"web9\"]\n";
  }

  InventoryConfig cfg;
  cfg.file = path.string();
  cfg.groups["web"] = {"web1"};
  cfg.groups["db"] = {"db1"};

  auto inventory = StaticInventory::from_config(cfg);
  std::filesystem::remove(path);
  ASSERT_TRUE(inventory.has_value()) << inventory.error().message();
  EXPECT_EQ(*inventory->resolve_group(GroupId{"web"}), nodes({"web9"}));
  EXPECT_EQ(*inventory->resolve_group(GroupId{"db"}), nodes({"db1"}));
}

TEST(StaticInventoryTest, MissingInventoryFileFails) {
  InventoryConfig cfg;
  cfg.file = "/nonexistent/inventory.toml";
  EXPECT_FALSE(StaticInventory::from_config(cfg).has_value());
}

TEST(StaticInventoryTest, RejectsControlCharactersInNodeIds) {
  InventoryConfig cfg;
  cfg.groups["web"] = {"web\t1"};
  auto r = StaticInventory::from_config(cfg);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::ParseError);
}

TEST_F(TargetExpanderTest, DirectNodesOnly) {
  auto ids = nodes({"a", "b"});
  auto r = expander_.expand(ids, {});
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->targets, nodes({"a", "b"}));
  EXPECT_TRUE(r->groups.empty());
}

TEST_F(TargetExpanderTest, NodesThenGroupMembersWithoutDuplicates) {
  auto ids = nodes({"web2", "x"});
  auto gids = groups({"web", "db"});
  auto r = expander_.expand(ids, gids);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->targets, nodes({"web2", "x", "web1", "shared", "db1"}));
  EXPECT_EQ(r->groups, gids);
}

TEST_F(TargetExpanderTest, RepeatedNodeIdsCollapse) {
  auto ids = nodes({"a", "a", "b", "a"});
  auto r = expander_.expand(ids, {});
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->targets, nodes({"a", "b"}));
}

TEST_F(TargetExpanderTest, UnknownGroupFailsWholeExpansion) {
  auto ids = nodes({"a"});
  auto gids = groups({"web", "nope"});
  auto r = expander_.expand(ids, gids);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::TargetResolution);
}

TEST_F(TargetExpanderTest, EmptyGroupContributesNothing) {
  auto gids = groups({"empty"});
  auto r = expander_.expand({}, gids);
  ASSERT_TRUE(r.has_value());
  EXPECT_TRUE(r->targets.empty());
}

TEST_F(TargetExpanderTest, NoSelectionsYieldsEmptyResult) {
  auto r = expander_.expand({}, {});
  ASSERT_TRUE(r.has_value());
  EXPECT_TRUE(r->targets.empty());
}

#include "opsrelay/app/services/batch_service.hpp"
#include "opsrelay/execution/execution_queue.hpp"
#include "opsrelay/execution/target_expander.hpp"
#include "opsrelay/inventory/inventory.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

using namespace opsrelay;
using namespace opsrelay::test;

namespace {

class BatchServiceTest : public ::testing::Test {
protected:
  BatchServiceTest() {
    inventory_.set_group(GroupId{"web"},
                         {NodeId{"web1"}, NodeId{"web2"}, NodeId{"shared"}});
  }

  auto make_queue(int limit, int max_size) -> void {
    queue_ = std::make_unique<ExecutionQueue>(
        transport_, ExecutionQueueConfig{.concurrent_limit = limit,
                                         .max_queue_size = max_size,
                                         .history_limit = 100});
    service_ = std::make_unique<BatchService>(expander_, *queue_, 10);
  }

  static auto request(std::vector<NodeId> nodes, std::vector<GroupId> groups,
                      std::string action = "uptime") -> BatchRequest {
    return BatchRequest{.target_node_ids = std::move(nodes),
                        .target_group_ids = std::move(groups),
                        .action = ActionDescriptor{.type = ActionType::Command,
                                                   .action = std::move(action),
                                                   .parameters = {}}};
  }

  StaticInventory inventory_;
  TargetExpander expander_{inventory_};
  FakeTransport transport_;
  std::unique_ptr<ExecutionQueue> queue_;
  std::unique_ptr<BatchService> service_;
};

} // namespace

TEST_F(BatchServiceTest, CreatesOneUnitPerExpandedTarget) {
  make_queue(10, 50);
  auto created = service_->create_batch(
      request({NodeId{"shared"}, NodeId{"db1"}}, {GroupId{"web"}}));
  ASSERT_TRUE(created.has_value()) << created.error().message();

  const std::vector<NodeId> expected = {NodeId{"shared"}, NodeId{"db1"},
                                        NodeId{"web1"}, NodeId{"web2"}};
  EXPECT_EQ(created->expanded_node_ids, expected);
  EXPECT_EQ(created->target_count, 4u);
  ASSERT_EQ(created->execution_ids.size(), 4u);
  EXPECT_TRUE(created->batch_id.value().starts_with("batch-"));

  for (std::size_t i = 0; i < created->execution_ids.size(); ++i) {
    auto unit = queue_->get_unit(created->execution_ids[i]);
    ASSERT_TRUE(unit.has_value());
    EXPECT_EQ(unit->target, expected[i]);
    ASSERT_TRUE(unit->batch_id.has_value());
    EXPECT_EQ(*unit->batch_id, created->batch_id);
    EXPECT_EQ(unit->batch_position, i);
  }
}

TEST_F(BatchServiceTest, RejectsEmptyActionOrTargets) {
  make_queue(10, 50);
  auto no_action = service_->create_batch(request({NodeId{"n1"}}, {}, ""));
  ASSERT_FALSE(no_action.has_value());
  EXPECT_EQ(no_action.error(), Error::InvalidArgument);

  auto no_targets = service_->create_batch(request({}, {}));
  ASSERT_FALSE(no_targets.has_value());
  EXPECT_EQ(no_targets.error(), Error::InvalidArgument);
  EXPECT_TRUE(transport_.started().empty());
}

TEST_F(BatchServiceTest, UnknownGroupQueuesNothing) {
  make_queue(10, 50);
  auto r = service_->create_batch(
      request({NodeId{"n1"}}, {GroupId{"web"}, GroupId{"missing"}}));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::TargetResolution);
  EXPECT_EQ(queue_->running_count() + queue_->queued_count(), 0u);
}

TEST_F(BatchServiceTest, QueueFullMidBatchKeepsAdmittedUnits) {
  make_queue(1, 2);
  auto r = service_->create_batch(request({}, {GroupId{"web"}}));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::QueueFull);
  EXPECT_EQ(queue_->running_count(), 1u);
  EXPECT_EQ(queue_->queued_count(), 1u);
}

TEST_F(BatchServiceTest, StatusAggregatesUnitOutcomes) {
  make_queue(10, 50);
  auto created = *service_->create_batch(
      request({NodeId{"a"}, NodeId{"b"}}, {}));

  auto running = service_->get_batch_status(created.batch_id);
  ASSERT_TRUE(running.has_value());
  EXPECT_EQ(running->status, BatchState::Running);
  EXPECT_EQ(running->stats.total, 2u);
  EXPECT_EQ(running->stats.running, 2u);
  EXPECT_EQ(running->progress, 0);

  ASSERT_TRUE(transport_.succeed(created.execution_ids[0]));
  auto half = *service_->get_batch_status(created.batch_id);
  EXPECT_EQ(half.progress, 50);
  EXPECT_EQ(half.status, BatchState::Running);

  ASSERT_TRUE(transport_.complete(
      created.execution_ids[1],
      TransportResult{.status = ExecutionStatus::Failed,
                      .exit_code = 1,
                      .error = "Command exited with code 1"}));
  auto done = *service_->get_batch_status(created.batch_id);
  EXPECT_EQ(done.progress, 100);
  EXPECT_EQ(done.stats.success, 1u);
  EXPECT_EQ(done.stats.failed, 1u);
  EXPECT_EQ(done.status, BatchState::Partial);
  ASSERT_EQ(done.executions.size(), 2u);
  EXPECT_EQ(done.executions[0].id, created.execution_ids[0]);
}

TEST_F(BatchServiceTest, AllSucceededIsSuccess) {
  make_queue(10, 50);
  auto created = *service_->create_batch(request({NodeId{"a"}}, {}));
  ASSERT_TRUE(transport_.succeed(created.execution_ids[0]));
  EXPECT_EQ(service_->get_batch_status(created.batch_id)->status,
            BatchState::Success);
}

TEST_F(BatchServiceTest, CancelBatchStopsQueuedAndRunningUnits) {
  make_queue(1, 50);
  auto created = *service_->create_batch(
      request({NodeId{"a"}, NodeId{"b"}, NodeId{"c"}}, {}));

  auto cancelled = service_->cancel_batch(created.batch_id);
  ASSERT_TRUE(cancelled.has_value());
  EXPECT_EQ(*cancelled, 3u);

  auto status = *service_->get_batch_status(created.batch_id);
  EXPECT_EQ(status.status, BatchState::Cancelled);
  EXPECT_EQ(status.stats.running + status.stats.queued, 0u);
  EXPECT_EQ(transport_.cancelled(),
            std::vector<ExecutionId>{created.execution_ids[0]});
}

TEST_F(BatchServiceTest, UnknownBatch) {
  make_queue(10, 50);
  auto status = service_->get_batch_status(BatchId{"batch-missing"});
  ASSERT_FALSE(status.has_value());
  EXPECT_EQ(status.error(), Error::NotFound);
  auto cancel = service_->cancel_batch(BatchId{"batch-missing"});
  ASSERT_FALSE(cancel.has_value());
  EXPECT_EQ(cancel.error(), Error::NotFound);
}

TEST_F(BatchServiceTest, HistoryLimitDropsOldestBatch) {
  make_queue(100, 100);
  auto first = *service_->create_batch(request({NodeId{"a"}}, {}));
  for (int i = 0; i < 10; ++i) {
    ASSERT_TRUE(service_->create_batch(request({NodeId{"a"}}, {})).has_value());
  }
  EXPECT_FALSE(service_->get_batch_status(first.batch_id).has_value());
}

#include "opsrelay/execution/execution_queue.hpp"

#include "test_utils.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

using namespace opsrelay;
using namespace opsrelay::test;

namespace {

auto queue_config(int limit, int max_size, int history = 1000)
    -> ExecutionQueueConfig {
  return ExecutionQueueConfig{.concurrent_limit = limit,
                              .max_queue_size = max_size,
                              .history_limit = history};
}

struct Recorder {
  std::mutex mu;
  std::vector<std::string> events;

  auto listener() -> ExecutionListener {
    ExecutionListener l;
    l.on_started = [this](const ExecutionUnit &u) {
      push("started:" + u.id.str());
    };
    l.on_stdout = [this](const ExecutionId &id, std::string_view data) {
      push("stdout:" + id.str() + ":" + std::string(data));
    };
    l.on_command = [this](const ExecutionId &id, std::string_view text) {
      push("command:" + id.str() + ":" + std::string(text));
    };
    l.on_finished = [this](const ExecutionUnit &u) {
      push("finished:" + u.id.str() + ":" +
           std::string(to_string_view(u.status)));
    };
    l.on_cancelled = [this](const ExecutionUnit &u) {
      push("cancelled:" + u.id.str());
    };
    return l;
  }

  auto push(std::string e) -> void {
    std::scoped_lock lock(mu);
    events.push_back(std::move(e));
  }

  auto contains(const std::string &e) -> bool {
    std::scoped_lock lock(mu);
    return std::ranges::find(events, e) != events.end();
  }
};

} // namespace

TEST(ExecutionQueueTest, DispatchesUpToConcurrentLimit) {
  FakeTransport transport;
  ExecutionQueue queue(transport, queue_config(2, 10));

  auto a = queue.submit(make_unit("n1"));
  auto b = queue.submit(make_unit("n2"));
  auto c = queue.submit(make_unit("n3"));
  ASSERT_TRUE(a && b && c);

  EXPECT_EQ(queue.get_status(*a), ExecutionStatus::Running);
  EXPECT_EQ(queue.get_status(*b), ExecutionStatus::Running);
  EXPECT_EQ(queue.get_status(*c), ExecutionStatus::Queued);
  EXPECT_EQ(queue.running_count(), 2u);
  EXPECT_EQ(queue.queued_count(), 1u);

  ASSERT_TRUE(transport.succeed(*a));
  EXPECT_EQ(queue.get_status(*a), ExecutionStatus::Succeeded);
  EXPECT_EQ(queue.get_status(*c), ExecutionStatus::Running);
  EXPECT_EQ(queue.running_count(), 2u);
  EXPECT_EQ(queue.queued_count(), 0u);
}

TEST(ExecutionQueueTest, RejectsWhenFullAndLeavesExistingUnitsAlone) {
  FakeTransport transport;
  ExecutionQueue queue(transport, queue_config(1, 5));

  std::vector<ExecutionId> ids;
  for (int i = 0; i < 5; ++i) {
    auto id = queue.submit(make_unit("n" + std::to_string(i)));
    ASSERT_TRUE(id.has_value());
    ids.push_back(*id);
  }

  auto rejected = queue.submit(make_unit("n6"));
  ASSERT_FALSE(rejected.has_value());
  EXPECT_EQ(rejected.error(), Error::QueueFull);

  EXPECT_EQ(queue.running_count(), 1u);
  EXPECT_EQ(queue.queued_count(), 4u);
  EXPECT_EQ(queue.get_status(ids.front()), ExecutionStatus::Running);
  for (std::size_t i = 1; i < ids.size(); ++i) {
    EXPECT_EQ(queue.get_status(ids[i]), ExecutionStatus::Queued);
  }

  // A finished unit frees a slot for a new submission.
  ASSERT_TRUE(transport.succeed(ids.front()));
  EXPECT_TRUE(queue.submit(make_unit("n6")).has_value());
}

TEST(ExecutionQueueTest, StartsWaitingUnitsInArrivalOrder) {
  FakeTransport transport;
  ExecutionQueue queue(transport, queue_config(1, 10));

  std::vector<ExecutionId> ids;
  for (int i = 0; i < 4; ++i) {
    ids.push_back(*queue.submit(make_unit("n" + std::to_string(i))));
  }
  for (const auto &id : ids) {
    ASSERT_TRUE(transport.succeed(id));
  }
  EXPECT_EQ(transport.started(), ids);
}

TEST(ExecutionQueueTest, QueueStatusListsWaitingUnitsOldestFirst) {
  FakeTransport transport;
  ExecutionQueue queue(transport, queue_config(1, 10));

  auto running = *queue.submit(make_unit("n0"));
  auto first = *queue.submit(make_unit("n1", "whoami"));
  auto second = *queue.submit(make_unit("n2"));
  (void)running;

  auto status = queue.queue_status();
  EXPECT_EQ(status.running, 1u);
  EXPECT_EQ(status.queued, 2u);
  EXPECT_EQ(status.limit, 1u);
  EXPECT_EQ(status.max_queue_size, 10u);
  ASSERT_EQ(status.queue.size(), 2u);
  EXPECT_EQ(status.queue[0].id, first);
  EXPECT_EQ(status.queue[0].target, NodeId{"n1"});
  EXPECT_EQ(status.queue[0].action, "whoami");
  EXPECT_EQ(status.queue[1].id, second);
  EXPECT_LE(status.queue[0].enqueued_at, status.queue[1].enqueued_at);
}

TEST(ExecutionQueueTest, KeepsCallerSuppliedIdAndRejectsDuplicates) {
  FakeTransport transport;
  ExecutionQueue queue(transport, queue_config(1, 10));

  auto unit = make_unit("n1");
  unit.id = ExecutionId{"exec-fixed"};
  auto id = queue.submit(unit);
  ASSERT_TRUE(id.has_value());
  EXPECT_EQ(*id, ExecutionId{"exec-fixed"});

  auto dup = queue.submit(unit);
  ASSERT_FALSE(dup.has_value());
  EXPECT_EQ(dup.error(), Error::AlreadyExists);
}

TEST(ExecutionQueueTest, CancelQueuedUnitNeverStartsIt) {
  FakeTransport transport;
  Recorder rec;
  ExecutionQueue queue(transport, queue_config(1, 10), rec.listener());

  auto a = *queue.submit(make_unit("n1"));
  auto b = *queue.submit(make_unit("n2"));

  ASSERT_TRUE(queue.cancel(b).has_value());
  EXPECT_EQ(queue.get_status(b), ExecutionStatus::Cancelled);
  EXPECT_EQ(queue.queued_count(), 0u);
  EXPECT_TRUE(rec.contains("cancelled:" + b.str()));

  ASSERT_TRUE(transport.succeed(a));
  EXPECT_EQ(transport.started(), std::vector<ExecutionId>{a});
}

TEST(ExecutionQueueTest, CancelRunningUnitDelegatesToTransport) {
  FakeTransport transport;
  ExecutionQueue queue(transport, queue_config(1, 10));

  auto a = *queue.submit(make_unit("n1"));
  auto b = *queue.submit(make_unit("n2"));

  ASSERT_TRUE(queue.cancel(a).has_value());
  EXPECT_EQ(transport.cancelled(), std::vector<ExecutionId>{a});

  auto unit = queue.get_unit(a);
  ASSERT_TRUE(unit.has_value());
  EXPECT_EQ(unit->status, ExecutionStatus::Failed);
  EXPECT_EQ(unit->error, "Execution cancelled");
  EXPECT_TRUE(unit->cancel_requested);
  // The freed slot went to the next unit.
  EXPECT_EQ(queue.get_status(b), ExecutionStatus::Running);
}

TEST(ExecutionQueueTest, CancelRunningWithoutTransportSupport) {
  FakeTransport transport;
  transport.supports_cancel = false;
  ExecutionQueue queue(transport, queue_config(1, 10));

  auto a = *queue.submit(make_unit("n1"));
  auto r = queue.cancel(a);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::NotSupported);
  EXPECT_EQ(queue.get_status(a), ExecutionStatus::Running);
}

TEST(ExecutionQueueTest, CancelUnknownAndFinishedUnits) {
  FakeTransport transport;
  ExecutionQueue queue(transport, queue_config(1, 10));

  auto missing = queue.cancel(ExecutionId{"exec-missing"});
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error(), Error::NotFound);

  auto a = *queue.submit(make_unit("n1"));
  ASSERT_TRUE(transport.succeed(a));
  auto finished = queue.cancel(a);
  ASSERT_FALSE(finished.has_value());
  EXPECT_EQ(finished.error(), Error::InvalidState);
}

TEST(ExecutionQueueTest, RefusedStartFailsUnitAndFreesSlot) {
  FakeTransport transport;
  transport.fail_on_start = true;
  Recorder rec;
  ExecutionQueue queue(transport, queue_config(1, 10), rec.listener());

  auto a = *queue.submit(make_unit("n1"));
  auto unit = queue.get_unit(a);
  ASSERT_TRUE(unit.has_value());
  EXPECT_EQ(unit->status, ExecutionStatus::Failed);
  EXPECT_FALSE(unit->error.empty());
  EXPECT_EQ(queue.running_count(), 0u);
  EXPECT_TRUE(rec.contains("finished:" + a.str() + ":failed"));

  transport.fail_on_start = false;
  auto b = *queue.submit(make_unit("n2"));
  EXPECT_EQ(queue.get_status(b), ExecutionStatus::Running);
}

TEST(ExecutionQueueTest, ThrowingTransportFailsUnit) {
  FakeTransport transport;
  transport.throw_on_start = true;
  ExecutionQueue queue(transport, queue_config(2, 10));

  auto a = *queue.submit(make_unit("n1"));
  auto unit = queue.get_unit(a);
  ASSERT_TRUE(unit.has_value());
  EXPECT_EQ(unit->status, ExecutionStatus::Failed);
  EXPECT_EQ(unit->error, "transport exploded");
  EXPECT_EQ(queue.running_count(), 0u);
}

TEST(ExecutionQueueTest, TransportResultIsRecorded) {
  FakeTransport transport;
  ExecutionQueue queue(transport, queue_config(1, 10));

  auto a = *queue.submit(make_unit("n1"));
  ASSERT_TRUE(transport.complete(
      a, TransportResult{.status = ExecutionStatus::Failed,
                         .exit_code = 2,
                         .error = "Command exited with code 2"}));
  auto unit = *queue.get_unit(a);
  EXPECT_EQ(unit.status, ExecutionStatus::Failed);
  ASSERT_TRUE(unit.exit_code.has_value());
  EXPECT_EQ(*unit.exit_code, 2);
  ASSERT_TRUE(unit.started_at.has_value());
  ASSERT_TRUE(unit.completed_at.has_value());
  EXPECT_LE(*unit.started_at, *unit.completed_at);

  // A second completion for the same unit is ignored.
  EXPECT_FALSE(transport.succeed(a));
  EXPECT_EQ(queue.get_status(a), ExecutionStatus::Failed);
}

TEST(ExecutionQueueTest, ListenerSeesLifecycleAndOutput) {
  FakeTransport transport;
  Recorder rec;
  ExecutionQueue queue(transport, queue_config(1, 10), rec.listener());

  auto a = *queue.submit(make_unit("n1", "hostname"));
  transport.stdout_line(a, "host-1\n");
  ASSERT_TRUE(transport.succeed(a));

  std::scoped_lock lock(rec.mu);
  const std::vector<std::string> expected = {
      "started:" + a.str(), "command:" + a.str() + ":hostname",
      "stdout:" + a.str() + ":host-1\n", "finished:" + a.str() + ":succeeded"};
  EXPECT_EQ(rec.events, expected);
}

TEST(ExecutionQueueTest, ClearQueueCancelsOnlyWaitingUnits) {
  FakeTransport transport;
  Recorder rec;
  ExecutionQueue queue(transport, queue_config(1, 10), rec.listener());

  auto a = *queue.submit(make_unit("n1"));
  auto b = *queue.submit(make_unit("n2"));
  auto c = *queue.submit(make_unit("n3"));

  EXPECT_EQ(queue.clear_queue(), 2u);
  EXPECT_EQ(queue.get_status(a), ExecutionStatus::Running);
  EXPECT_EQ(queue.get_status(b), ExecutionStatus::Cancelled);
  EXPECT_EQ(queue.get_status(c), ExecutionStatus::Cancelled);
  EXPECT_TRUE(rec.contains("cancelled:" + c.str()));
  EXPECT_EQ(queue.clear_queue(), 0u);
}

TEST(ExecutionQueueTest, HistoryLimitEvictsOldestFinishedUnit) {
  FakeTransport transport;
  ExecutionQueue queue(transport, queue_config(1, 10, 1));

  auto a = *queue.submit(make_unit("n1"));
  ASSERT_TRUE(transport.succeed(a));
  auto b = *queue.submit(make_unit("n2"));
  ASSERT_TRUE(transport.succeed(b));

  auto evicted = queue.get_status(a);
  ASSERT_FALSE(evicted.has_value());
  EXPECT_EQ(evicted.error(), Error::NotFound);
  EXPECT_EQ(queue.get_status(b), ExecutionStatus::Succeeded);
}

TEST(ExecutionQueueTest, ConcurrentSubmissionsNeverExceedBounds) {
  FakeTransport transport;
  ExecutionQueue queue(transport, queue_config(3, 20));

  std::atomic<int> accepted{0};
  std::atomic<int> rejected{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < 10; ++i) {
        auto r = queue.submit(
            make_unit("n" + std::to_string(t) + "-" + std::to_string(i)));
        if (r) {
          ++accepted;
        } else {
          EXPECT_EQ(r.error(), Error::QueueFull);
          ++rejected;
        }
      }
    });
  }
  for (auto &th : threads) {
    th.join();
  }

  EXPECT_EQ(accepted.load(), 20);
  EXPECT_EQ(rejected.load(), 20);
  EXPECT_EQ(queue.running_count(), 3u);
  EXPECT_EQ(queue.queued_count(), 17u);
  EXPECT_EQ(transport.active_count(), 3u);
}

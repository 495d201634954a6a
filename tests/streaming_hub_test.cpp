#include "opsrelay/streaming/streaming_hub.hpp"

#include "test_utils.hpp"

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <memory>
#include <string>

#include "gtest/gtest.h"

using namespace opsrelay;
using namespace opsrelay::test;
using namespace std::chrono_literals;

namespace {

auto fast_config() -> StreamingConfig {
  StreamingConfig cfg;
  cfg.buffer_ms = 20;
  cfg.max_output_size = 1024;
  cfg.max_line_length = 100;
  cfg.heartbeat_interval_ms = 60000;
  cfg.close_grace_ms = 30;
  return cfg;
}

class StreamingHubTest : public ::testing::Test {
protected:
  auto make_hub(StreamingConfig cfg = fast_config())
      -> std::unique_ptr<StreamingHub> {
    return std::make_unique<StreamingHub>(io_.get_executor(), cfg);
  }

  auto subscribe(StreamingHub &hub, const ExecutionId &id)
      -> std::shared_ptr<FakeChannel> {
    auto channel = std::make_shared<FakeChannel>();
    hub.subscribe(id, channel);
    run_io_for(io_, 5ms);
    return channel;
  }

  boost::asio::io_context io_;
  ExecutionId id_{"exec-1"};
};

} // namespace

TEST(TruncateLineTest, LeavesShortLinesAlone) {
  EXPECT_EQ(truncate_line("hello", 5), "hello");
  EXPECT_EQ(truncate_line("", 3), "");
}

TEST(TruncateLineTest, AppendsTruncationMarker) {
  EXPECT_EQ(truncate_line("abcdef", 3), "abc... [truncated 3 characters]");
}

TEST(TruncateLineTest, BacksOffToCodePointBoundary) {
  // "h\xC3\xA9llo": a 3-byte cut would land inside the two-byte "\xC3\xA9".
  const std::string line = "h\xC3\xA9llo";
  EXPECT_EQ(truncate_line(line, 2), "h... [truncated 5 characters]");
  EXPECT_EQ(truncate_line(line, 3), "h\xC3\xA9... [truncated 3 characters]");
}

TEST(TruncateLineTest, OutputLimitMessageNamesTheBudget) {
  EXPECT_NE(output_limit_message(2048).find("2048 bytes"), std::string::npos);
}

TEST_F(StreamingHubTest, SubscriberReceivesStartFrameFirst) {
  auto hub = make_hub();
  auto channel = subscribe(*hub, id_);

  auto frames = channel->frames();
  ASSERT_EQ(frames.size(), 1u);
  EXPECT_TRUE(frames[0].starts_with("event: start\ndata: "));
  EXPECT_NE(frames[0].find("Connected to execution stream"),
            std::string::npos);
  EXPECT_TRUE(frames[0].ends_with("\n\n"));
  EXPECT_EQ(hub->subscriber_count(id_), 1u);
}

TEST_F(StreamingHubTest, DebounceCoalescesChunksIntoOneFrame) {
  auto hub = make_hub();
  auto channel = subscribe(*hub, id_);

  hub->emit_stdout(id_, "a");
  hub->emit_stdout(id_, "b");
  hub->emit_stdout(id_, "c");
  run_io_for(io_, 100ms);

  auto out = channel->frames_of("stdout");
  ASSERT_EQ(out.size(), 1u);
  EXPECT_NE(out[0].find(R"("output":"abc")"), std::string::npos);
  EXPECT_EQ(hub->tracked_bytes(id_), 3u);
}

TEST_F(StreamingHubTest, StdoutAndStderrAreBufferedSeparately) {
  auto hub = make_hub();
  auto channel = subscribe(*hub, id_);

  hub->emit_stdout(id_, "out");
  hub->emit_stderr(id_, "err");
  run_io_for(io_, 100ms);

  ASSERT_EQ(channel->frames_of("stdout").size(), 1u);
  ASSERT_EQ(channel->frames_of("stderr").size(), 1u);
  EXPECT_NE(channel->frames_of("stderr")[0].find(R"("output":"err")"),
            std::string::npos);
}

TEST_F(StreamingHubTest, LongChunkIsTruncatedToLineLimit) {
  auto hub = make_hub();
  auto channel = subscribe(*hub, id_);

  hub->emit_stdout(id_, std::string(250, 'x'));
  run_io_for(io_, 100ms);

  auto out = channel->frames_of("stdout");
  ASSERT_EQ(out.size(), 1u);
  const auto expected = std::string(100, 'x') + "... [truncated 150 characters]";
  EXPECT_NE(out[0].find(expected), std::string::npos);
  EXPECT_EQ(out[0].find(std::string(101, 'x')), std::string::npos);
}

TEST_F(StreamingHubTest, TenThousandCharacterChunkKeepsFirstHundred) {
  auto cfg = fast_config();
  cfg.max_output_size = 10 * 1024 * 1024;
  auto hub = make_hub(cfg);
  auto channel = subscribe(*hub, id_);

  hub->emit_stdout(id_, std::string(10000, 'y'));
  run_io_for(io_, 100ms);

  auto out = channel->frames_of("stdout");
  ASSERT_EQ(out.size(), 1u);
  const auto expected =
      R"("output":")" + std::string(100, 'y') +
      R"(... [truncated 9900 characters]")";
  EXPECT_NE(out[0].find(expected), std::string::npos);
  EXPECT_EQ(hub->tracked_bytes(id_), 10000u);
}

TEST_F(StreamingHubTest, OutputLimitWarnsOnceAndDropsTheRest) {
  auto cfg = fast_config();
  cfg.max_output_size = 10;
  auto hub = make_hub(cfg);
  auto channel = subscribe(*hub, id_);

  hub->emit_stdout(id_, "12345678");
  hub->emit_stdout(id_, "abc");
  hub->emit_stdout(id_, "more");
  hub->emit_stderr(id_, "late");
  run_io_for(io_, 100ms);

  auto out = channel->frames_of("stdout");
  ASSERT_EQ(out.size(), 2u);
  EXPECT_NE(out[0].find(R"("output":"12345678")"), std::string::npos);
  EXPECT_NE(out[1].find("output-limit-reached"), std::string::npos);
  EXPECT_TRUE(channel->frames_of("stderr").empty());
  EXPECT_TRUE(hub->limit_reached(id_));
  EXPECT_EQ(hub->tracked_bytes(id_), 8u);
}

TEST_F(StreamingHubTest, CompleteFlushesPendingOutputThenClosesAfterGrace) {
  auto hub = make_hub();
  auto channel = subscribe(*hub, id_);

  hub->emit_stdout(id_, "tail");
  hub->emit_complete(id_, JsonValue{{"status", std::string("succeeded")}});
  run_io_for(io_, 5ms);

  auto frames = channel->frames();
  ASSERT_EQ(frames.size(), 3u);
  EXPECT_TRUE(frames[1].starts_with("event: stdout\n"));
  EXPECT_NE(frames[1].find(R"("output":"tail")"), std::string::npos);
  EXPECT_TRUE(frames[2].starts_with("event: complete\n"));
  EXPECT_FALSE(channel->closed());

  run_io_for(io_, 100ms);
  EXPECT_TRUE(channel->closed());
  EXPECT_EQ(hub->tracked_execution_count(), 0u);
}

TEST_F(StreamingHubTest, FinishedSendsStatusAfterFlushedOutput) {
  auto hub = make_hub();
  auto channel = subscribe(*hub, id_);

  hub->emit_stdout(id_, "tail");
  hub->emit_finished(
      id_, ExecutionStatus::Succeeded,
      make_frame(FrameType::Complete, id_,
                 JsonValue{{"status", std::string("succeeded")}}));
  run_io_for(io_, 5ms);

  auto frames = channel->frames();
  ASSERT_EQ(frames.size(), 4u);
  EXPECT_TRUE(frames[1].starts_with("event: stdout\n"));
  EXPECT_TRUE(frames[2].starts_with("event: status\n"));
  EXPECT_NE(frames[2].find(R"("status":"succeeded")"), std::string::npos);
  EXPECT_TRUE(frames[3].starts_with("event: complete\n"));
}

TEST_F(StreamingHubTest, OnlyFirstTerminalFrameIsDelivered) {
  auto hub = make_hub();
  auto channel = subscribe(*hub, id_);

  hub->emit_error(id_, "boom");
  hub->emit_complete(id_, JsonValue{{"status", std::string("succeeded")}});
  hub->emit_stdout(id_, "ignored");
  run_io_for(io_, 100ms);

  EXPECT_EQ(channel->frames_of("error").size(), 1u);
  EXPECT_TRUE(channel->frames_of("complete").empty());
  EXPECT_TRUE(channel->frames_of("stdout").empty());
}

TEST_F(StreamingHubTest, LateSubscriberGetsTerminalReplay) {
  auto hub = make_hub();
  auto first = subscribe(*hub, id_);
  hub->emit_error(id_, "Execution cancelled");
  run_io_for(io_, 100ms);
  ASSERT_TRUE(first->closed());

  auto late = subscribe(*hub, id_);
  auto frames = late->frames();
  ASSERT_EQ(frames.size(), 2u);
  EXPECT_TRUE(frames[0].starts_with("event: start\n"));
  EXPECT_TRUE(frames[1].starts_with("event: error\n"));
  EXPECT_NE(frames[1].find("Execution cancelled"), std::string::npos);
  EXPECT_TRUE(late->closed());
}

TEST_F(StreamingHubTest, SubscriberDuringGraceGetsTerminalFrame) {
  auto cfg = fast_config();
  cfg.close_grace_ms = 200;
  auto hub = make_hub(cfg);
  hub->emit_complete(id_, JsonValue{{"status", std::string("succeeded")}});
  run_io_for(io_, 5ms);

  auto channel = subscribe(*hub, id_);
  ASSERT_EQ(channel->frames().size(), 2u);
  EXPECT_TRUE(channel->frames()[1].starts_with("event: complete\n"));
  EXPECT_FALSE(channel->closed());

  run_io_for(io_, 300ms);
  EXPECT_TRUE(channel->closed());
}

TEST_F(StreamingHubTest, ThrowingSubscriberIsDroppedOthersStillServed) {
  auto hub = make_hub();
  auto healthy = subscribe(*hub, id_);

  auto broken = std::make_shared<FakeChannel>();
  broken->writes_before_failure = 1;
  broken->throw_on_failure = true;
  hub->subscribe(id_, broken);
  run_io_for(io_, 5ms);
  ASSERT_EQ(hub->subscriber_count(id_), 2u);

  hub->emit_status(id_, ExecutionStatus::Running);
  run_io_for(io_, 5ms);

  EXPECT_TRUE(broken->closed());
  EXPECT_EQ(hub->subscriber_count(id_), 1u);
  auto status = healthy->frames_of("status");
  ASSERT_EQ(status.size(), 1u);
  EXPECT_NE(status[0].find(R"("status":"running")"), std::string::npos);

  hub->emit_command(id_, "bolt command run uptime");
  run_io_for(io_, 5ms);
  EXPECT_EQ(healthy->frames_of("command").size(), 1u);
}

TEST_F(StreamingHubTest, ClosedChannelUnsubscribesItself) {
  auto hub = make_hub();
  auto channel = subscribe(*hub, id_);
  ASSERT_EQ(hub->subscriber_count(id_), 1u);

  channel->close();
  run_io_for(io_, 5ms);
  EXPECT_EQ(hub->subscriber_count(id_), 0u);
}

TEST_F(StreamingHubTest, UnsubscribeStopsDelivery) {
  auto hub = make_hub();
  auto channel = subscribe(*hub, id_);
  hub->unsubscribe(id_, channel);
  hub->emit_status(id_, ExecutionStatus::Running);
  run_io_for(io_, 5ms);

  EXPECT_EQ(channel->frames().size(), 1u);
  EXPECT_FALSE(channel->closed());
}

TEST_F(StreamingHubTest, HeartbeatReachesSubscribers) {
  auto cfg = fast_config();
  cfg.heartbeat_interval_ms = 20;
  auto hub = make_hub(cfg);
  hub->start();
  auto channel = subscribe(*hub, id_);

  run_io_for(io_, 90ms);
  EXPECT_TRUE(hub->heartbeat_active());

  std::size_t pulses = 0;
  for (const auto &frame : channel->frames()) {
    if (frame == kHeartbeatFrame) {
      ++pulses;
    }
  }
  EXPECT_GE(pulses, 2u);
}

TEST_F(StreamingHubTest, CleanupClosesEverythingAndStopsHeartbeat) {
  auto cfg = fast_config();
  cfg.heartbeat_interval_ms = 20;
  auto hub = make_hub(cfg);
  hub->start();
  auto a = subscribe(*hub, id_);
  auto b = subscribe(*hub, ExecutionId{"exec-2"});
  hub->emit_stdout(id_, "pending");

  bool done = false;
  hub->cleanup([&done] { done = true; });
  run_io_for(io_, 50ms);

  EXPECT_TRUE(done);
  EXPECT_TRUE(a->closed());
  EXPECT_TRUE(b->closed());
  EXPECT_FALSE(hub->heartbeat_active());
  EXPECT_EQ(hub->tracked_execution_count(), 0u);
}

TEST_F(StreamingHubTest, OutputBeforeAnySubscriberIsNotReplayed) {
  auto hub = make_hub();
  hub->emit_stdout(id_, "early");
  run_io_for(io_, 100ms);

  auto channel = subscribe(*hub, id_);
  EXPECT_TRUE(channel->frames_of("stdout").empty());
  EXPECT_EQ(hub->tracked_execution_count(), 1u);
}

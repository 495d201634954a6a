#include "opsrelay/app/api/api_server.hpp"
#include "opsrelay/app/application.hpp"
#include "opsrelay/app/http/http_types.hpp"
#include "opsrelay/streaming/streaming_hub.hpp"

#include "test_utils.hpp"

#include <boost/asio/io_context.hpp>

#include <chrono>

#include "gtest/gtest.h"

using namespace opsrelay;
using namespace opsrelay::test;
using namespace std::chrono_literals;

TEST(ApiTest, StatusFromError) {
  using http::HttpStatus;
  EXPECT_EQ(status_from_error(make_error_code(Error::NotFound)),
            HttpStatus::NotFound);
  EXPECT_EQ(status_from_error(make_error_code(Error::InvalidArgument)),
            HttpStatus::BadRequest);
  EXPECT_EQ(status_from_error(make_error_code(Error::TargetResolution)),
            HttpStatus::BadRequest);
  EXPECT_EQ(status_from_error(make_error_code(Error::QueueFull)),
            HttpStatus::TooManyRequests);
  EXPECT_EQ(status_from_error(make_error_code(Error::InvalidState)),
            HttpStatus::Conflict);
  EXPECT_EQ(status_from_error(make_error_code(Error::NotSupported)),
            HttpStatus::NotImplemented);
  EXPECT_EQ(status_from_error(make_error_code(Error::TransportError)),
            HttpStatus::InternalServerError);
  EXPECT_EQ(status_from_error(std::make_error_code(std::errc::io_error)),
            HttpStatus::InternalServerError);
}

TEST(ApiTest, QueueFullMessageNamesCapacity) {
  EXPECT_EQ(queue_full_message(50),
            "Execution queue is full. Maximum queue size: 50. Please wait for "
            "running executions to complete.");
}

TEST(ApiTest, ApplicationInitWiresServices) {
  Config cfg;
  cfg.inventory.groups["web"] = {"web1", "web2"};
  Application app(std::move(cfg));
  ASSERT_TRUE(app.init().has_value());
  EXPECT_FALSE(app.is_running());
  EXPECT_EQ(app.inventory().group_count(), 1u);
  ASSERT_NE(app.api_server(), nullptr);
  EXPECT_FALSE(app.api_server()->is_running());
  EXPECT_EQ(app.queue().config().max_queue_size, 50);
}

TEST(ApiTest, ApplicationInitFailsOnBadInventory) {
  Config cfg;
  cfg.inventory.file = "/nonexistent/inventory.toml";
  Application app(std::move(cfg));
  EXPECT_FALSE(app.init().has_value());
}

TEST(TerminalFrameTest, ExitCodeProducesCompleteFrame) {
  ExecutionUnit unit = make_unit("web1");
  unit.id = ExecutionId{"exec-1"};
  unit.status = ExecutionStatus::Failed;
  unit.exit_code = 2;
  unit.error = "Command exited with code 2";

  auto frame = terminal_frame_for(unit);
  EXPECT_EQ(frame.type, FrameType::Complete);
  auto wire = serialize_sse(frame);
  EXPECT_NE(wire.find(R"("exitCode":2)"), std::string::npos);
  EXPECT_NE(wire.find(R"("status":"failed")"), std::string::npos);
  EXPECT_NE(wire.find(R"("target":"web1")"), std::string::npos);
}

TEST(TerminalFrameTest, NoExitCodeProducesErrorFrame) {
  ExecutionUnit unit = make_unit("web1");
  unit.id = ExecutionId{"exec-1"};
  unit.status = ExecutionStatus::Cancelled;
  unit.error = "Execution cancelled";

  auto frame = terminal_frame_for(unit);
  EXPECT_EQ(frame.type, FrameType::Error);
  EXPECT_NE(serialize_sse(frame).find("Execution cancelled"),
            std::string::npos);
}

TEST(StreamListenerTest, ForwardsLifecycleToHub) {
  boost::asio::io_context io;
  StreamingConfig cfg;
  cfg.buffer_ms = 10;
  cfg.close_grace_ms = 20;
  StreamingHub hub(io.get_executor(), cfg);
  auto listener = make_stream_listener(hub);

  ExecutionUnit unit = make_unit("web1");
  unit.id = ExecutionId{"exec-1"};
  auto channel = std::make_shared<FakeChannel>();
  hub.subscribe(unit.id, channel);

  listener.on_started(unit);
  listener.on_command(unit.id, "bolt command run uptime");
  listener.on_stdout(unit.id, "up 3 days\n");
  unit.status = ExecutionStatus::Succeeded;
  unit.exit_code = 0;
  listener.on_finished(unit);
  run_io_for(io, 100ms);

  auto frames = channel->frames();
  ASSERT_EQ(frames.size(), 6u);
  EXPECT_TRUE(frames[0].starts_with("event: start\n"));
  EXPECT_TRUE(frames[1].starts_with("event: status\n"));
  EXPECT_TRUE(frames[2].starts_with("event: command\n"));
  // Buffered output is flushed before the final status.
  EXPECT_TRUE(frames[3].starts_with("event: stdout\n"));
  EXPECT_TRUE(frames[4].starts_with("event: status\n"));
  EXPECT_NE(frames[4].find(R"("status":"succeeded")"), std::string::npos);
  EXPECT_TRUE(frames[5].starts_with("event: complete\n"));
  EXPECT_TRUE(channel->closed());
}

TEST(StreamListenerTest, CancelledUnitEndsWithError) {
  boost::asio::io_context io;
  StreamingConfig cfg;
  cfg.close_grace_ms = 20;
  StreamingHub hub(io.get_executor(), cfg);
  auto listener = make_stream_listener(hub);

  ExecutionUnit unit = make_unit("web1");
  unit.id = ExecutionId{"exec-2"};
  auto channel = std::make_shared<FakeChannel>();
  hub.subscribe(unit.id, channel);

  unit.status = ExecutionStatus::Cancelled;
  listener.on_cancelled(unit);
  run_io_for(io, 60ms);

  auto errors = channel->frames_of("error");
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_NE(errors[0].find("Execution cancelled"), std::string::npos);
  auto statuses = channel->frames_of("status");
  ASSERT_EQ(statuses.size(), 1u);
  EXPECT_NE(statuses[0].find(R"("status":"cancelled")"), std::string::npos);
}

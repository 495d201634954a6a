#include "opsrelay/config/config.hpp"

#include <cstdlib>

#include "gtest/gtest.h"

using namespace opsrelay;

TEST(ConfigTest, ServerDefaults) {
  ServerConfig cfg;
  EXPECT_EQ(cfg.host, "127.0.0.1");
  EXPECT_EQ(cfg.port, 3000);
  EXPECT_EQ(cfg.threads, 1);
}

TEST(ConfigTest, QueueAndStreamingDefaults) {
  ExecutionQueueConfig queue;
  EXPECT_EQ(queue.concurrent_limit, 5);
  EXPECT_EQ(queue.max_queue_size, 50);

  StreamingConfig streaming;
  EXPECT_EQ(streaming.buffer_ms, 100);
  EXPECT_EQ(streaming.max_output_size, 10u * 1024u * 1024u);
  EXPECT_EQ(streaming.max_line_length, 10000u);
  EXPECT_EQ(streaming.heartbeat_interval_ms, 30000);
  EXPECT_EQ(streaming.close_grace_ms, 1000);
}

TEST(ConfigTest, LoadFromTomlString) {
  std::string toml = R"(
[server]
host = "0.0.0.0"
port = 8099
threads = 2

[log]
level = "debug"

[execution_queue]
concurrent_limit = 3
max_queue_size = 12

[streaming]
buffer_ms = 50
max_line_length = 200

[transport]
program = "/usr/local/bin/bolt"
extra_args = ["--no-host-key-check"]
timeout_sec = 600
)";

  auto result = ConfigLoader::load_from_string(toml);
  ASSERT_TRUE(result.has_value()) << result.error().message();

  EXPECT_EQ(result->server.host, "0.0.0.0");
  EXPECT_EQ(result->server.port, 8099);
  EXPECT_EQ(result->server.threads, 2);
  EXPECT_EQ(result->log.level, "debug");
  EXPECT_EQ(result->execution_queue.concurrent_limit, 3);
  EXPECT_EQ(result->execution_queue.max_queue_size, 12);
  EXPECT_EQ(result->streaming.buffer_ms, 50);
  EXPECT_EQ(result->streaming.max_line_length, 200u);
  // Unset keys keep their defaults.
  EXPECT_EQ(result->streaming.close_grace_ms, 1000);
  EXPECT_EQ(result->transport.program, "/usr/local/bin/bolt");
  ASSERT_EQ(result->transport.extra_args.size(), 1u);
  EXPECT_EQ(result->transport.timeout_sec, 600);
}

TEST(ConfigTest, UnsetSectionsYieldDefaults) {
  auto result = ConfigLoader::load_from_string(R"(
[server]
port = 3000
)");
  ASSERT_TRUE(result.has_value()) << result.error().message();
  EXPECT_EQ(*result, SystemConfig{});
}

TEST(ConfigTest, RejectsNonPositiveConcurrentLimit) {
  auto result = ConfigLoader::load_from_string(R"(
[execution_queue]
concurrent_limit = 0
)");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, RejectsZeroLineLength) {
  auto result = ConfigLoader::load_from_string(R"(
[streaming]
max_line_length = 0
)");
  ASSERT_FALSE(result.has_value());
}

TEST(ConfigTest, MissingFileIsReported) {
  auto result = ConfigLoader::load_from_file("/nonexistent/opsrelay.toml");
  ASSERT_FALSE(result.has_value());
}

TEST(ConfigTest, EnvironmentOverridesFileValues) {
  ::setenv("OPSRELAY_MAX_QUEUE_SIZE", "7", 1);
  auto result = ConfigLoader::load_from_string(R"(
[execution_queue]
max_queue_size = 12
)");
  ::unsetenv("OPSRELAY_MAX_QUEUE_SIZE");
  ASSERT_TRUE(result.has_value()) << result.error().message();
  EXPECT_EQ(result->execution_queue.max_queue_size, 7);
}

TEST(ConfigTest, MalformedEnvironmentOverrideFails) {
  ::setenv("OPSRELAY_CONCURRENT_LIMIT", "many", 1);
  auto result = ConfigLoader::load_from_string(R"(
[server]
port = 3000
)");
  ::unsetenv("OPSRELAY_CONCURRENT_LIMIT");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
}

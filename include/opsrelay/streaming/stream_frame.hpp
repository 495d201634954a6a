#pragma once

#include "opsrelay/util/enum.hpp"
#include "opsrelay/util/id.hpp"
#include "opsrelay/util/json.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace opsrelay {

enum class FrameType : std::uint8_t {
  Start,
  Stdout,
  Stderr,
  Status,
  Command,
  Complete,
  Error,
};
BOOST_DESCRIBE_ENUM(FrameType, Start, Stdout, Stderr, Status, Command,
                    Complete, Error)
OPSRELAY_DEFINE_ENUM_SERDE(FrameType, FrameType::Status)

[[nodiscard]] constexpr auto is_terminal(FrameType t) noexcept -> bool {
  return t == FrameType::Complete || t == FrameType::Error;
}

struct StreamFrame {
  FrameType type{FrameType::Status};
  ExecutionId execution_id;
  std::string timestamp; // ISO 8601, set by make_frame
  JsonValue data;
};

/// Data message of the start frame every subscriber receives first.
inline constexpr std::string_view kConnectedMessage =
    "Connected to execution stream";

/// Comment line sent as a liveness pulse; SSE clients ignore it.
inline constexpr std::string_view kHeartbeatFrame = ": heartbeat\n\n";

[[nodiscard]] auto make_frame(FrameType type, const ExecutionId &id,
                              JsonValue data) -> StreamFrame;

/// `{"type","executionId","timestamp","data"}` as compact JSON.
[[nodiscard]] auto frame_payload(const StreamFrame &frame) -> std::string;

/// `event: <type>\ndata: <payload>\n\n`
[[nodiscard]] auto serialize_sse(const StreamFrame &frame) -> std::string;

} // namespace opsrelay

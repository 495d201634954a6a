#include "opsrelay/streaming/stream_frame.hpp"

#include "opsrelay/util/time.hpp"

#include <format>

namespace opsrelay {

auto make_frame(FrameType type, const ExecutionId &id, JsonValue data)
    -> StreamFrame {
  return StreamFrame{.type = type,
                     .execution_id = id,
                     .timestamp = util::format_timestamp(),
                     .data = std::move(data)};
}

auto frame_payload(const StreamFrame &frame) -> std::string {
  JsonValue j = {{"type", std::string(to_string_view(frame.type))},
                 {"executionId", frame.execution_id.str()},
                 {"timestamp", frame.timestamp},
                 {"data", frame.data}};
  return dump_json(j);
}

auto serialize_sse(const StreamFrame &frame) -> std::string {
  // dump_json escapes newlines, so the payload always fits one data line.
  return std::format("event: {}\ndata: {}\n\n", to_string_view(frame.type),
                     frame_payload(frame));
}

} // namespace opsrelay

#pragma once

#include "opsrelay/core/error.hpp"

#include <functional>
#include <string_view>

namespace opsrelay {

/// Push channel to one live output consumer. StreamingHub only needs to
/// write serialized frames, learn when the peer goes away and close it.
class ISubscriberChannel {
public:
  virtual ~ISubscriberChannel() = default;

  /// Best-effort, non-blocking write of one serialized frame. An error marks
  /// the channel as broken; the hub drops it.
  virtual auto write(std::string_view frame) -> Result<void> = 0;

  /// Registers a callback fired once when the channel closes, whether the
  /// peer disconnected or close() was called. May fire on any thread.
  virtual auto on_close(std::move_only_function<void()> callback) -> void = 0;

  virtual auto close() -> void = 0;
};

} // namespace opsrelay

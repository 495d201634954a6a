#include "opsrelay/util/id.hpp"

#include <chrono>
#include <cstdint>
#include <format>
#include <random>

namespace opsrelay::detail {

// 48-bit millisecond timestamp followed by 64 random bits, so ids sort by
// creation time.
auto generate_uuid_v7_like() -> std::string {
  thread_local std::mt19937_64 gen(std::random_device{}());
  thread_local std::uniform_int_distribution<std::uint64_t> dis;
  const auto now_ms = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
  return std::format("{:012x}{:016x}", now_ms, dis(gen));
}

} // namespace opsrelay::detail

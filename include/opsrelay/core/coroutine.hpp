#pragma once

#include "opsrelay/core/error.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

#include <tuple>

namespace opsrelay {

template <typename T = void> using task = boost::asio::awaitable<T>;

/// Convenience alias for fire-and-forget coroutines.
using spawn_task = task<void>;

using boost::asio::co_spawn;
using boost::asio::detached;
using boost::asio::use_awaitable;

inline constexpr auto use_nothrow =
    boost::asio::as_tuple(boost::asio::use_awaitable);

template <typename T>
[[nodiscard]] inline auto
as_result(std::tuple<boost::system::error_code, T> &&v) -> Result<T> {
  auto [ec, value] = std::move(v);
  if (ec) {
    return fail(ec);
  }
  return ok(std::move(value));
}

[[nodiscard]] inline auto as_result(std::tuple<boost::system::error_code> &&v)
    -> Result<void> {
  auto [ec] = std::move(v);
  if (ec) {
    return fail(ec);
  }
  return ok();
}

} // namespace opsrelay

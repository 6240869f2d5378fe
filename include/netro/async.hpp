#ifndef NETRO_ASYNC_HPP
#define NETRO_ASYNC_HPP

#include <chrono>
#include <optional>
#include <asio.hpp>
#include <asio/experimental/as_tuple.hpp>
#include <asio/experimental/awaitable_operators.hpp>

namespace netro {

constexpr auto use_nothrow_awaitable = asio::experimental::as_tuple(asio::use_awaitable);

// A zero timeout waits for as long as the system does, and so does one
// too long to add to the current time.
inline std::chrono::steady_clock::time_point deadline_after(std::chrono::nanoseconds timeout)
{
  using std::chrono::steady_clock;

  if (timeout <= std::chrono::nanoseconds::zero())
    return steady_clock::time_point::max();

  auto now = steady_clock::now();
  auto wait = std::chrono::duration_cast<steady_clock::duration>(timeout);
  if (wait >= steady_clock::time_point::max() - now)
    return steady_clock::time_point::max();

  return now + wait;
}

inline asio::awaitable<void> expire_at(std::chrono::steady_clock::time_point deadline)
{
  asio::steady_timer timer(co_await asio::this_coro::executor);
  timer.expires_at(deadline);
  co_await timer.async_wait(use_nothrow_awaitable);
}

// Runs op until it completes or the deadline passes, whichever is first.
// An empty result means the deadline won and op was cancelled.
template <typename T>
asio::awaitable<std::optional<T>> within(
    asio::awaitable<T> op,
    std::chrono::steady_clock::time_point deadline)
{
  using namespace asio::experimental::awaitable_operators;

  auto result = co_await (
      std::move(op) ||
      expire_at(deadline)
    );

  if (result.index() == 1)
    co_return std::nullopt;

  co_return std::move(std::get<0>(result));
}

} // namespace netro

#endif // NETRO_ASYNC_HPP

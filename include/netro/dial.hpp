#ifndef NETRO_DIAL_HPP
#define NETRO_DIAL_HPP

#include <string>
#include <system_error>
#include <tuple>
#include <asio.hpp>
#include "netro/async.hpp"

namespace netro {

// Resolves host and port and connects socket to the first endpoint that
// accepts. For UDP this only fixes the peer address; nothing is sent.
template <typename Protocol>
asio::awaitable<std::tuple<std::error_code, typename Protocol::endpoint>> dial(
    typename Protocol::socket& socket,
    std::string host,
    std::string port)
{
  typename Protocol::resolver resolver(co_await asio::this_coro::executor);

  auto [e1, endpoints] = co_await resolver.async_resolve(host, port, use_nothrow_awaitable);
  if (e1)
    co_return std::make_tuple(e1, typename Protocol::endpoint());

  auto [e2, endpoint] = co_await asio::async_connect(socket, endpoints, use_nothrow_awaitable);
  co_return std::make_tuple(e2, endpoint);
}

} // namespace netro

#endif // NETRO_DIAL_HPP

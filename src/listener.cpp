#include "netro/listener.hpp"
#include <exception>
#include <iostream>
#include <string>
#include "netro/async.hpp"
#include "netro/datagram.hpp"
#include "netro/error.hpp"
#include "netro/log.hpp"

using asio::awaitable;
using asio::co_spawn;
using asio::ip::tcp;
using asio::ip::udp;

namespace netro {

namespace {

// Opens socket as dual-stack IPv6, or as IPv4 where IPv6 is missing, and
// returns the wildcard endpoint to bind.
template <typename Socket>
typename Socket::endpoint_type open_wildcard(Socket& socket, std::uint16_t port, std::error_code& e)
{
  using protocol_type = typename Socket::protocol_type;

  socket.open(protocol_type::v6(), e);
  if (!e)
  {
    socket.set_option(asio::ip::v6_only(false), e);
    if (!e)
      return typename Socket::endpoint_type(protocol_type::v6(), port);

    NETRO_WARN("no dual-stack socket, falling back to IPv4: " << e.message());
    socket.close(e);
  }

  socket.open(protocol_type::v4(), e);
  return typename Socket::endpoint_type(protocol_type::v4(), port);
}

void report_connection_failure(std::exception_ptr e)
{
  if (!e)
    return;

  try
  {
    std::rethrow_exception(e);
  }
  catch (std::exception& ex)
  {
    std::cerr << "Error handling connection: " << ex.what() << std::endl;
  }
}

} // namespace

tcp::acceptor bind_tcp(const asio::any_io_executor& ex, std::uint16_t port)
{
  tcp::acceptor acceptor(ex);
  std::error_code e;

  auto endpoint = open_wildcard(acceptor, port, e);
  if (!e)
    acceptor.set_option(tcp::acceptor::reuse_address(true), e);
  if (!e)
    acceptor.bind(endpoint, e);
  if (!e)
    acceptor.listen(asio::socket_base::max_listen_connections, e);

  if (e)
    throw error(error_kind::listener,
        "failed to start TCP listener: listen tcp :" + std::to_string(port) + ": " + e.message());

  return acceptor;
}

udp::socket bind_udp(const asio::any_io_executor& ex, std::uint16_t port)
{
  udp::socket socket(ex);
  std::error_code e;

  auto endpoint = open_wildcard(socket, port, e);
  if (!e)
    socket.bind(endpoint, e);

  if (e)
    throw error(error_kind::listener,
        "failed to start UDP listener: listen udp :" + std::to_string(port) + ": " + e.message());

  return socket;
}

awaitable<void> accept_loop(tcp::acceptor& acceptor, local_io io, std::ostream& log)
{
  for (;;)
  {
    auto [e, client] = co_await acceptor.async_accept(use_nothrow_awaitable);
    if (e)
      throw error(error_kind::listener, "failed to accept connection: " + e.message());

    // No limit on concurrent connections.
    auto ex = client.get_executor();
    co_spawn(ex, relay(std::move(client), io, log),
        [](std::exception_ptr e)
        {
          report_connection_failure(e);
        }
      );
  }
}

void run_listen(asio::io_context& ctx, const listen_request& request, local_io io, std::ostream& out)
{
  std::exception_ptr failure;

  auto on_exit = [&](std::exception_ptr e)
    {
      failure = e;
      ctx.stop();
    };

  switch (request.protocol)
  {
  case protocol::tcp:
    {
      auto acceptor = bind_tcp(ctx.get_executor(), request.port);
      out << "Listening on :" << acceptor.local_endpoint().port() << " (TCP)" << std::endl;

      co_spawn(ctx, accept_loop(acceptor, io, out), on_exit);
      ctx.run();
    }
    break;

  case protocol::udp:
    {
      auto socket = bind_udp(ctx.get_executor(), request.port);
      out << "Listening on :" << socket.local_endpoint().port() << " (UDP)" << std::endl;

      co_spawn(ctx, echo_datagrams(socket, out), on_exit);
      ctx.run();
    }
    break;
  }

  if (failure)
    std::rethrow_exception(failure);

  throw error(error_kind::listener, "listener stopped");
}

void run_listen(const listen_request& request, local_io io, std::ostream& out)
{
  asio::io_context ctx;
  run_listen(ctx, request, io, out);
}

} // namespace netro

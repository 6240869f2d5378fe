#include "netro/initiator.hpp"
#include <exception>
#include "netro/address.hpp"
#include "netro/async.hpp"
#include "netro/dial.hpp"
#include "netro/error.hpp"
#include "netro/log.hpp"
#include "netro/proxy_url.hpp"
#include "netro/tunnel.hpp"

using asio::awaitable;
using asio::co_spawn;
using asio::ip::tcp;
using asio::ip::udp;
namespace this_coro = asio::this_coro;
using std::chrono::steady_clock;

namespace netro {

namespace {

template <typename Protocol>
awaitable<void> connect_direct(
    const connection_request& request,
    steady_clock::time_point deadline,
    std::ostream& out)
{
  std::string address = join_host_port(request.host, request.port);
  const char* name = display_name(request.protocol);
  std::string prefix = std::string("failed to establish ") + name + " connection: dial "
      + to_string(request.protocol) + " " + address + ": ";

  typename Protocol::socket socket(co_await this_coro::executor);

  auto dialed = co_await within(dial<Protocol>(socket, request.host, request.port), deadline);
  if (!dialed)
    throw error(error_kind::dial, prefix + "i/o timeout");

  auto [e, endpoint] = *dialed;
  if (e)
    throw error(error_kind::dial, prefix + e.message());

  out << "Connected to " << address << " [" << to_string(endpoint) << "] (" << name << ")" << std::endl;
  NETRO_TRACE("closing " << to_string(request.protocol) << " socket to " << to_string(endpoint));
}

} // namespace

awaitable<void> check_connection(const connection_request& request, std::ostream& out)
{
  auto deadline = deadline_after(request.timeout);

  switch (request.protocol)
  {
  case protocol::tcp:
    if (!request.proxy.empty())
    {
      auto proxy = parse_proxy_url(request.proxy);
      std::string address = join_host_port(request.host, request.port);

      auto session = co_await negotiate_tunnel(proxy, address, deadline);
      out << "Connected to " << address << " through HTTP proxy " << request.proxy << std::endl;
      NETRO_TRACE("closing tunnel with " << session.pending.size() << " unread bytes");
      co_return;
    }
    co_await connect_direct<tcp>(request, deadline, out);
    co_return;

  case protocol::udp:
    if (!request.proxy.empty())
      throw error(error_kind::config, "--proxy is only supported for tcp");
    co_await connect_direct<udp>(request, deadline, out);
    co_return;
  }

  throw error(error_kind::config,
      "unsupported protocol: " + std::to_string(static_cast<int>(request.protocol)));
}

void run_connect(const connection_request& request, std::ostream& out)
{
  asio::io_context ctx;
  std::exception_ptr failure;

  co_spawn(ctx, check_connection(request, out),
      [&failure](std::exception_ptr e)
      {
        failure = e;
      }
    );

  ctx.run();

  if (failure)
    std::rethrow_exception(failure);
}

} // namespace netro

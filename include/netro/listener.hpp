#ifndef NETRO_LISTENER_HPP
#define NETRO_LISTENER_HPP

#include <cstdint>
#include <ostream>
#include <asio.hpp>
#include "netro/options.hpp"
#include "netro/relay.hpp"

namespace netro {

asio::ip::tcp::acceptor bind_tcp(const asio::any_io_executor& ex, std::uint16_t port);

asio::ip::udp::socket bind_udp(const asio::any_io_executor& ex, std::uint16_t port);

// Accepts connections forever, one relay per connection. Throws a
// listener error on the first failed accept.
asio::awaitable<void> accept_loop(asio::ip::tcp::acceptor& acceptor, local_io io, std::ostream& log);

// Binds, prints the listening line and serves on ctx until the session
// fails or ctx is stopped. Never returns normally. Work left on ctx
// refers to sockets that are gone by then, so ctx is not run again.
void run_listen(asio::io_context& ctx, const listen_request& request, local_io io, std::ostream& out);

// As above, on a private io_context.
void run_listen(const listen_request& request, local_io io, std::ostream& out);

} // namespace netro

#endif // NETRO_LISTENER_HPP

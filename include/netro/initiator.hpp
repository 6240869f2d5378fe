#ifndef NETRO_INITIATOR_HPP
#define NETRO_INITIATOR_HPP

#include <ostream>
#include <asio.hpp>
#include "netro/options.hpp"

namespace netro {

// Establishes one connection for the request and reports it on out.
// The connection is closed again without exchanging payload.
asio::awaitable<void> check_connection(const connection_request& request, std::ostream& out);

// Validates the request, then runs check_connection on a private io_context.
void run_connect(const connection_request& request, std::ostream& out);

} // namespace netro

#endif // NETRO_INITIATOR_HPP

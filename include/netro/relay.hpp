#ifndef NETRO_RELAY_HPP
#define NETRO_RELAY_HPP

#include <ostream>
#include <unistd.h>
#include <asio.hpp>

namespace netro {

// Local stream descriptors a relay reads from and writes to. Each relay
// works on its own duplicates, the originals are never closed and get
// their file status flags back when the last relay using them ends.
struct local_io
{
  int input = STDIN_FILENO;
  int output = STDOUT_FILENO;
};

// Pumps bytes between socket and the local streams until the socket side
// ends. Local input is copied to the socket on a separately spawned
// coroutine that is stopped when the relay returns.
asio::awaitable<void> relay(asio::ip::tcp::socket socket, local_io io, std::ostream& log);

} // namespace netro

#endif // NETRO_RELAY_HPP

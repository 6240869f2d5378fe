#ifndef NETRO_DATAGRAM_HPP
#define NETRO_DATAGRAM_HPP

#include <cstddef>
#include <ostream>
#include <asio.hpp>

namespace netro {

constexpr std::size_t datagram_buffer_size = 1024;

constexpr char datagram_reply[] = "Message received";

// Logs each datagram on the socket and acknowledges it to its sender.
// Throws a listener error when a receive or send fails.
asio::awaitable<void> echo_datagrams(asio::ip::udp::socket& socket, std::ostream& log);

} // namespace netro

#endif // NETRO_DATAGRAM_HPP

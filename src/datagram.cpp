#include "netro/datagram.hpp"
#include <array>
#include <cctype>
#include <string_view>
#include "netro/address.hpp"
#include "netro/async.hpp"
#include "netro/error.hpp"
#include "netro/log.hpp"

using asio::awaitable;
using asio::buffer;
using asio::ip::udp;

namespace netro {

namespace {

std::string_view trim(std::string_view text)
{
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
    text.remove_prefix(1);
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
    text.remove_suffix(1);
  return text;
}

} // namespace

awaitable<void> echo_datagrams(udp::socket& socket, std::ostream& log)
{
  std::array<char, datagram_buffer_size> data;
  const std::string_view reply(datagram_reply);

  for (;;)
  {
    // Datagrams longer than the buffer arrive truncated.
    udp::endpoint sender;
    auto [e1, n1] = co_await socket.async_receive_from(buffer(data), sender, use_nothrow_awaitable);
    if (e1)
      throw error(error_kind::listener,
          "UDP listener stopped: error reading from UDP connection: " + e1.message());

    log << "Received " << n1 << " bytes from " << to_string(sender) << ": "
        << trim(std::string_view(data.data(), n1)) << std::endl;

    auto [e2, n2] = co_await socket.async_send_to(buffer(reply.data(), reply.size()), sender, use_nothrow_awaitable);
    if (e2)
      throw error(error_kind::listener,
          "UDP listener stopped: error sending response: " + e2.message());

    NETRO_TRACE("acknowledged " << to_string(sender) << " with " << n2 << " bytes");
  }
}

} // namespace netro

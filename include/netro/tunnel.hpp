#ifndef NETRO_TUNNEL_HPP
#define NETRO_TUNNEL_HPP

#include <chrono>
#include <string>
#include <string_view>
#include <asio.hpp>
#include "netro/proxy_url.hpp"

namespace netro {

// An open socket to the proxy after a successful CONNECT. Whatever the
// proxy sent past the response head is already tunnel payload and is
// left in pending.
struct tunnel_session
{
  asio::ip::tcp::socket socket;
  std::string pending;
};

struct status_line
{
  int major = 0;
  int minor = 0;
  int code = 0;
  std::string reason;

  // "407 Proxy Authentication Required"
  std::string status() const;
};

// Parses "HTTP/1.1 200 Connection established". Throws a handshake
// error when the line does not follow that grammar.
status_line parse_status_line(std::string_view line);

std::string make_connect_request(const std::string& target);

// Dials the proxy, sends CONNECT for target and checks for a 200 reply,
// all before the deadline.
asio::awaitable<tunnel_session> negotiate_tunnel(
    const proxy_url& proxy,
    const std::string& target,
    std::chrono::steady_clock::time_point deadline);

} // namespace netro

#endif // NETRO_TUNNEL_HPP

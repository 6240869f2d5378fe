#ifndef NETRO_PROXY_URL_HPP
#define NETRO_PROXY_URL_HPP

#include <string>
#include <string_view>

namespace netro {

struct proxy_url
{
  std::string scheme;
  std::string host;  // without brackets for IPv6 literals
  std::string port;
};

// Accepts http://[user[:password]@]host[:port][/path]. The port defaults
// to 80. Userinfo and path are ignored.
proxy_url parse_proxy_url(std::string_view text);

} // namespace netro

#endif // NETRO_PROXY_URL_HPP

#include "netro/address.hpp"

namespace netro {

std::string join_host_port(const std::string& host, const std::string& port)
{
  if (host.find(':') != std::string::npos)
    return "[" + host + "]:" + port;
  return host + ":" + port;
}

} // namespace netro

#ifndef NETRO_ADDRESS_HPP
#define NETRO_ADDRESS_HPP

#include <string>
#include <asio.hpp>

namespace netro {

std::string join_host_port(const std::string& host, const std::string& port);

template <typename Protocol>
std::string to_string(const asio::ip::basic_endpoint<Protocol>& endpoint)
{
  auto address = endpoint.address();
  if (address.is_v6() && address.to_v6().is_v4_mapped())
    address = asio::ip::make_address_v4(asio::ip::v4_mapped, address.to_v6());

  return join_host_port(address.to_string(), std::to_string(endpoint.port()));
}

} // namespace netro

#endif // NETRO_ADDRESS_HPP

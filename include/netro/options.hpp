#ifndef NETRO_OPTIONS_HPP
#define NETRO_OPTIONS_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace netro {

enum class protocol
{
  tcp,
  udp
};

const char* to_string(protocol p);

// Upper-case name used in status lines, e.g. "(TCP)".
const char* display_name(protocol p);

protocol parse_protocol(std::string_view text);

// Go-style duration: "5s", "250ms", "1m30s", "1.5s", "0".
std::chrono::nanoseconds parse_duration(std::string_view text);

std::uint16_t parse_port(std::string_view text);

struct connection_request
{
  std::string host;
  std::string port;
  netro::protocol protocol = protocol::tcp;
  std::chrono::nanoseconds timeout = std::chrono::seconds(5);
  std::string proxy;
};

struct listen_request
{
  std::uint16_t port = 0;
  netro::protocol protocol = protocol::tcp;
};

struct command_line
{
  bool listen = false;
  bool help = false;
  int verbose = 0;
  connection_request connect;
  listen_request serve;
};

command_line parse_command_line(int argc, char* argv[]);

std::string usage(const char* program);

} // namespace netro

#endif // NETRO_OPTIONS_HPP

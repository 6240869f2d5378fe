#include "netro/options.hpp"
#include <getopt.h>
#include <cctype>
#include <charconv>
#include <sstream>
#include <vector>
#include "netro/error.hpp"

namespace netro {

namespace {

struct duration_unit
{
  std::string_view suffix;
  double nanoseconds;
};

// Longer suffixes first so "ms" is not taken for "m".
const duration_unit duration_units[] =
{
  { "ns", 1.0 },
  { "us", 1e3 },
  { "\xC2\xB5s", 1e3 },  // U+00B5 micro sign
  { "\xCE\xBCs", 1e3 },  // U+03BC greek mu
  { "ms", 1e6 },
  { "s", 1e9 },
  { "m", 60e9 },
  { "h", 3600e9 },
};

error bad_duration(std::string_view text)
{
  return error(error_kind::config, "invalid duration \"" + std::string(text) + "\"");
}

} // namespace

const char* to_string(protocol p)
{
  return p == protocol::udp ? "udp" : "tcp";
}

const char* display_name(protocol p)
{
  return p == protocol::udp ? "UDP" : "TCP";
}

protocol parse_protocol(std::string_view text)
{
  if (text == "tcp")
    return protocol::tcp;
  if (text == "udp")
    return protocol::udp;
  throw error(error_kind::config, "unsupported protocol: " + std::string(text));
}

std::chrono::nanoseconds parse_duration(std::string_view text)
{
  if (text == "0")
    return std::chrono::nanoseconds::zero();

  std::string_view rest = text;
  if (!rest.empty() && rest.front() == '+')
    rest.remove_prefix(1);
  if (rest.empty())
    throw bad_duration(text);

  double total = 0;
  while (!rest.empty())
  {
    double whole = 0;
    std::size_t digits = 0;
    while (!rest.empty() && std::isdigit(static_cast<unsigned char>(rest.front())))
    {
      whole = whole * 10 + (rest.front() - '0');
      rest.remove_prefix(1);
      ++digits;
    }

    double fraction = 0;
    if (!rest.empty() && rest.front() == '.')
    {
      rest.remove_prefix(1);
      double scale = 0.1;
      while (!rest.empty() && std::isdigit(static_cast<unsigned char>(rest.front())))
      {
        fraction += (rest.front() - '0') * scale;
        scale /= 10;
        rest.remove_prefix(1);
        ++digits;
      }
    }

    if (digits == 0)
      throw bad_duration(text);

    const duration_unit* unit = nullptr;
    for (const auto& u : duration_units)
    {
      if (rest.substr(0, u.suffix.size()) == u.suffix
          && (unit == nullptr || u.suffix.size() > unit->suffix.size()))
        unit = &u;
    }
    if (unit == nullptr)
      throw bad_duration(text);
    rest.remove_prefix(unit->suffix.size());

    total += (whole + fraction) * unit->nanoseconds;
  }

  if (total >= static_cast<double>(std::chrono::nanoseconds::max().count()))
    throw bad_duration(text);

  return std::chrono::nanoseconds(static_cast<std::chrono::nanoseconds::rep>(total));
}

std::uint16_t parse_port(std::string_view text)
{
  unsigned value = 0;
  auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (text.empty() || ec != std::errc() || end != text.data() + text.size() || value > 65535)
    throw error(error_kind::config, "invalid port \"" + std::string(text) + "\"");
  return static_cast<std::uint16_t>(value);
}

command_line parse_command_line(int argc, char* argv[])
{
  static const option long_options[] =
  {
    { "protocol", required_argument, nullptr, 'p' },
    { "timeout", required_argument, nullptr, 't' },
    { "proxy", required_argument, nullptr, 'x' },
    { "listen", no_argument, nullptr, 'l' },
    { "verbose", no_argument, nullptr, 'v' },
    { "help", no_argument, nullptr, 'h' },
    { nullptr, 0, nullptr, 0 }
  };

  command_line cmd;
  std::string protocol_text = "tcp";

  optind = 0;
  opterr = 0;
  int opt;
  while ((opt = getopt_long(argc, argv, "p:t:x:lvh", long_options, nullptr)) != -1)
  {
    switch (opt)
    {
    case 'p':
      protocol_text = optarg;
      break;
    case 't':
      cmd.connect.timeout = parse_duration(optarg);
      break;
    case 'x':
      cmd.connect.proxy = optarg;
      break;
    case 'l':
      cmd.listen = true;
      break;
    case 'v':
      ++cmd.verbose;
      break;
    case 'h':
      cmd.help = true;
      return cmd;
    case ':':
    case '?':
    default:
      {
        std::string flag = optopt ? std::string("-") + static_cast<char>(optopt) : std::string(argv[optind - 1]);
        throw error(error_kind::config, "invalid or incomplete option " + flag);
      }
    }
  }

  auto p = parse_protocol(protocol_text);

  std::vector<std::string> args(argv + optind, argv + argc);
  if (cmd.listen)
  {
    if (args.size() != 1)
      throw error(error_kind::config, "listen mode takes a port and no host");
    if (!cmd.connect.proxy.empty())
      throw error(error_kind::config, "--proxy cannot be used with --listen");
    cmd.serve.port = parse_port(args[0]);
    cmd.serve.protocol = p;
  }
  else
  {
    if (args.size() != 2)
      throw error(error_kind::config, "expected <host> <port>");
    if (!cmd.connect.proxy.empty() && p != protocol::tcp)
      throw error(error_kind::config, "--proxy is only supported for tcp");
    cmd.connect.host = args[0];
    cmd.connect.port = args[1];
    cmd.connect.protocol = p;
  }

  return cmd;
}

std::string usage(const char* program)
{
  std::ostringstream out;
  out << "Usage: " << program << " [options] <host> <port>\n"
      << "       " << program << " --listen [options] <port>\n"
      << "\n"
      << "Options:\n"
      << "  -p, --protocol tcp|udp  protocol to use (default tcp)\n"
      << "  -t, --timeout DURATION  dial timeout, e.g. 5s, 500ms (default 5s, 0 waits forever)\n"
      << "  -x, --proxy URL         HTTP proxy for tcp connections, e.g. http://proxy:8080\n"
      << "  -l, --listen            listen for incoming connections on <port>\n"
      << "  -v, --verbose           more diagnostics on stderr, repeatable\n"
      << "  -h, --help              show this help\n";
  return out.str();
}

} // namespace netro

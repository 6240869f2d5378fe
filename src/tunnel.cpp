#include "netro/tunnel.hpp"
#include <cctype>
#include <tuple>
#include "netro/address.hpp"
#include "netro/async.hpp"
#include "netro/dial.hpp"
#include "netro/error.hpp"
#include "netro/log.hpp"

using asio::awaitable;
using asio::ip::tcp;
using std::chrono::steady_clock;

namespace netro {

namespace {

constexpr std::size_t max_head_size = 16 * 1024;

error malformed(std::string_view line)
{
  return error(error_kind::handshake,
      "failed to read proxy response: malformed status line \"" + std::string(line) + "\"");
}

bool read_number(std::string_view& text, int& value)
{
  std::size_t digits = 0;
  value = 0;
  while (digits < text.size() && std::isdigit(static_cast<unsigned char>(text[digits])))
  {
    value = value * 10 + (text[digits] - '0');
    if (++digits > 3)
      return false;
  }
  text.remove_prefix(digits);
  return digits > 0;
}

// Reads the response head line by line up to the blank line that ends it.
// Bytes received past the head stay in buffer.
awaitable<std::tuple<std::error_code, std::string>> read_response_head(
    tcp::socket& socket,
    std::string& buffer)
{
  std::string first_line;
  std::size_t head_size = 0;

  for (;;)
  {
    auto [e, n] = co_await asio::async_read_until(
        socket,
        asio::dynamic_buffer(buffer, max_head_size),
        '\n',
        use_nothrow_awaitable
      );

    if (e == asio::error::not_found)
      co_return std::make_tuple(std::make_error_code(std::errc::message_size), first_line);
    if (e)
      co_return std::make_tuple(std::error_code(e), first_line);

    head_size += n;
    if (head_size > max_head_size)
      co_return std::make_tuple(std::make_error_code(std::errc::message_size), first_line);

    std::string line(buffer.substr(0, n - 1));
    buffer.erase(0, n);
    if (!line.empty() && line.back() == '\r')
      line.pop_back();

    if (line.empty())
    {
      // A blank line before the status line is tolerated, as HTTP/1.1
      // readers do.
      if (first_line.empty())
        continue;
      co_return std::make_tuple(std::error_code(), first_line);
    }

    if (first_line.empty())
      first_line = std::move(line);
    else
      NETRO_TRACE("proxy header: " << line);
  }
}

} // namespace

std::string status_line::status() const
{
  std::string text = std::to_string(code);
  if (!reason.empty())
    text += " " + reason;
  return text;
}

status_line parse_status_line(std::string_view line)
{
  status_line result;
  std::string_view rest = line;

  if (rest.substr(0, 5) != "HTTP/")
    throw malformed(line);
  rest.remove_prefix(5);

  if (!read_number(rest, result.major) || rest.empty() || rest.front() != '.')
    throw malformed(line);
  rest.remove_prefix(1);
  if (!read_number(rest, result.minor))
    throw malformed(line);

  if (rest.empty() || rest.front() != ' ')
    throw malformed(line);
  rest.remove_prefix(1);

  std::string_view code = rest.substr(0, 3);
  if (code.size() != 3 || !read_number(code, result.code) || !code.empty())
    throw malformed(line);
  rest.remove_prefix(3);

  if (!rest.empty())
  {
    if (rest.front() != ' ')
      throw malformed(line);
    rest.remove_prefix(1);
  }
  result.reason = std::string(rest);

  return result;
}

std::string make_connect_request(const std::string& target)
{
  return "CONNECT " + target + " HTTP/1.1\r\n"
      "Host: " + target + "\r\n"
      "\r\n";
}

awaitable<tunnel_session> negotiate_tunnel(
    const proxy_url& proxy,
    const std::string& target,
    steady_clock::time_point deadline)
{
  tcp::socket socket(co_await asio::this_coro::executor);
  std::string proxy_address = join_host_port(proxy.host, proxy.port);

  auto dialed = co_await within(dial<tcp>(socket, proxy.host, proxy.port), deadline);
  if (!dialed)
    throw error(error_kind::dial,
        "failed to connect to proxy: dial tcp " + proxy_address + ": i/o timeout");
  if (auto e = std::get<0>(*dialed))
    throw error(error_kind::dial,
        "failed to connect to proxy: dial tcp " + proxy_address + ": " + e.message());

  NETRO_INFO("connected to proxy " << to_string(std::get<1>(*dialed)));

  std::string request = make_connect_request(target);
  auto written = co_await within(
      asio::async_write(socket, asio::buffer(request), use_nothrow_awaitable),
      deadline
    );
  if (!written)
    throw error(error_kind::handshake, "failed to send CONNECT request: i/o timeout");
  if (auto e = std::get<0>(*written))
    throw error(error_kind::handshake, "failed to send CONNECT request: " + e.message());

  NETRO_TRACE("sent CONNECT " << target << " to " << proxy_address);

  std::string buffer;
  auto head = co_await within(read_response_head(socket, buffer), deadline);
  if (!head)
    throw error(error_kind::handshake, "failed to read proxy response: i/o timeout");
  if (auto e = std::get<0>(*head))
  {
    std::string why = e == asio::error::eof ? "unexpected EOF" : e.message();
    throw error(error_kind::handshake, "failed to read proxy response: " + why);
  }

  auto status = parse_status_line(std::get<1>(*head));
  NETRO_INFO("proxy " << proxy_address << " replied " << status.status());

  if (status.code != 200)
    throw error(error_kind::handshake, "proxy connection failed: " + status.status());

  co_return tunnel_session{std::move(socket), std::move(buffer)};
}

} // namespace netro

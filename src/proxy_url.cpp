#include "netro/proxy_url.hpp"
#include <algorithm>
#include <cctype>
#include "netro/error.hpp"
#include "netro/options.hpp"

namespace netro {

namespace {

error invalid(std::string_view text, const std::string& why)
{
  return error(error_kind::config,
      "invalid proxy URL: \"" + std::string(text) + "\": " + why);
}

} // namespace

proxy_url parse_proxy_url(std::string_view text)
{
  auto scheme_end = text.find("://");
  if (scheme_end == std::string_view::npos || scheme_end == 0)
    throw invalid(text, "missing scheme");

  proxy_url url;
  url.scheme = std::string(text.substr(0, scheme_end));
  std::transform(url.scheme.begin(), url.scheme.end(), url.scheme.begin(),
      [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  if (url.scheme != "http")
    throw invalid(text, "unsupported scheme " + url.scheme);

  auto authority = text.substr(scheme_end + 3);
  authority = authority.substr(0, authority.find_first_of("/?#"));

  auto at = authority.rfind('@');
  if (at != std::string_view::npos)
    authority.remove_prefix(at + 1);

  std::string_view host;
  std::string_view port;
  if (!authority.empty() && authority.front() == '[')
  {
    auto close = authority.find(']');
    if (close == std::string_view::npos)
      throw invalid(text, "unterminated IPv6 literal");
    host = authority.substr(1, close - 1);
    auto after = authority.substr(close + 1);
    if (!after.empty())
    {
      if (after.front() != ':')
        throw invalid(text, "unexpected characters after host");
      port = after.substr(1);
      if (port.empty())
        throw invalid(text, "empty port");
    }
  }
  else
  {
    auto colon = authority.find(':');
    if (colon != std::string_view::npos)
    {
      if (authority.find(':', colon + 1) != std::string_view::npos)
        throw invalid(text, "IPv6 host must be bracketed");
      host = authority.substr(0, colon);
      port = authority.substr(colon + 1);
      if (port.empty())
        throw invalid(text, "empty port");
    }
    else
    {
      host = authority;
    }
  }

  if (host.empty())
    throw invalid(text, "missing host");

  url.host = std::string(host);
  if (port.empty())
  {
    url.port = "80";
  }
  else
  {
    try
    {
      url.port = std::to_string(parse_port(port));
    }
    catch (error&)
    {
      throw invalid(text, "bad port " + std::string(port));
    }
  }

  return url;
}

} // namespace netro

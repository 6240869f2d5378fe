#ifndef NETRO_ERROR_HPP
#define NETRO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace netro {

enum class error_kind
{
  config,     // rejected before any I/O
  dial,       // connect to target or proxy
  handshake,  // proxy CONNECT exchange
  relay,
  listener
};

class error
  : public std::runtime_error
{
public:
  error(error_kind kind, const std::string& what)
    : std::runtime_error(what),
      kind_(kind)
  {
  }

  error_kind kind() const noexcept
  {
    return kind_;
  }

private:
  error_kind kind_;
};

} // namespace netro

#endif // NETRO_ERROR_HPP

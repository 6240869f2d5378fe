#ifndef NETRO_LOG_HPP
#define NETRO_LOG_HPP

#include <iostream>

namespace netro {

// Raised once per -v on the command line.
extern int verbose;

const char* log_timestamp();

} // namespace netro

#define NETRO_LOG_WARN  (::netro::verbose >= 1)
#define NETRO_LOG_INFO  (::netro::verbose >= 2)
#define NETRO_LOG_TRACE (::netro::verbose >= 3)

#define NETRO_WARN(X)  (NETRO_LOG_WARN ? (std::cerr << ::netro::log_timestamp() << X << std::endl) : std::cerr)
#define NETRO_INFO(X)  (NETRO_LOG_INFO ? (std::cerr << ::netro::log_timestamp() << X << std::endl) : std::cerr)
#define NETRO_TRACE(X) (NETRO_LOG_TRACE ? (std::cerr << ::netro::log_timestamp() << X << std::endl) : std::cerr)

#endif // NETRO_LOG_HPP

#include "netro/log.hpp"
#include <chrono>
#include <ctime>
#include <cstdio>

namespace netro {

int verbose = 0;

const char* log_timestamp()
{
  static thread_local char buffer[32];

  auto now = std::chrono::system_clock::now();
  auto seconds = std::chrono::system_clock::to_time_t(now);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
      now.time_since_epoch()).count() % 1000;

  std::tm local{};
  localtime_r(&seconds, &local);
  std::size_t n = std::strftime(buffer, sizeof(buffer), "%H:%M:%S", &local);
  std::snprintf(buffer + n, sizeof(buffer) - n, ".%03d ", static_cast<int>(millis));
  return buffer;
}

} // namespace netro

#include "netro/relay.hpp"
#include <array>
#include <cerrno>
#include <cstring>
#include <map>
#include <memory>
#include <mutex>
#include <system_error>
#include <fcntl.h>
#include "netro/address.hpp"
#include "netro/async.hpp"
#include "netro/log.hpp"

using asio::awaitable;
using asio::buffer;
using asio::co_spawn;
using asio::detached;
using asio::ip::tcp;
using asio::posix::stream_descriptor;

namespace netro {

namespace {

int duplicate(int fd)
{
  int copy = ::dup(fd);
  if (copy < 0)
    throw std::system_error(errno, std::generic_category(), "dup");
  return copy;
}

// asio switches a descriptor to non-blocking mode, and a dup() shares that
// flag with the original. The first relay on a descriptor records its
// flags and the last one to finish puts them back.
class saved_flags
{
public:
  explicit saved_flags(int fd)
    : fd_(fd)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& held = held_[fd_];
    if (held.count++ == 0)
      held.flags = ::fcntl(fd_, F_GETFL);
  }

  ~saved_flags()
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = held_.find(fd_);
    if (--it->second.count == 0)
    {
      if (it->second.flags >= 0 && ::fcntl(fd_, F_SETFL, it->second.flags) < 0)
        NETRO_WARN("cannot restore flags of descriptor " << fd_ << ": " << std::strerror(errno));
      held_.erase(it);
    }
  }

  saved_flags(const saved_flags&) = delete;
  saved_flags& operator=(const saved_flags&) = delete;

private:
  struct holders
  {
    int count = 0;
    int flags = -1;
  };

  static inline std::mutex mutex_;
  static inline std::map<int, holders> held_;

  int fd_;
};

template <typename From, typename To>
awaitable<void> transfer(From& from, To& to, const char* direction)
{
  std::array<char, 4096> data;

  for (;;)
  {
    auto [e1, n1] = co_await from.async_read_some(buffer(data), use_nothrow_awaitable);
    if (e1)
    {
      NETRO_TRACE(direction << " stopped reading: " << e1.message());
      co_return;
    }

    auto [e2, n2] = co_await async_write(to, buffer(data, n1), use_nothrow_awaitable);
    if (e2)
    {
      NETRO_TRACE(direction << " stopped writing: " << e2.message());
      co_return;
    }
  }
}

// The socket and the local descriptors of one accepted connection.
class relay_pair
{
public:
  relay_pair(tcp::socket socket, local_io io)
    : input_flags_(io.input),
      output_flags_(io.output),
      socket_(std::move(socket)),
      input_(socket_.get_executor(), duplicate(io.input)),
      output_(socket_.get_executor(), duplicate(io.output))
  {
  }

  awaitable<void> input_to_socket()
  {
    co_await transfer(input_, socket_, "input -> socket");
  }

  awaitable<void> socket_to_output()
  {
    co_await transfer(socket_, output_, "socket -> output");
  }

  // Aborts whatever input_to_socket is still waiting on.
  void stop()
  {
    socket_.close();
    input_.close();
  }

  tcp::socket::executor_type executor()
  {
    return socket_.get_executor();
  }

private:
  // Declared first so the flags come back after the descriptors close.
  saved_flags input_flags_;
  saved_flags output_flags_;
  tcp::socket socket_;
  stream_descriptor input_;
  stream_descriptor output_;
};

awaitable<void> pump_input(std::shared_ptr<relay_pair> pair)
{
  co_await pair->input_to_socket();
}

} // namespace

awaitable<void> relay(tcp::socket socket, local_io io, std::ostream& log)
{
  std::error_code e;
  auto remote = socket.remote_endpoint(e);
  std::string peer = e ? std::string("unknown peer") : to_string(remote);

  log << "Accepted connection from " << peer << std::endl;

  auto pair = std::make_shared<relay_pair>(std::move(socket), io);

  co_spawn(pair->executor(), pump_input(pair), detached);
  co_await pair->socket_to_output();

  pair->stop();
  NETRO_INFO("connection from " << peer << " closed");
}

} // namespace netro

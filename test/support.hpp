#ifndef NETRO_TEST_SUPPORT_HPP
#define NETRO_TEST_SUPPORT_HPP

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <ostream>
#include <streambuf>
#include <system_error>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <asio.hpp>
#include <gtest/gtest.h>

namespace netro::test {

using namespace std::literals::chrono_literals;

// Runs ctx on a background thread for as long as the object lives.
// Declare it after everything that the handlers running on ctx touch.
class io_runner
{
public:
  explicit io_runner(asio::io_context& ctx)
    : ctx_(ctx),
      thread_([this]{ ctx_.run(); })
  {
  }

  ~io_runner()
  {
    stop();
  }

  void stop()
  {
    ctx_.stop();
    if (thread_.joinable())
      thread_.join();
  }

private:
  asio::io_context& ctx_;
  std::thread thread_;
};

class pipe_fds
{
public:
  pipe_fds()
  {
    int fds[2];
    if (::pipe(fds) != 0)
      throw std::system_error(errno, std::generic_category(), "pipe");
    read_end = fds[0];
    write_end = fds[1];
  }

  ~pipe_fds()
  {
    close_write();
    if (read_end >= 0)
      ::close(read_end);
  }

  void close_write()
  {
    if (write_end >= 0)
      ::close(write_end);
    write_end = -1;
  }

  void write(const std::string& data)
  {
    ASSERT_EQ(static_cast<ssize_t>(data.size()), ::write(write_end, data.data(), data.size()));
  }

  int read_end = -1;
  int write_end = -1;
};

// An unbuffered ostream that may be written on one thread while another
// takes snapshots of it.
class shared_output
  : public std::ostream
{
public:
  shared_output()
    : std::ostream(nullptr)
  {
    rdbuf(&buffer_);
  }

  std::string str() const
  {
    return buffer_.str();
  }

  // Polls until needle shows up in the text.
  bool wait_for(const std::string& needle, std::chrono::milliseconds timeout = 5s) const
  {
    auto until = std::chrono::steady_clock::now() + timeout;
    while (str().find(needle) == std::string::npos)
    {
      if (std::chrono::steady_clock::now() > until)
        return false;
      std::this_thread::sleep_for(10ms);
    }
    return true;
  }

private:
  class buffer
    : public std::streambuf
  {
  public:
    std::string str() const
    {
      std::lock_guard<std::mutex> lock(mutex_);
      return text_;
    }

  protected:
    int_type overflow(int_type c) override
    {
      if (traits_type::eq_int_type(c, traits_type::eof()))
        return traits_type::not_eof(c);
      std::lock_guard<std::mutex> lock(mutex_);
      text_.push_back(traits_type::to_char_type(c));
      return c;
    }

    std::streamsize xsputn(const char* s, std::streamsize n) override
    {
      std::lock_guard<std::mutex> lock(mutex_);
      text_.append(s, static_cast<std::size_t>(n));
      return n;
    }

  private:
    mutable std::mutex mutex_;
    std::string text_;
  };

  buffer buffer_;
};

inline bool is_nonblocking(int fd)
{
  return (::fcntl(fd, F_GETFL) & O_NONBLOCK) != 0;
}

inline bool wait_readable(int fd, std::chrono::milliseconds timeout)
{
  pollfd p{fd, POLLIN, 0};
  return ::poll(&p, 1, static_cast<int>(timeout.count())) > 0;
}

// Reads from fd into acc until needle shows up or nothing arrives for a
// while.
inline bool read_until_contains(int fd, const std::string& needle, std::string& acc,
    std::chrono::milliseconds timeout = 5s)
{
  char data[512];
  while (acc.find(needle) == std::string::npos)
  {
    if (!wait_readable(fd, timeout))
      return false;
    ssize_t n = ::read(fd, data, sizeof(data));
    if (n <= 0)
      return false;
    acc.append(data, static_cast<std::size_t>(n));
  }
  return true;
}

// A port on the loopback interface that nothing listens on.
inline std::uint16_t closed_port()
{
  asio::io_context ctx;
  asio::ip::tcp::acceptor acceptor(ctx,
      asio::ip::tcp::endpoint(asio::ip::address_v4::loopback(), 0));
  return acceptor.local_endpoint().port();
}

// Accepts one connection, records the request head and answers with a
// canned reply. An empty reply keeps the client waiting.
class fake_proxy
{
public:
  explicit fake_proxy(std::string reply)
    : acceptor_(ctx_, asio::ip::tcp::endpoint(asio::ip::address_v4::loopback(), 0)),
      port_(acceptor_.local_endpoint().port()),
      reply_(std::move(reply))
  {
    thread_ = std::thread([this]{ serve(); });
  }

  ~fake_proxy()
  {
    // Nobody dialed us: connect once so the accept returns.
    if (!accepted_)
    {
      std::error_code e;
      asio::ip::tcp::socket poke(ctx_);
      poke.connect(asio::ip::tcp::endpoint(asio::ip::address_v4::loopback(), port_), e);
      poke.close(e);
    }
    join();
  }

  std::uint16_t port() const
  {
    return port_;
  }

  std::string url() const
  {
    return "http://127.0.0.1:" + std::to_string(port());
  }

  // Waits for the client to go away, then returns what it sent.
  const std::string& request()
  {
    join();
    return request_;
  }

private:
  void join()
  {
    if (thread_.joinable())
      thread_.join();
  }

  void serve()
  {
    std::error_code e;
    asio::ip::tcp::socket socket = acceptor_.accept(e);
    accepted_ = true;
    if (e)
      return;

    asio::read_until(socket, asio::dynamic_buffer(request_), "\r\n\r\n", e);
    if (!e && !reply_.empty())
      asio::write(socket, asio::buffer(reply_), e);

    char sink[256];
    while (!e)
      socket.read_some(asio::buffer(sink), e);
  }

  asio::io_context ctx_;
  asio::ip::tcp::acceptor acceptor_;
  std::uint16_t port_;
  std::string reply_;
  std::string request_;
  std::atomic<bool> accepted_{false};
  std::thread thread_;
};

} // namespace netro::test

#endif // NETRO_TEST_SUPPORT_HPP

#include <csignal>
#include <iostream>
#include "netro/error.hpp"
#include "netro/initiator.hpp"
#include "netro/listener.hpp"
#include "netro/log.hpp"
#include "netro/options.hpp"

int main(int argc, char* argv[])
{
  // Closed peers and closed pipes show up as write errors instead.
  std::signal(SIGPIPE, SIG_IGN);

  netro::command_line cmd;
  try
  {
    cmd = netro::parse_command_line(argc, argv);
  }
  catch (netro::error& e)
  {
    std::cerr << "Error: " << e.what() << "\n\n";
    std::cerr << netro::usage(argv[0]);
    return 1;
  }

  if (cmd.help)
  {
    std::cout << netro::usage(argv[0]);
    return 0;
  }

  netro::verbose = cmd.verbose;

  try
  {
    if (cmd.listen)
      netro::run_listen(cmd.serve, netro::local_io(), std::cout);
    else
      netro::run_connect(cmd.connect, std::cout);
  }
  catch (std::exception& e)
  {
    if (cmd.listen)
      std::cerr << "Error executing nc listen: " << e.what() << "\n";
    else
      std::cerr << "Error executing nc: " << e.what() << "\n";
    return 1;
  }

  return 0;
}

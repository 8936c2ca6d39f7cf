#include "liteagent/cli/commands.hpp"

#include <csignal>
#include <exception>
#include <iostream>

int main(int argc, char **argv) {
  // Output is often piped into an agent; a closed reader must not kill us.
  std::signal(SIGPIPE, SIG_IGN);
  try {
    return liteagent::cli::run_cli(argc, argv);
  } catch (const std::exception &e) {
    std::cerr << "fatal: " << e.what() << "\n";
    return 1;
  }
}

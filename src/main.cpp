#include "cli/registry.hpp"
#include "sprig/log.hpp"

#include <iostream>
#include <string>

int main(int argc, char **argv) {
  sprig::cli::register_all_commands(); // defined in register_commands.cpp

  int first = 1;
  if (argc > 1 && std::string(argv[1]) == "-v") {
    sprig::log::set_threshold(sprig::log::Level::Info);
    ++first;
  }

  if (argc <= first) {
    sprig::cli::print_usage();
    return 2;
  }
  const std::string cmd = argv[first];

  const auto fn = sprig::cli::find_command(cmd);
  if (!fn) {
    std::cerr << "unknown command: " << cmd << "\n";
    sprig::cli::print_usage();
    return 2;
  }
  // Pass everything after the subcommand to the handler
  return fn(argc - first, argv + first);
}

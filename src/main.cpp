#include "cli/registry.hpp"

#include <iostream>
#include <string>

int main(int argc, char **argv) {
  strata::cli::register_all_commands(); // defined in register_commands.cpp

  strata::cli::Options opts;
  int first = 1;
  while (first < argc) {
    const std::string flag = argv[first];
    if (flag != "-v" && flag != "--verbose") {
      break;
    }
    opts.verbose = true;
    ++first;
  }

  if (first >= argc) {
    strata::cli::print_usage();
    return 2;
  }
  const std::string cmd = argv[first];

  const auto fn = strata::cli::find_command(cmd);
  if (!fn) {
    std::cerr << "unknown command: " << cmd << "\n";
    strata::cli::print_usage();
    return 2;
  }
  // Pass everything after the subcommand to the handler
  return fn(opts, argc - first, argv + first);
}

#include "cli/common.hpp"

#include <iostream>

int cmd_ls_tags(const strata::cli::Options &opts, int argc, char **argv) {
  if (argc > 2) {
    std::cerr << "usage: strata ls-tags [dir]\n";
    return 2;
  }
  try {
    const auto ctx = strata::cli::make_context(opts);
    for (const auto &name : ctx.repo().tags().ls_tags(argc == 2 ? argv[1] : "")) {
      std::cout << name << "\n";
    }
    return 0;
  } catch (const std::exception &e) {
    return strata::cli::report("ls-tags", e);
  }
}

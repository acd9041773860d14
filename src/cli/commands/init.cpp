#include "cli/common.hpp"
#include "strata/config.hpp"
#include "strata/log.hpp"
#include "strata/repo.hpp"

#include <iostream>

int cmd_init(const strata::cli::Options &opts, int argc, char **argv) {
  try {
    auto cfg = strata::load_config();
    strata::log::init(strata::cli::effective_log_level(opts, cfg));
    const auto root = argc > 1 ? std::filesystem::path(argv[1]) : cfg.storage_root;
    strata::Repository repo{root};
    if (repo.is_initialized()) {
      std::cout << "Repository already initialized at " << root.string() << "\n";
      return 0;
    }
    repo.init();
    std::cout << "Initialized empty strata repository in " << root.string() << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "init: " << e.what() << "\n";
    return 1;
  }
}

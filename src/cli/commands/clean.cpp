#include "cli/common.hpp"
#include "strata/clean.hpp"

#include <iostream>
#include <string>

int cmd_clean(const strata::cli::Options &opts, int argc, char **argv) {
  bool dry_run = false;
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]) == "--dry-run") {
      dry_run = true;
    } else {
      std::cerr << "usage: strata clean [--dry-run]\n";
      return 2;
    }
  }
  try {
    const auto ctx = strata::cli::make_context(opts);
    const auto s = strata::clean_untagged_objects(ctx.repo(), &ctx.runtimes(), dry_run);
    std::cout << (dry_run ? "would remove " : "removed ") << s.objects << " objects, "
              << s.payloads << " payloads, " << s.renders << " renders\n";
    return 0;
  } catch (const std::exception &e) {
    return strata::cli::report("clean", e);
  }
}

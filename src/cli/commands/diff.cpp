#include "cli/common.hpp"
#include "strata/diff.hpp"
#include "strata/manifest.hpp"

#include <iostream>

int cmd_diff(const strata::cli::Options &opts, int argc, char **argv) {
  // strata diff <base> [top]; without <top> the active runtime is compared
  if (argc < 2 || argc > 3) {
    std::cerr << "usage: strata diff <base> [top]\n";
    return 2;
  }
  try {
    const auto ctx = strata::cli::make_context(opts);
    const auto &repo = ctx.repo();
    const auto base = strata::cli::manifest_for_ref(repo, argv[1]);

    strata::tracking::Manifest top;
    if (argc == 3) {
      top = strata::cli::manifest_for_ref(repo, argv[2]);
    } else {
      const auto rt = ctx.active_runtime();
      top = repo.compute_stack_manifest(rt.stack());
      top.update(strata::tracking::compute_manifest(rt.upper_dir()));
      top.finalize();
    }

    const auto diffs = strata::tracking::compute_diff(base, top);
    for (const auto &d : diffs) {
      if (d.mode != strata::tracking::DiffMode::Unchanged) {
        std::cout << strata::tracking::to_string(d) << "\n";
      }
    }
    return 0;
  } catch (const std::exception &e) {
    return strata::cli::report("diff", e);
  }
}

#include "cli/common.hpp"
#include "strata/prune.hpp"
#include "strata/time.hpp"

#include <cstdint>
#include <ctime>
#include <iostream>
#include <string>

int cmd_prune(const strata::cli::Options &opts, int argc, char **argv) {
  // strata prune [--prune-if-older-than DUR] [--keep-if-newer-than DUR]
  //              [--prune-if-more-than N] [--keep-if-less-than N] [--yes]
  strata::PrunePolicy policy;
  bool yes = false;
  try {
    const auto now = static_cast<std::int64_t>(std::time(nullptr));
    for (int i = 1; i < argc; ++i) {
      const std::string a = argv[i];
      const bool has_value = i + 1 < argc;
      if (a == "--prune-if-older-than" && has_value) {
        policy.prune_if_older_than = now - strata::timeutil::parse_duration_seconds(argv[++i]);
      } else if (a == "--keep-if-newer-than" && has_value) {
        policy.keep_if_newer_than = now - strata::timeutil::parse_duration_seconds(argv[++i]);
      } else if (a == "--prune-if-more-than" && has_value) {
        policy.prune_if_version_count_more_than = std::stoull(argv[++i]);
      } else if (a == "--keep-if-less-than" && has_value) {
        policy.keep_if_version_count_less_than = std::stoull(argv[++i]);
      } else if (a == "--yes") {
        yes = true;
      } else {
        std::cerr << "usage: strata prune [--prune-if-older-than DUR] [--keep-if-newer-than DUR]"
                     " [--prune-if-more-than N] [--keep-if-less-than N] [--yes]\n";
        return 2;
      }
    }
  } catch (const std::exception &e) {
    std::cerr << "prune: " << e.what() << "\n";
    return 2;
  }
  if (policy.empty()) {
    std::cerr << "prune: no policy given, nothing would be pruned\n";
    return 2;
  }

  try {
    const auto ctx = strata::cli::make_context(opts);
    const auto &tags = ctx.repo().tags();
    const auto prunable = strata::get_prunable_tags(tags, policy);
    for (const auto &tag : prunable) {
      std::cout << (yes ? "removing " : "would remove ") << tag.to_string() << " -> "
                << strata::to_base32(tag.target) << "\n";
    }
    if (!yes) {
      std::cout << prunable.size() << " tag(s) prunable; rerun with --yes to remove them\n";
      return 0;
    }
    const auto removed = strata::prune_tags(tags, policy);
    std::cout << "pruned " << removed << " tag(s)\n";
    return 0;
  } catch (const std::exception &e) {
    return strata::cli::report("prune", e);
  }
}

#include "cli/common.hpp"
#include "strata/sync.hpp"

#include <iostream>

int cmd_pull(const strata::cli::Options &opts, int argc, char **argv) {
  if (argc != 2) {
    std::cerr << "usage: strata pull <ref>\n";
    return 2;
  }
  try {
    const auto ctx = strata::cli::make_context(opts);
    const auto s = strata::pull_ref(ctx, argv[1]);
    std::cout << "pulled " << argv[1] << ": " << s.objects_synced << " objects, "
              << s.payloads_synced << " payloads, " << s.tags_synced << " tags\n";
    return 0;
  } catch (const std::exception &e) {
    return strata::cli::report("pull", e);
  }
}

#include "cli/common.hpp"
#include "strata/sync.hpp"

#include <iostream>

int cmd_push(const strata::cli::Options &opts, int argc, char **argv) {
  if (argc != 3) {
    std::cerr << "usage: strata push <ref> <remote>\n";
    return 2;
  }
  try {
    const auto ctx = strata::cli::make_context(opts);
    const auto s = strata::push_ref(ctx, argv[1], argv[2]);
    std::cout << "pushed " << argv[1] << " to " << argv[2] << ": " << s.objects_synced
              << " objects, " << s.payloads_synced << " payloads, " << s.tags_synced
              << " tags (" << s.objects_skipped << " already present)\n";
    return 0;
  } catch (const std::exception &e) {
    return strata::cli::report("push", e);
  }
}

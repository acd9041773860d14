#include "cli/common.hpp"
#include "strata/tag.hpp"
#include "strata/time.hpp"

#include <iostream>

int cmd_log(const strata::cli::Options &opts, int argc, char **argv) {
  if (argc != 2) {
    std::cerr << "usage: strata log <tag>\n";
    return 2;
  }
  try {
    const auto ctx = strata::cli::make_context(opts);
    const auto spec = strata::tracking::parse_tag_spec(argv[1]);
    const auto stream = ctx.repo().tags().read_tag_stream(spec.path());

    // newest first, addressed by offset the way `name~N` resolves
    std::size_t offset = 0;
    for (const auto &tag : stream) {
      std::cout << "tag " << spec.path() << "~" << offset++ << " (version " << tag.version
                << ")\n";
      std::cout << "Target: " << strata::to_base32(tag.target) << "\n";
      std::cout << "User:   " << tag.user << "\n";
      std::cout << "Date:   " << strata::timeutil::format_time(tag.time) << "\n\n";
    }
    return 0;
  } catch (const std::exception &e) {
    return strata::cli::report("log", e);
  }
}

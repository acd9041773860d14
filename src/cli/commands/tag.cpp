#include "cli/common.hpp"

#include <iostream>
#include <string>

int cmd_tag(const strata::cli::Options &opts, int argc, char **argv) {
  if (argc != 3) {
    std::cerr << "usage: strata tag <tag> <ref>\n";
    return 2;
  }
  try {
    const auto ctx = strata::cli::make_context(opts);
    const auto digest = ctx.repo().resolve_ref(argv[2]);
    const auto tag = ctx.repo().tags().push_tag(std::string_view(argv[1]), digest);
    std::cout << tag.to_string() << " -> " << strata::to_base32(digest) << "\n";
    return 0;
  } catch (const std::exception &e) {
    return strata::cli::report("tag", e);
  }
}

#include "cli/common.hpp"
#include "strata/graph.hpp"

#include <iostream>
#include <string>
#include <type_traits>
#include <variant>

namespace {

void print_object(const strata::Digest &digest, const strata::graph::Object &obj) {
  using namespace strata;
  std::cout << graph::kind_name(graph::kind_of(obj)) << " " << to_base32(digest) << "\n";
  std::visit(
      [](const auto &o) {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, graph::Blob>) {
          std::cout << "  payload: " << to_base32(o.payload) << "\n";
          std::cout << "  size:    " << o.size << "\n";
        } else if constexpr (std::is_same_v<T, graph::Layer>) {
          std::cout << "  manifest: " << to_base32(o.manifest) << "\n";
        } else if constexpr (std::is_same_v<T, graph::Platform>) {
          std::cout << "  stack (bottom first):\n";
          for (const auto &d : o.stack) {
            std::cout << "    " << to_base32(d) << "\n";
          }
        } else {
          std::cout << "  entries: " << o.walk().size() << "\n";
        }
      },
      obj);
}

} // namespace

int cmd_info(const strata::cli::Options &opts, int argc, char **argv) {
  if (argc != 2) {
    std::cerr << "usage: strata info <ref>\n";
    return 2;
  }
  try {
    const auto ctx = strata::cli::make_context(opts);
    const auto &repo = ctx.repo();
    const auto digest = repo.resolve_ref(argv[1]);
    print_object(digest, repo.objects().read_object(digest));
    for (const auto &alias : repo.find_aliases(argv[1])) {
      std::cout << "  alias: " << alias << "\n";
    }
    return 0;
  } catch (const std::exception &e) {
    return strata::cli::report("info", e);
  }
}

#include "cli/common.hpp"

#include "strata/config.hpp"
#include "strata/error.hpp"
#include "strata/log.hpp"

#include <iostream>

namespace strata::cli {

auto effective_log_level(const Options &opts, const Config &cfg) -> std::string {
  return opts.verbose ? "debug" : cfg.log_level;
}

auto make_context(const Options &opts) -> Context {
  auto cfg = load_config();
  cfg.log_level = effective_log_level(opts, cfg);
  log::init(cfg.log_level);
  Context ctx(std::move(cfg));
  ctx.ensure_repo();
  return ctx;
}

auto pick_runtime(const Context &ctx, const std::string &explicit_id) -> runtime::Runtime {
  if (!explicit_id.empty()) {
    return ctx.runtimes().read_runtime(explicit_id);
  }
  return ctx.active_runtime();
}

int report(std::string_view cmd, const std::exception &e) {
  std::cerr << cmd << ": " << e.what() << "\n";
  return 1;
}

auto manifest_for_ref(const Repository &repo, std::string_view ref) -> graph::Manifest {
  const auto digest = repo.resolve_ref(ref);
  const auto obj = repo.objects().read_object(digest);
  if (const auto *m = std::get_if<graph::Manifest>(&obj)) {
    return *m;
  }
  return repo.compute_stack_manifest({digest});
}

} // namespace strata::cli

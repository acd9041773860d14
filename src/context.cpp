#include "strata/context.hpp"

#include "strata/consts.hpp"
#include "strata/error.hpp"

#include <cstdlib>

namespace strata {

namespace {

std::string tag_user(const Config &cfg) { return cfg.user + "@" + cfg.host; }

} // namespace

Context::Context(Config cfg)
    : config_(std::move(cfg)), repo_(config_.storage_root, tag_user(config_)),
      runtimes_(config_.runtime_root) {
  const char *rt = std::getenv(std::string(consts::kEnvRuntime).c_str());
  if (rt && *rt) {
    active_runtime_ = rt;
  }
}

void Context::ensure_repo() const {
  if (!repo_.is_initialized()) {
    repo_.init();
  }
}

auto Context::remote(std::string_view name, bool create) const -> Repository {
  const auto it = config_.remotes.find(std::string(name));
  if (it == config_.remotes.end()) {
    throw UnknownReferenceError("remote " + std::string(name));
  }
  Repository remote(it->second, tag_user(config_));
  if (create && !remote.is_initialized()) {
    remote.init();
  }
  return remote;
}

auto Context::active_runtime() const -> runtime::Runtime {
  if (!active_runtime_) {
    throw NoRuntimeError(std::string(consts::kEnvRuntime) + " is not set");
  }
  return runtimes_.read_runtime(*active_runtime_);
}

} // namespace strata

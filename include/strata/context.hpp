#pragma once
#include "strata/config.hpp"
#include "strata/repo.hpp"
#include "strata/runtime.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace strata {

/**
 * Everything one invocation works against, built once at process entry
 * and passed down explicitly. The active runtime id is captured from
 * STRATA_RUNTIME at construction time.
 */
class Context {
public:
  explicit Context(Config cfg);

  [[nodiscard]] const Config &config() const { return config_; }
  [[nodiscard]] const Repository &repo() const { return repo_; }
  [[nodiscard]] const runtime::Storage &runtimes() const { return runtimes_; }

  // Initialise the local repository if it does not exist yet.
  void ensure_repo() const;

  // Throws UnknownReferenceError for an unconfigured remote name. The
  // remote repository is only initialised when `create` is set.
  [[nodiscard]] auto remote(std::string_view name, bool create = false) const -> Repository;

  [[nodiscard]] const std::optional<std::string> &active_runtime_id() const {
    return active_runtime_;
  }
  // Throws NoRuntimeError when STRATA_RUNTIME was unset or names nothing.
  [[nodiscard]] auto active_runtime() const -> runtime::Runtime;

private:
  Config config_;
  Repository repo_;
  runtime::Storage runtimes_;
  std::optional<std::string> active_runtime_;
};

} // namespace strata

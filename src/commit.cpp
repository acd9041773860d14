#include "strata/commit.hpp"

#include "strata/error.hpp"

#include <spdlog/spdlog.h>

namespace strata {

auto commit_layer(const Repository &repo, const runtime::Runtime &rt) -> Digest {
  if (!rt.is_dirty()) {
    throw NothingToCommitError();
  }
  const auto manifest = repo.commit_dir(rt.upper_dir());
  const auto layer = repo.create_layer(manifest);
  spdlog::info("committed runtime {} as layer {}", rt.id(), to_base32(layer));
  return layer;
}

auto commit_platform(const Repository &repo, const runtime::Runtime &rt) -> Digest {
  const auto layer = commit_layer(repo, rt);
  auto stack = rt.stack();
  stack.push_back(layer);
  const auto platform = repo.create_platform(std::move(stack));
  spdlog::info("committed runtime {} as platform {}", rt.id(), to_base32(platform));
  return platform;
}

} // namespace strata

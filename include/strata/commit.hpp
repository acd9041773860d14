#pragma once
#include "strata/hash.hpp"
#include "strata/repo.hpp"
#include "strata/runtime.hpp"

namespace strata {

/**
 * Capture the runtime's upper directory as a new Layer and return its
 * digest. Throws NothingToCommitError if the runtime is clean. Neither the
 * runtime's stack nor any tag is changed.
 */
auto commit_layer(const Repository &repo, const runtime::Runtime &rt) -> Digest;

// commit_layer, then a Platform of [existing stack..., new layer].
auto commit_platform(const Repository &repo, const runtime::Runtime &rt) -> Digest;

} // namespace strata

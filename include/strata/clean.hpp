#pragma once
#include "strata/hash.hpp"
#include "strata/repo.hpp"
#include "strata/runtime.hpp"

#include <cstddef>
#include <set>

namespace strata {

// Everything reachable from any version of any tag, plus the stacks of
// the runtimes in `runtimes` (when given), following child references.
auto get_all_attached_objects(const Repository &repo, const runtime::Storage *runtimes = nullptr)
    -> std::set<Digest>;

auto get_all_unattached_objects(const Repository &repo,
                                const runtime::Storage *runtimes = nullptr) -> std::set<Digest>;

// Payloads no stored Blob object refers to.
auto get_all_unattached_payloads(const Repository &repo) -> std::set<Digest>;

struct CleanSummary {
  std::size_t objects = 0;
  std::size_t payloads = 0;
  std::size_t renders = 0;
};

/**
 * Remove unreachable objects, then the payloads and renders only they
 * referenced. The reachable set is computed in full before anything is
 * deleted. With `dry_run` the counts are reported and nothing is removed.
 */
auto clean_untagged_objects(const Repository &repo, const runtime::Storage *runtimes = nullptr,
                            bool dry_run = false) -> CleanSummary;

} // namespace strata

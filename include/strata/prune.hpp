#pragma once
#include "strata/tag_store.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace strata {

/**
 * Which tag versions may be dropped. Unset fields do not take part.
 * A version is prunable when every set "prune" condition holds and no set
 * "keep" condition holds. `rank` counts from the newest entry (0); the
 * newest entry of a stream is never prunable.
 */
struct PrunePolicy {
  std::optional<std::int64_t> prune_if_older_than;             // time < value
  std::optional<std::int64_t> keep_if_newer_than;              // time > value
  std::optional<std::uint64_t> prune_if_version_count_more_than; // rank > value
  std::optional<std::uint64_t> keep_if_version_count_less_than;  // rank < value

  [[nodiscard]] bool empty() const {
    return !prune_if_older_than && !keep_if_newer_than && !prune_if_version_count_more_than &&
           !keep_if_version_count_less_than;
  }
};

[[nodiscard]] bool is_prunable(const PrunePolicy &policy, const Tag &tag, std::size_t rank);

// Every prunable version across all streams, newest stream entries first.
[[nodiscard]] auto get_prunable_tags(const TagStore &tags, const PrunePolicy &policy)
    -> std::vector<Tag>;

// Remove what get_prunable_tags reports; returns the number removed.
auto prune_tags(const TagStore &tags, const PrunePolicy &policy) -> std::size_t;

} // namespace strata

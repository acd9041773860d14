#include "strata/prune.hpp"

#include <spdlog/spdlog.h>

namespace strata {

bool is_prunable(const PrunePolicy &policy, const Tag &tag, std::size_t rank) {
  if (rank == 0) {
    return false;
  }
  if (policy.keep_if_version_count_less_than && rank < *policy.keep_if_version_count_less_than) {
    return false;
  }
  if (policy.keep_if_newer_than && tag.time > *policy.keep_if_newer_than) {
    return false;
  }
  bool any_prune_rule = false;
  if (policy.prune_if_version_count_more_than) {
    any_prune_rule = true;
    if (rank <= *policy.prune_if_version_count_more_than) {
      return false;
    }
  }
  if (policy.prune_if_older_than) {
    any_prune_rule = true;
    if (tag.time >= *policy.prune_if_older_than) {
      return false;
    }
  }
  return any_prune_rule;
}

auto get_prunable_tags(const TagStore &tags, const PrunePolicy &policy) -> std::vector<Tag> {
  std::vector<Tag> out;
  for (const auto &path : tags.iter_tag_streams()) {
    const auto stream = tags.read_tag_stream(path);
    for (std::size_t rank = 0; rank < stream.size(); ++rank) {
      if (is_prunable(policy, stream[rank], rank)) {
        out.push_back(stream[rank]);
      }
    }
  }
  return out;
}

auto prune_tags(const TagStore &tags, const PrunePolicy &policy) -> std::size_t {
  const auto prunable = get_prunable_tags(tags, policy);
  for (const auto &tag : prunable) {
    spdlog::debug("pruning {}", tag.to_string());
    tags.remove_tag(tag);
  }
  spdlog::info("pruned {} tag versions", prunable.size());
  return prunable.size();
}

} // namespace strata

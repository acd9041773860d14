#include "strata/hash.hpp"
#include "strata/prune.hpp"
#include "strata/tag_store.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <random>
#include <string>
#include <vector>

namespace stdfs = std::filesystem;
using namespace strata;

static bool contains(const std::vector<Tag> &tags, const Digest &target, std::int64_t time) {
  return std::any_of(tags.begin(), tags.end(),
                     [&](const Tag &t) { return t.target == target && t.time == time; });
}

static Tag raw_tag(std::string path, const Digest &target, std::int64_t time) {
  Tag t;
  t.path = std::move(path);
  t.target = target;
  t.user = "tester@host";
  t.time = time;
  return t;
}

int main() {
  const stdfs::path root =
      stdfs::temp_directory_path() / ("strata_prune_test_" + std::to_string(std::random_device{}()));

  try {
    TagStore tags{root, "tester@host"};

    // age: old entries go unless something asks to keep them
    {
      (void)tags.push_raw_tag(raw_tag("testing/prune", kNullDigest, 10000));
      (void)tags.push_raw_tag(raw_tag("testing/prune", kEmptyDigest, 30000));

      PrunePolicy policy;
      policy.prune_if_older_than = 20000;
      auto prunable = get_prunable_tags(tags, policy);
      if (!contains(prunable, kNullDigest, 10000) || contains(prunable, kEmptyDigest, 30000)) {
        std::cerr << "age policy picked the wrong versions\n";
        return 1;
      }

      policy.keep_if_newer_than = 0;
      prunable = get_prunable_tags(tags, policy);
      if (!prunable.empty()) {
        std::cerr << "keep rules should win over prune rules\n";
        return 1;
      }
      tags.remove_tag_stream("testing/prune");
    }

    // version count: ranks above the limit go, unless kept
    {
      std::vector<Digest> targets;
      for (int i = 5; i >= 0; --i) {
        targets.push_back(sha256("v" + std::to_string(i)));
        (void)tags.push_raw_tag(raw_tag("testing/versioned", targets.back(), 1000 + (5 - i)));
      }
      // targets[k] now sits at rank 5 - k
      const auto rank_target = [&](int rank) { return targets[static_cast<std::size_t>(5 - rank)]; };
      const auto rank_time = [](int rank) { return static_cast<std::int64_t>(1000 + (5 - rank)); };

      PrunePolicy policy;
      policy.prune_if_version_count_more_than = 2;
      auto prunable = get_prunable_tags(tags, policy);
      for (int rank = 0; rank <= 5; ++rank) {
        const bool expected = rank > 2;
        if (contains(prunable, rank_target(rank), rank_time(rank)) != expected) {
          std::cerr << "count policy wrong at rank " << rank << "\n";
          return 1;
        }
      }

      policy.keep_if_version_count_less_than = 4;
      prunable = get_prunable_tags(tags, policy);
      for (int rank = 0; rank <= 5; ++rank) {
        const bool expected = rank > 3;
        if (contains(prunable, rank_target(rank), rank_time(rank)) != expected) {
          std::cerr << "count policy with keep rule wrong at rank " << rank << "\n";
          return 1;
        }
      }
      tags.remove_tag_stream("testing/versioned");
    }

    // invariants of the decision itself
    {
      Tag t = raw_tag("x", kNullDigest, 0);
      PrunePolicy everything;
      everything.prune_if_older_than = 1;
      if (is_prunable(everything, t, 0)) {
        std::cerr << "the newest version must never be prunable\n";
        return 1;
      }
      if (is_prunable(PrunePolicy{}, t, 7)) {
        std::cerr << "an empty policy must not prune\n";
        return 1;
      }
      // all set prune conditions must hold
      PrunePolicy both;
      both.prune_if_older_than = 100;
      both.prune_if_version_count_more_than = 5;
      if (is_prunable(both, t, 3) || !is_prunable(both, t, 6)) {
        std::cerr << "prune conditions should combine with AND\n";
        return 1;
      }
    }

    // pruning removes what was reported and leaves the newest entry
    {
      const std::int64_t jan1_2020 = 1577836800;
      const std::int64_t year = 365 * 24 * 3600;
      for (int i = 0; i < 6; ++i) {
        (void)tags.push_raw_tag(
            raw_tag("test/prune", sha256("year" + std::to_string(i)), jan1_2020 + i * year));
      }
      PrunePolicy policy;
      policy.prune_if_older_than = jan1_2020 + 5 * year;
      if (prune_tags(tags, policy) != 5) {
        std::cerr << "expected five versions pruned\n";
        return 1;
      }
      const auto left = tags.read_tag_stream("test/prune");
      if (left.size() != 1 || left.front().target != sha256("year5")) {
        std::cerr << "only the newest version should remain\n";
        return 1;
      }
    }

    stdfs::remove_all(root);
    std::cout << "OK\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "Exception: " << e.what() << "\n";
    return 1;
  }
}

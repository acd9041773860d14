#pragma once
#include "strata/manifest.hpp"

#include <optional>
#include <string>
#include <vector>

namespace strata::tracking {

enum class DiffMode { Unchanged, Changed, Added, Removed };

// One path-level difference between two manifests. `a` is the entry in the
// base manifest and `b` the entry in the top one; both carry no children.
struct Diff {
  DiffMode mode = DiffMode::Unchanged;
  std::string path;
  std::optional<Entry> a;
  std::optional<Entry> b;
};

/**
 * Compare two manifests path by path (depth-first, name order).
 *  - present only in b, or masked in b  -> Added / Removed
 *  - present only in a                  -> Removed
 *  - present in both with equal node    -> Unchanged
 *  - otherwise                          -> Changed
 * Children of added or removed trees are reported individually.
 */
std::vector<Diff> compute_diff(const Manifest &a, const Manifest &b);

// True when any diff is not Unchanged.
bool has_changes(const std::vector<Diff> &diffs);

// "+ path", "- path", "~ path {mode 100644 => 100755} {!content!}", "= path".
std::string to_string(const Diff &diff);

} // namespace strata::tracking

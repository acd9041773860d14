#pragma once
#include "strata/hash.hpp"
#include "strata/repo.hpp"

#include <cstddef>
#include <set>
#include <string_view>

namespace strata {

class Context;

struct SyncSummary {
  std::size_t objects_synced = 0;
  std::size_t objects_skipped = 0;
  std::size_t payloads_synced = 0;
  std::size_t tags_synced = 0;
};

/**
 * Copies objects and payloads from `src` to `dest`, children before
 * parents, so `dest` never holds a reference it cannot resolve. Anything
 * already present in `dest` is skipped, which makes an interrupted sync
 * safe to re-run.
 */
class Syncer {
public:
  Syncer(const Repository &src, const Repository &dest) : src_(src), dest_(dest) {}

  // Also copy the resolved tag entry when syncing a tag reference.
  Syncer &with_tags(bool enabled) {
    with_tags_ = enabled;
    return *this;
  }

  auto sync_ref(std::string_view ref) -> Digest;
  void sync_digest(const Digest &d);

  [[nodiscard]] const SyncSummary &summary() const { return summary_; }

private:
  void sync_blob(const graph::Blob &blob);
  void sync_payload(const Digest &payload);

  const Repository &src_;
  const Repository &dest_;
  bool with_tags_ = false;
  std::set<Digest> visited_;
  SyncSummary summary_;
};

// Sync `ref` from `src` into `dest` without tags; returns the resolved digest.
auto sync_ref(std::string_view ref, const Repository &src, const Repository &dest) -> Digest;

// Local repository -> named remote, tags included.
auto push_ref(const Context &ctx, std::string_view ref, std::string_view remote) -> SyncSummary;

// First configured remote that has `ref` -> local repository, tags included.
auto pull_ref(const Context &ctx, std::string_view ref) -> SyncSummary;

} // namespace strata

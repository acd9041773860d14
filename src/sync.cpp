#include "strata/sync.hpp"

#include "strata/context.hpp"
#include "strata/error.hpp"

#include <spdlog/spdlog.h>

namespace strata {

auto Syncer::sync_ref(std::string_view ref) -> Digest {
  const auto digest = src_.resolve_ref(ref);
  sync_digest(digest);
  if (with_tags_ && tracking::is_tag_spec(ref) && src_.tags().has_tag(ref)) {
    if (dest_.tags().push_raw_tag(src_.tags().resolve_tag(ref))) {
      ++summary_.tags_synced;
    }
  }
  return digest;
}

void Syncer::sync_digest(const Digest &d) {
  if (!visited_.insert(d).second) {
    return;
  }
  if (dest_.objects().has_object(d)) {
    ++summary_.objects_skipped;
    return;
  }
  const auto obj = src_.objects().read_object(d);
  spdlog::debug("syncing {} {}", graph::kind_name(graph::kind_of(obj)), to_base32(d));
  if (const auto *blob = std::get_if<graph::Blob>(&obj)) {
    sync_blob(*blob);
    return;
  }
  for (const auto &child : graph::child_objects(obj)) {
    sync_digest(child);
  }
  dest_.objects().write_object(obj);
  ++summary_.objects_synced;
}

void Syncer::sync_blob(const graph::Blob &blob) {
  sync_payload(blob.payload);
  dest_.objects().write_object(blob);
  ++summary_.objects_synced;
}

void Syncer::sync_payload(const Digest &payload) {
  if (dest_.payloads().has_payload(payload)) {
    return;
  }
  auto in = src_.payloads().open_payload(payload);
  const auto written = dest_.payloads().write_payload(in);
  if (written != payload) {
    throw Error("payload " + to_base32(payload) + " changed during sync");
  }
  ++summary_.payloads_synced;
}

auto sync_ref(std::string_view ref, const Repository &src, const Repository &dest) -> Digest {
  Syncer syncer(src, dest);
  return syncer.sync_ref(ref);
}

auto push_ref(const Context &ctx, std::string_view ref, std::string_view remote) -> SyncSummary {
  const auto dest = ctx.remote(remote, true);
  Syncer syncer(ctx.repo(), dest);
  syncer.with_tags(true).sync_ref(ref);
  spdlog::info("pushed {} to {}: {} objects, {} payloads", ref, remote,
               syncer.summary().objects_synced, syncer.summary().payloads_synced);
  return syncer.summary();
}

auto pull_ref(const Context &ctx, std::string_view ref) -> SyncSummary {
  for (const auto &[name, path] : ctx.config().remotes) {
    const auto src = ctx.remote(name);
    if (!src.is_initialized()) {
      spdlog::warn("remote {} has no repository at {}", name, path.string());
      continue;
    }
    if (!src.has_ref(ref)) {
      spdlog::debug("{} not found in remote {}", ref, name);
      continue;
    }
    Syncer syncer(src, ctx.repo());
    syncer.with_tags(true).sync_ref(ref);
    spdlog::info("pulled {} from {}: {} objects, {} payloads", ref, name,
                 syncer.summary().objects_synced, syncer.summary().payloads_synced);
    return syncer.summary();
  }
  throw UnknownReferenceError(std::string(ref) + " (not found in any remote)");
}

} // namespace strata

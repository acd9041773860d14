#include "strata/clean.hpp"

#include "strata/error.hpp"
#include "strata/render.hpp"

#include <spdlog/spdlog.h>
#include <vector>

namespace strata {

namespace {

void walk_reachable(const Repository &repo, const Digest &root, std::set<Digest> &seen) {
  std::vector<Digest> pending{root};
  while (!pending.empty()) {
    const auto d = pending.back();
    pending.pop_back();
    if (!seen.insert(d).second) {
      continue;
    }
    try {
      for (const auto &child : graph::child_objects(repo.objects().read_object(d))) {
        pending.push_back(child);
      }
    } catch (const UnknownObjectError &) {
      spdlog::warn("attached object {} is missing", to_base32(d));
    }
  }
}

} // namespace

auto get_all_attached_objects(const Repository &repo, const runtime::Storage *runtimes)
    -> std::set<Digest> {
  std::set<Digest> attached;
  for (const auto &path : repo.tags().iter_tag_streams()) {
    for (const auto &tag : repo.tags().read_tag_stream(path)) {
      walk_reachable(repo, tag.target, attached);
    }
  }
  if (runtimes) {
    for (const auto &rt : runtimes->list_runtimes()) {
      for (const auto &d : rt.stack()) {
        walk_reachable(repo, d, attached);
      }
    }
  }
  return attached;
}

auto get_all_unattached_objects(const Repository &repo, const runtime::Storage *runtimes)
    -> std::set<Digest> {
  const auto attached = get_all_attached_objects(repo, runtimes);
  std::set<Digest> out;
  for (const auto &d : repo.objects().iter_digests()) {
    if (!attached.count(d)) {
      out.insert(d);
    }
  }
  return out;
}

auto get_all_unattached_payloads(const Repository &repo) -> std::set<Digest> {
  std::set<Digest> referenced;
  for (const auto &d : repo.objects().iter_digests()) {
    const auto obj = repo.objects().read_object(d);
    if (const auto *blob = std::get_if<graph::Blob>(&obj)) {
      referenced.insert(blob->payload);
    }
  }
  std::set<Digest> out;
  for (const auto &d : repo.payloads().iter_digests()) {
    if (!referenced.count(d)) {
      out.insert(d);
    }
  }
  return out;
}

auto clean_untagged_objects(const Repository &repo, const runtime::Storage *runtimes,
                            bool dry_run) -> CleanSummary {
  spdlog::info("evaluating repository graph");
  const auto attached = get_all_attached_objects(repo, runtimes);

  std::set<Digest> doomed_objects;
  std::set<Digest> kept_payloads;
  for (const auto &d : repo.objects().iter_digests()) {
    if (!attached.count(d)) {
      doomed_objects.insert(d);
      continue;
    }
    const auto obj = repo.objects().read_object(d);
    if (const auto *blob = std::get_if<graph::Blob>(&obj)) {
      kept_payloads.insert(blob->payload);
    }
  }
  std::set<Digest> doomed_payloads;
  for (const auto &d : repo.payloads().iter_digests()) {
    if (!kept_payloads.count(d)) {
      doomed_payloads.insert(d);
    }
  }
  const Renderer renderer(repo);
  std::set<Digest> doomed_renders;
  for (const auto &d : renderer.iter_renders()) {
    if (!attached.count(d)) {
      doomed_renders.insert(d);
    }
  }

  CleanSummary summary{doomed_objects.size(), doomed_payloads.size(), doomed_renders.size()};
  if (dry_run) {
    return summary;
  }

  // objects first: a payload's only referrer is a Blob object
  for (const auto &d : doomed_objects) {
    try {
      repo.objects().remove_object(d);
    } catch (const UnknownObjectError &) {
      spdlog::debug("object {} already removed", to_base32(d));
    }
  }
  for (const auto &d : doomed_payloads) {
    try {
      repo.payloads().remove_payload(d);
    } catch (const UnknownObjectError &) {
      spdlog::debug("payload {} already removed", to_base32(d));
    }
  }
  for (const auto &d : doomed_renders) {
    renderer.remove_render(d);
  }
  spdlog::info("cleaned {} objects, {} payloads, {} renders", summary.objects, summary.payloads,
               summary.renders);
  return summary;
}

} // namespace strata

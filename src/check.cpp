#include "strata/check.hpp"

#include "strata/error.hpp"

#include <spdlog/spdlog.h>

namespace strata {

auto check_database_integrity(const Repository &repo) -> std::vector<IntegrityIssue> {
  std::vector<IntegrityIssue> issues;
  std::size_t checked = 0;
  for (const auto &d : repo.objects().iter_digests()) {
    ++checked;
    graph::Object obj;
    try {
      obj = repo.objects().read_object(d);
    } catch (const DecodeError &e) {
      issues.push_back({d, e.what()});
      continue;
    }
    const auto kind = graph::kind_name(graph::kind_of(obj));
    if (const auto *blob = std::get_if<graph::Blob>(&obj)) {
      if (!repo.payloads().has_payload(blob->payload)) {
        issues.push_back({d, "blob payload " + to_base32(blob->payload) + " is missing"});
      }
    }
    for (const auto &child : graph::child_objects(obj)) {
      if (!repo.objects().has_object(child)) {
        issues.push_back({d, std::string(kind) + " child " + to_base32(child) + " is missing"});
      }
    }
  }

  for (const auto &path : repo.tags().iter_tag_streams()) {
    for (const auto &tag : repo.tags().read_tag_stream(path)) {
      if (!repo.objects().has_object(tag.target)) {
        issues.push_back({tag.target, "target of tag " + tag.to_string() + " is missing"});
      }
    }
  }

  spdlog::info("checked {} objects, found {} issues", checked, issues.size());
  return issues;
}

} // namespace strata

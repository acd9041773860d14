#include "strata/repo.hpp"

#include "strata/error.hpp"
#include "strata/fs.hpp"

#include <fstream>
#include <set>
#include <spdlog/spdlog.h>
#include <sstream>

namespace stdfs = std::filesystem;
namespace sfs = strata::fs;

namespace {

constexpr int kMaxPlatformDepth = 64;

template <class T>
[[nodiscard]] auto expect_kind(strata::graph::Object obj, const strata::Digest &d) -> T {
  if (auto *v = std::get_if<T>(&obj)) {
    return std::move(*v);
  }
  throw strata::Error("object " + strata::to_base32(d) + " is a " +
                      std::string(strata::graph::kind_name(strata::graph::kind_of(obj))));
}

} // namespace

namespace strata {

Repository::Repository(stdfs::path root, std::string tag_user)
    : root_(std::move(root)), objects_(root_ / consts::kObjectsDir),
      payloads_(root_ / consts::kPayloadsDir), tags_(root_ / consts::kTagsDir, std::move(tag_user)) {}

auto Repository::is_initialized() const -> bool {
  return sfs::exists(root_ / consts::kVersionFile);
}

void Repository::init() const {
  if (is_initialized()) {
    throw Error("a strata repository already exists at: " + root_.string());
  }
  sfs::ensure_dir(objects_.root());
  sfs::ensure_dir(payloads_.root());
  sfs::ensure_dir(tags_.root());
  sfs::ensure_dir(renders_dir());
  sfs::write_text_atomic(root_ / consts::kVersionFile, std::string(consts::kRepoVersion) + "\n");
  spdlog::debug("initialized repository at {}", root_.string());
}

auto Repository::resolve_ref(std::string_view ref) const -> Digest {
  if (tracking::is_tag_spec(ref) && tags_.has_tag(ref)) {
    return tags_.resolve_tag(ref).target;
  }
  if (looks_partial_digest(ref)) {
    return objects_.resolve_full_digest(ref);
  }
  if (tracking::is_tag_spec(ref)) {
    throw UnknownReferenceError(std::string(ref));
  }
  throw InvalidReferenceError(std::string(ref));
}

auto Repository::read_ref(std::string_view ref) const -> graph::Object {
  return objects_.read_object(resolve_ref(ref));
}

auto Repository::has_ref(std::string_view ref) const -> bool {
  try {
    return objects_.has_object(resolve_ref(ref));
  } catch (const UnknownReferenceError &) {
    return false;
  } catch (const InvalidReferenceError &) {
    return false;
  }
}

auto Repository::commit_blob(std::istream &in) const -> Digest {
  std::uint64_t size = 0;
  const auto payload = payloads_.write_payload(in, &size);
  return objects_.write_object(graph::Blob{payload, size});
}

auto Repository::commit_blob(std::string_view bytes) const -> Digest {
  std::istringstream in{std::string(bytes)};
  return commit_blob(in);
}

auto Repository::commit_dir(const stdfs::path &path) const -> graph::Manifest {
  auto manifest = tracking::compute_manifest(path);
  std::set<Digest> done;
  for (const auto &node : manifest.walk()) {
    const auto &entry = *node.entry;
    if (!entry.has_payload() || done.count(entry.object)) {
      continue;
    }
    if (objects_.has_object(entry.object)) {
      done.insert(entry.object);
      continue;
    }
    const auto file = path / node.path;
    Digest blob{};
    if (entry.kind == tracking::EntryKind::Symlink) {
      blob = commit_blob(stdfs::read_symlink(file).string());
    } else {
      std::ifstream in(file, std::ios::binary);
      if (!in) {
        throw std::runtime_error("open for read failed: " + file.string());
      }
      blob = commit_blob(in);
    }
    if (blob != entry.object) {
      throw Error("file changed during commit: " + file.string());
    }
    done.insert(blob);
  }
  objects_.write_object(manifest);
  spdlog::debug("committed {} ({} blobs) as manifest {}", path.string(), done.size(),
                to_base32(manifest.digest()));
  return manifest;
}

auto Repository::create_layer(const graph::Manifest &manifest) const -> Digest {
  if (!objects_.has_object(manifest.digest())) {
    objects_.write_object(manifest);
  }
  return objects_.write_object(graph::Layer{manifest.digest()});
}

auto Repository::create_platform(std::vector<Digest> stack) const -> Digest {
  for (const auto &d : stack) {
    if (!objects_.has_object(d)) {
      throw UnknownObjectError(to_base32(d));
    }
  }
  return objects_.write_object(graph::Platform{std::move(stack)});
}

auto Repository::read_blob(const Digest &d) const -> graph::Blob {
  return expect_kind<graph::Blob>(objects_.read_object(d), d);
}

auto Repository::read_manifest(const Digest &d) const -> graph::Manifest {
  return expect_kind<graph::Manifest>(objects_.read_object(d), d);
}

auto Repository::read_layer(const Digest &d) const -> graph::Layer {
  return expect_kind<graph::Layer>(objects_.read_object(d), d);
}

auto Repository::read_platform(const Digest &d) const -> graph::Platform {
  return expect_kind<graph::Platform>(objects_.read_object(d), d);
}

auto Repository::find_aliases(std::string_view ref) const -> std::vector<std::string> {
  const auto digest = resolve_ref(ref);
  std::vector<std::string> out;
  for (auto &name : tags_.find_tags(digest)) {
    if (name != ref) {
      out.push_back(std::move(name));
    }
  }
  return out;
}

void Repository::flatten_into(const Digest &d, std::vector<Digest> &out, int depth) const {
  if (depth > kMaxPlatformDepth) {
    throw Error("platform nesting too deep at " + to_base32(d));
  }
  const auto obj = objects_.read_object(d);
  switch (graph::kind_of(obj)) {
  case graph::ObjectKind::Layer:
    out.push_back(d);
    break;
  case graph::ObjectKind::Platform:
    for (const auto &child : std::get<graph::Platform>(obj).stack) {
      flatten_into(child, out, depth + 1);
    }
    break;
  default:
    throw Error("cannot stack a " + std::string(graph::kind_name(graph::kind_of(obj))) + ": " +
                to_base32(d));
  }
}

auto Repository::resolve_stack_to_layers(const std::vector<Digest> &stack) const
    -> std::vector<Digest> {
  std::vector<Digest> out;
  for (const auto &d : stack) {
    flatten_into(d, out, 0);
  }
  return out;
}

auto Repository::compute_stack_manifest(const std::vector<Digest> &stack) const
    -> graph::Manifest {
  graph::Manifest merged;
  for (const auto &layer : resolve_stack_to_layers(stack)) {
    merged.update(read_manifest(read_layer(layer).manifest));
  }
  merged.finalize();
  return merged;
}

} // namespace strata

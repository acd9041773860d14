#pragma once
#include "strata/consts.hpp"
#include "strata/graph.hpp"
#include "strata/hash.hpp"
#include "strata/manifest.hpp"
#include "strata/object_store.hpp"
#include "strata/payload_store.hpp"
#include "strata/tag_store.hpp"

#include <filesystem>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

/**
 * One addressable repository: the object graph, payloads and tags stored
 * side by side under `root`. The stores live and die with the Repository.
 */
class Repository {
public:
  explicit Repository(std::filesystem::path root,
                      std::string tag_user = tracking::default_tag_user());

  [[nodiscard]] const std::filesystem::path &root() const { return root_; }
  [[nodiscard]] auto renders_dir() const -> std::filesystem::path {
    return root_ / consts::kRendersDir;
  }

  [[nodiscard]] const ObjectStore &objects() const { return objects_; }
  [[nodiscard]] const PayloadStore &payloads() const { return payloads_; }
  [[nodiscard]] const TagStore &tags() const { return tags_; }

  // Create the directory layout. Throws if a repository already exists.
  void init() const;
  [[nodiscard]] auto is_initialized() const -> bool;

  // Tag spec first, then a full or partial digest.
  [[nodiscard]] auto resolve_ref(std::string_view ref) const -> Digest;
  [[nodiscard]] auto read_ref(std::string_view ref) const -> graph::Object;
  [[nodiscard]] auto has_ref(std::string_view ref) const -> bool;

  // Store raw content plus the Blob object describing it; returns the Blob digest.
  auto commit_blob(std::istream &in) const -> Digest;
  auto commit_blob(std::string_view bytes) const -> Digest;

  /**
   * Snapshot `path`, store every file and symlink payload with its Blob
   * object, then the Manifest object. Nothing references a partially
   * written commit: the manifest is written last.
   */
  auto commit_dir(const std::filesystem::path &path) const -> graph::Manifest;

  auto create_layer(const graph::Manifest &manifest) const -> Digest;
  auto create_platform(std::vector<Digest> stack) const -> Digest;

  // Typed reads; throw Error when the object is of another kind.
  [[nodiscard]] auto read_blob(const Digest &d) const -> graph::Blob;
  [[nodiscard]] auto read_manifest(const Digest &d) const -> graph::Manifest;
  [[nodiscard]] auto read_layer(const Digest &d) const -> graph::Layer;
  [[nodiscard]] auto read_platform(const Digest &d) const -> graph::Platform;

  // Every tag path whose latest version points at whatever `ref` resolves to.
  [[nodiscard]] auto find_aliases(std::string_view ref) const -> std::vector<std::string>;

  // Flatten platforms into their layers, bottom first.
  [[nodiscard]] auto resolve_stack_to_layers(const std::vector<Digest> &stack) const
      -> std::vector<Digest>;

  // Merged view of a stack of layers/platforms, computed without mounting.
  [[nodiscard]] auto compute_stack_manifest(const std::vector<Digest> &stack) const
      -> graph::Manifest;

private:
  void flatten_into(const Digest &d, std::vector<Digest> &out, int depth) const;

  std::filesystem::path root_;
  ObjectStore objects_;
  PayloadStore payloads_;
  TagStore tags_;
};

} // namespace strata

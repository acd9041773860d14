#pragma once
#include "strata/fanout.hpp"
#include "strata/graph.hpp"
#include "strata/hash.hpp"

#include <filesystem>

namespace strata {

class Repository;

/**
 * Materialises manifests on disk under `<repo>/renders/AB/CDEF...` so they
 * can serve as overlay lower directories. Renders are built in a temp
 * directory and published with a rename; an existing render is reused.
 */
class Renderer {
public:
  explicit Renderer(const Repository &repo);

  [[nodiscard]] auto render_path(const Digest &manifest) const -> std::filesystem::path {
    return dir_.path_for(manifest);
  }
  [[nodiscard]] bool has_render(const Digest &manifest) const { return dir_.contains(manifest); }

  // Throws UnknownObjectError if a payload is missing and Error if a whiteout
  // cannot be created (mknod needs CAP_MKNOD); nothing is published then.
  auto render_manifest(const graph::Manifest &manifest) const -> std::filesystem::path;

  void remove_render(const Digest &manifest) const;

  [[nodiscard]] auto iter_renders() const -> DigestRange { return dir_.iter(); }

private:
  const Repository &repo_;
  FanoutDir dir_;
};

} // namespace strata

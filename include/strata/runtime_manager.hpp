#pragma once
#include "strata/hash.hpp"
#include "strata/mount.hpp"
#include "strata/render.hpp"
#include "strata/runtime.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace strata {

class Repository;

namespace runtime {

/**
 * Keeps a runtime's live view in step with its status: every change to the
 * stack or to editability is followed by a remount through the Mounter.
 */
class RuntimeManager {
public:
  RuntimeManager(const Repository &repo, Mounter &mounter, std::filesystem::path mount_point,
                 std::size_t max_layers);

  // Allocate a runtime in `storage` and mount its (empty) view.
  auto create_runtime(const Storage &storage, std::optional<std::string> name = std::nullopt)
      -> Runtime;

  // Render every layer of the stack (platforms flattened), bottom first.
  [[nodiscard]] auto render_lower_dirs(const Runtime &rt) const
      -> std::vector<std::filesystem::path>;
  [[nodiscard]] auto render_lower_dirs(const Runtime &rt, const std::vector<Digest> &stack) const
      -> std::vector<std::filesystem::path>;

  void mount(Runtime &rt);
  void unmount(Runtime &rt);
  void remount(Runtime &rt);

  // The digest must name a stored layer or platform. If the new view cannot
  // be rendered or mounted the runtime keeps its previous status and view.
  void push_digest(Runtime &rt, const Digest &d);
  // Replace the whole stack, e.g. with a single platform.
  void set_stack(Runtime &rt, std::vector<Digest> stack);
  void set_editable(Runtime &rt, bool editable);
  void reset(Runtime &rt, const std::vector<std::string> &paths = {});

private:
  auto make_request(const Runtime &rt, const Status &status) const -> MountRequest;
  auto resolve_layers(const Runtime &rt, const std::vector<Digest> &stack) const
      -> std::vector<Digest>;
  void apply_status(Runtime &rt, Status next);

  const Repository &repo_;
  Renderer renderer_;
  Mounter &mounter_;
  std::filesystem::path mount_point_;
  std::size_t max_layers_;
};

} // namespace runtime
} // namespace strata

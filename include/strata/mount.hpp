#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace strata::runtime {

struct MountRequest {
  std::vector<std::filesystem::path> lower_dirs; // bottom first
  std::filesystem::path upper_dir;
  std::filesystem::path work_dir;
  std::filesystem::path target;
  bool editable = false;
};

struct MountHandle {
  std::filesystem::path target;
};

// The only place that touches OS mount state. Failures throw MountError.
class Mounter {
public:
  virtual ~Mounter() = default;
  virtual auto mount(const MountRequest &request) -> MountHandle = 0;
  virtual void unmount(const MountHandle &handle) = 0;
};

// "lowerdir=<top>:...:<bottom>,upperdir=...,workdir=...", prefixed "ro," unless editable.
auto overlay_options(const MountRequest &request) -> std::string;

// mount(2) of type "overlay"; needs CAP_SYS_ADMIN in the mount namespace.
class OverlayMounter : public Mounter {
public:
  auto mount(const MountRequest &request) -> MountHandle override;
  // Lazy (MNT_DETACH) so open handles do not block a remount.
  void unmount(const MountHandle &handle) override;
};

/**
 * Unprivileged stand-in: "mounting" copies every lower directory and then
 * the upper directory into the target, applying whiteouts, so the merged
 * view can be inspected without overlayfs.
 */
class DirectoryMounter : public Mounter {
public:
  auto mount(const MountRequest &request) -> MountHandle override;
  void unmount(const MountHandle &handle) override;

  [[nodiscard]] std::size_t mount_count() const { return mounts_; }
  [[nodiscard]] std::size_t unmount_count() const { return unmounts_; }
  [[nodiscard]] const std::optional<MountRequest> &last_request() const { return last_; }

private:
  std::size_t mounts_ = 0;
  std::size_t unmounts_ = 0;
  std::optional<MountRequest> last_;
};

} // namespace strata::runtime

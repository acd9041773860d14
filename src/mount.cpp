#include "strata/mount.hpp"

#include "strata/error.hpp"
#include "strata/fs.hpp"
#include "strata/manifest.hpp"

#include <cerrno>
#include <cstring>
#include <spdlog/spdlog.h>
#include <sys/mount.h>
#include <sys/stat.h>
#include <unistd.h>

namespace stdfs = std::filesystem;
namespace sfs = strata::fs;

namespace strata::runtime {

namespace {

// Overlay one directory onto `dst`: whiteouts delete, directories merge,
// everything else replaces.
void overlay_copy(const stdfs::path &src, const stdfs::path &dst) {
  for (const auto &entry : stdfs::directory_iterator(src)) {
    const auto from = entry.path();
    const auto to = dst / from.filename();
    struct stat st {};
    if (::lstat(from.c_str(), &st) != 0) {
      throw MountError("lstat " + from.string() + ": " + std::strerror(errno));
    }
    if (tracking::is_removed_entry(st.st_mode, st.st_rdev)) {
      sfs::remove_tree(to);
      continue;
    }
    std::error_code ec;
    const auto existing = stdfs::symlink_status(to, ec);
    if (S_ISDIR(st.st_mode)) {
      if (stdfs::exists(existing) && !stdfs::is_directory(existing)) {
        sfs::remove_tree(to);
      }
      sfs::ensure_dir(to);
      overlay_copy(from, to);
      continue;
    }
    if (stdfs::exists(existing)) {
      sfs::remove_tree(to);
    }
    stdfs::copy(from, to, stdfs::copy_options::copy_symlinks, ec);
    if (ec) {
      throw MountError("copy " + from.string() + " -> " + to.string() + ": " + ec.message());
    }
  }
}

} // namespace

auto overlay_options(const MountRequest &request) -> std::string {
  std::string lower;
  for (auto it = request.lower_dirs.rbegin(); it != request.lower_dirs.rend(); ++it) {
    if (!lower.empty()) {
      lower += ':';
    }
    lower += it->string();
  }
  std::string opts = "lowerdir=" + lower + ",upperdir=" + request.upper_dir.string() +
                     ",workdir=" + request.work_dir.string();
  if (!request.editable) {
    opts = "ro," + opts;
  }
  return opts;
}

auto OverlayMounter::mount(const MountRequest &request) -> MountHandle {
  if (request.lower_dirs.empty()) {
    throw MountError("overlay needs at least one lower directory");
  }
  const auto opts = overlay_options(request);
  const long page = ::sysconf(_SC_PAGESIZE);
  if (page > 0 && static_cast<long>(opts.size()) > page - 1) {
    throw MountError("mount options exceed the kernel limit; lower max_layers");
  }
  spdlog::debug("mount -t overlay -o {} none {}", opts, request.target.string());
  const unsigned long flags = request.editable ? 0UL : MS_RDONLY;
  if (::mount("none", request.target.c_str(), "overlay", flags, opts.c_str()) != 0) {
    throw MountError("overlay on " + request.target.string() + ": " + std::strerror(errno));
  }
  return MountHandle{request.target};
}

void OverlayMounter::unmount(const MountHandle &handle) {
  spdlog::debug("unmounting {}", handle.target.string());
  if (::umount2(handle.target.c_str(), MNT_DETACH) != 0) {
    throw MountError("unmount " + handle.target.string() + ": " + std::strerror(errno));
  }
}

auto DirectoryMounter::mount(const MountRequest &request) -> MountHandle {
  sfs::remove_tree(request.target);
  sfs::ensure_dir(request.target);
  for (const auto &lower : request.lower_dirs) {
    overlay_copy(lower, request.target);
  }
  if (sfs::exists(request.upper_dir)) {
    overlay_copy(request.upper_dir, request.target);
  }
  ++mounts_;
  last_ = request;
  return MountHandle{request.target};
}

void DirectoryMounter::unmount(const MountHandle &handle) {
  sfs::remove_tree(handle.target);
  ++unmounts_;
}

} // namespace strata::runtime

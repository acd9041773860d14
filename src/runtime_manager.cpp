#include "strata/runtime_manager.hpp"

#include "strata/error.hpp"
#include "strata/fs.hpp"
#include "strata/repo.hpp"

#include <spdlog/spdlog.h>
#include <utility>

namespace sfs = strata::fs;

namespace strata::runtime {

RuntimeManager::RuntimeManager(const Repository &repo, Mounter &mounter,
                               std::filesystem::path mount_point, std::size_t max_layers)
    : repo_(repo), renderer_(repo), mounter_(mounter), mount_point_(std::move(mount_point)),
      max_layers_(max_layers) {}

auto RuntimeManager::create_runtime(const Storage &storage, std::optional<std::string> name)
    -> Runtime {
  auto rt = storage.create_runtime(std::move(name));
  try {
    mount(rt);
  } catch (const MountError &) {
    storage.remove_runtime(rt.id());
    throw;
  }
  return rt;
}

auto RuntimeManager::resolve_layers(const Runtime &rt, const std::vector<Digest> &stack) const
    -> std::vector<Digest> {
  const auto layers = repo_.resolve_stack_to_layers(stack);
  if (layers.size() > max_layers_) {
    throw Error("runtime " + rt.id() + " stacks " + std::to_string(layers.size()) +
                " layers, more than max_layers (" + std::to_string(max_layers_) + ")");
  }
  return layers;
}

auto RuntimeManager::render_lower_dirs(const Runtime &rt) const
    -> std::vector<std::filesystem::path> {
  return render_lower_dirs(rt, rt.stack());
}

auto RuntimeManager::render_lower_dirs(const Runtime &rt, const std::vector<Digest> &stack) const
    -> std::vector<std::filesystem::path> {
  const auto layers = resolve_layers(rt, stack);
  std::vector<std::filesystem::path> out;
  out.reserve(layers.size() + 1);
  // overlayfs needs at least one lower directory
  const auto base = rt.root() / "lower";
  sfs::ensure_dir(base);
  out.push_back(base);
  for (const auto &layer : layers) {
    const auto manifest = repo_.read_manifest(repo_.read_layer(layer).manifest);
    out.push_back(renderer_.render_manifest(manifest));
  }
  return out;
}

auto RuntimeManager::make_request(const Runtime &rt, const Status &status) const
    -> MountRequest {
  MountRequest req;
  req.lower_dirs = render_lower_dirs(rt, status.stack);
  req.upper_dir = rt.upper_dir();
  req.work_dir = rt.work_dir();
  req.target = mount_point_;
  req.editable = status.editable;
  return req;
}

void RuntimeManager::mount(Runtime &rt) {
  const auto req = make_request(rt, rt.status());
  sfs::ensure_dir(req.upper_dir);
  sfs::ensure_dir(req.work_dir);
  mounter_.mount(req);
  rt.set_mounted(true);
  spdlog::debug("mounted runtime {} ({} layers) at {}", rt.id(), req.lower_dirs.size() - 1,
                mount_point_.string());
}

void RuntimeManager::unmount(Runtime &rt) {
  if (!rt.is_mounted()) {
    return;
  }
  mounter_.unmount(MountHandle{mount_point_});
  rt.set_mounted(false);
}

void RuntimeManager::remount(Runtime &rt) {
  unmount(rt);
  mount(rt);
}

void RuntimeManager::apply_status(Runtime &rt, Status next) {
  if (!rt.is_mounted()) {
    (void)resolve_layers(rt, next.stack);
    rt.set_status(std::move(next));
    return;
  }
  // everything that can fail short of mount(2) happens before the old view goes away
  const auto req = make_request(rt, next);
  auto previous = rt.status();
  unmount(rt);
  next.mounted = false;
  rt.set_status(std::move(next));
  try {
    sfs::ensure_dir(req.upper_dir);
    sfs::ensure_dir(req.work_dir);
    mounter_.mount(req);
    rt.set_mounted(true);
  } catch (const std::exception &e) {
    spdlog::warn("runtime {}: mount failed, restoring previous view: {}", rt.id(), e.what());
    previous.mounted = false;
    rt.set_status(std::move(previous));
    try {
      mount(rt);
    } catch (const std::exception &restore) {
      spdlog::error("runtime {}: previous view could not be restored: {}", rt.id(),
                    restore.what());
    }
    throw;
  }
}

void RuntimeManager::push_digest(Runtime &rt, const Digest &d) {
  auto next = rt.status();
  next.stack.push_back(d);
  apply_status(rt, std::move(next));
}

void RuntimeManager::set_stack(Runtime &rt, std::vector<Digest> stack) {
  auto next = rt.status();
  next.stack = std::move(stack);
  apply_status(rt, std::move(next));
}

void RuntimeManager::set_editable(Runtime &rt, bool editable) {
  auto next = rt.status();
  next.editable = editable;
  apply_status(rt, std::move(next));
}

void RuntimeManager::reset(Runtime &rt, const std::vector<std::string> &paths) {
  rt.reset(paths);
  if (rt.is_mounted()) {
    remount(rt);
  }
}

} // namespace strata::runtime

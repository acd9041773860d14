#include "strata/commit.hpp"
#include "strata/error.hpp"
#include "strata/graph.hpp"
#include "strata/mount.hpp"
#include "strata/repo.hpp"
#include "strata/runtime.hpp"
#include "strata/runtime_manager.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

namespace stdfs = std::filesystem;
using namespace strata;

static void write_file(const stdfs::path &p, std::string_view s) {
  stdfs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

// Fails the next mount once when armed, otherwise behaves like DirectoryMounter.
class FlakyMounter : public runtime::DirectoryMounter {
public:
  bool fail_next = false;

  auto mount(const runtime::MountRequest &request) -> runtime::MountHandle override {
    if (fail_next) {
      fail_next = false;
      throw MountError("refused");
    }
    return runtime::DirectoryMounter::mount(request);
  }
};

int main() {
  const stdfs::path base =
      stdfs::temp_directory_path() / ("strata_runtime_test_" + std::to_string(std::random_device{}()));

  try {
    Repository repo{base / "repo", "tester@host"};
    repo.init();
    runtime::Storage storage{base / "runtimes"};
    runtime::DirectoryMounter mounter;
    runtime::RuntimeManager mgr(repo, mounter, base / "mnt", 40);

    auto rt = mgr.create_runtime(storage, std::string("test"));
    if (!rt.is_mounted() || mounter.mount_count() != 1 || rt.id() != "test") {
      std::cerr << "create_runtime should mount the new runtime\n";
      return 1;
    }
    try {
      (void)storage.create_runtime(std::string("test"));
      std::cerr << "duplicate runtime name accepted\n";
      return 1;
    } catch (const RuntimeExistsError &) {
    }

    const auto empty_layer = repo.create_layer(graph::Manifest{});
    mgr.push_digest(rt, empty_layer);
    if (rt.stack().size() != 1 || mounter.mount_count() != 2 || mounter.unmount_count() != 1) {
      std::cerr << "push_digest should remount\n";
      return 1;
    }
    if (rt.is_dirty()) {
      std::cerr << "fresh runtime should be clean\n";
      return 1;
    }
    try {
      (void)commit_layer(repo, rt);
      std::cerr << "committing a clean runtime should fail\n";
      return 1;
    } catch (const NothingToCommitError &) {
    }

    // edit, commit, reset
    write_file(rt.upper_dir() / "file.txt", "data");
    if (!rt.is_dirty()) {
      std::cerr << "runtime with a new file should be dirty\n";
      return 1;
    }
    const auto layer = commit_layer(repo, rt);
    if (!repo.read_manifest(repo.read_layer(layer).manifest).get_path("file.txt")) {
      std::cerr << "committed layer missing file.txt\n";
      return 1;
    }
    if (rt.stack().size() != 1) {
      std::cerr << "commit_layer must not touch the stack\n";
      return 1;
    }
    mgr.reset(rt);
    if (rt.is_dirty()) {
      std::cerr << "reset should leave the runtime clean\n";
      return 1;
    }
    mgr.push_digest(rt, layer);
    if (!stdfs::exists(base / "mnt" / "file.txt")) {
      std::cerr << "pushed layer not visible in the mounted view\n";
      return 1;
    }
    const auto &req = mounter.last_request();
    if (!req || req->lower_dirs.size() != 3 || req->editable) {
      std::cerr << "mount request should carry the base dir plus two renders\n";
      return 1;
    }

    // a platform commit stacks on top of the current stack
    write_file(rt.upper_dir() / "more.txt", "more");
    const auto platform = commit_platform(repo, rt);
    const auto p = repo.read_platform(platform);
    if (p.stack.size() != 3 || p.stack[0] != empty_layer || p.stack[1] != layer) {
      std::cerr << "platform stack wrong\n";
      return 1;
    }

    // partial reset
    write_file(rt.upper_dir() / "a" / "b.txt", "b");
    write_file(rt.upper_dir() / "c.txt", "c");
    mgr.reset(rt, {"/a"});
    if (stdfs::exists(rt.upper_dir() / "a") || !stdfs::exists(rt.upper_dir() / "c.txt")) {
      std::cerr << "reset of /a touched the wrong paths\n";
      return 1;
    }
    try {
      rt.reset({"../escape"});
      std::cerr << "reset outside the runtime accepted\n";
      return 1;
    } catch (const Error &) {
    }

    mgr.set_editable(rt, true);
    if (!mounter.last_request()->editable || !rt.is_editable()) {
      std::cerr << "set_editable should remount writable\n";
      return 1;
    }

    // state persists in the status file
    const auto again = storage.read_runtime("test");
    if (again.stack() != rt.stack() || !again.is_editable() || !again.is_mounted()) {
      std::cerr << "runtime status did not persist\n";
      return 1;
    }
    if (storage.list_runtimes().size() != 1) {
      std::cerr << "list_runtimes wrong\n";
      return 1;
    }

    // too many layers for one mount
    {
      runtime::DirectoryMounter small_mounter;
      runtime::RuntimeManager small(repo, small_mounter, base / "mnt2", 1);
      try {
        (void)small.render_lower_dirs(rt);
        std::cerr << "max_layers not enforced\n";
        return 1;
      } catch (const Error &) {
      }
    }

    // a rejected change leaves the status file and the mounted view as they were
    {
      FlakyMounter flaky;
      runtime::RuntimeManager limited(repo, flaky, base / "mnt3", 1);
      auto small_rt = limited.create_runtime(storage, std::string("limited"));
      limited.push_digest(small_rt, layer);
      try {
        limited.push_digest(small_rt, empty_layer);
        std::cerr << "push beyond max_layers accepted\n";
        return 1;
      } catch (const Error &) {
      }
      auto saved = storage.read_runtime("limited");
      if (small_rt.stack().size() != 1 || saved.stack().size() != 1 || !saved.is_mounted() ||
          !stdfs::exists(base / "mnt3" / "file.txt")) {
        std::cerr << "over-limit push changed the runtime or dropped its view\n";
        return 1;
      }

      flaky.fail_next = true;
      try {
        limited.set_editable(small_rt, true);
        std::cerr << "failed mount not reported\n";
        return 1;
      } catch (const MountError &) {
      }
      saved = storage.read_runtime("limited");
      if (small_rt.is_editable() || saved.is_editable() || !saved.is_mounted() ||
          saved.stack() != small_rt.stack() || !stdfs::exists(base / "mnt3" / "file.txt")) {
        std::cerr << "failed remount did not restore the previous view\n";
        return 1;
      }
      if (flaky.last_request()->editable) {
        std::cerr << "restored view should still be read-only\n";
        return 1;
      }
      limited.unmount(small_rt);
      storage.remove_runtime("limited");
    }

    // clearing the stack keeps the runtime writable
    rt.reset_stack();
    if (!rt.stack().empty() || !rt.is_editable() || !storage.read_runtime("test").is_editable()) {
      std::cerr << "reset_stack should only clear the stack\n";
      return 1;
    }
    mgr.set_stack(rt, {platform});
    if (rt.stack().size() != 1 || !rt.is_editable() || !mounter.last_request()->editable ||
        !stdfs::exists(base / "mnt" / "file.txt")) {
      std::cerr << "set_stack should remount the platform and keep editability\n";
      return 1;
    }

    // overlay option string, top layer first
    {
      runtime::MountRequest r;
      r.lower_dirs = {"/l/bottom", "/l/top"};
      r.upper_dir = "/u";
      r.work_dir = "/w";
      if (runtime::overlay_options(r) != "ro,lowerdir=/l/top:/l/bottom,upperdir=/u,workdir=/w") {
        std::cerr << "overlay options wrong: " << runtime::overlay_options(r) << "\n";
        return 1;
      }
      r.editable = true;
      if (runtime::overlay_options(r).rfind("lowerdir=", 0) != 0) {
        std::cerr << "editable mounts should not be read-only\n";
        return 1;
      }
    }

    mgr.unmount(rt);
    storage.remove_runtime("test");
    try {
      (void)storage.read_runtime("test");
      std::cerr << "removed runtime still readable\n";
      return 1;
    } catch (const NoRuntimeError &) {
    }

    stdfs::remove_all(base);
    std::cout << "OK\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "Exception: " << e.what() << "\n";
    return 1;
  }
}

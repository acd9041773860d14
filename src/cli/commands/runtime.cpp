#include "cli/common.hpp"
#include "strata/env_spec.hpp"
#include "strata/mount.hpp"
#include "strata/runtime_manager.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

void print_usage() {
  std::cerr << "usage: strata runtime <subcommand>\n"
               "  create [--name NAME] [--no-mount] [REF+REF...]\n"
               "  ls\n"
               "  rm ID\n"
               "  push REF+REF... [--runtime ID]\n"
               "  edit [--off] [--runtime ID]\n"
               "  reset [PATH...] [--runtime ID]\n"
               "  status [--runtime ID]\n";
}

// Split "--runtime ID" out of the remaining arguments.
std::vector<std::string> take_runtime_flag(int argc, char **argv, std::string &runtime_id) {
  std::vector<std::string> rest;
  for (int i = 2; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--runtime" && i + 1 < argc) {
      runtime_id = argv[++i];
    } else {
      rest.push_back(a);
    }
  }
  return rest;
}

strata::runtime::RuntimeManager make_manager(const strata::Context &ctx,
                                             strata::runtime::Mounter &mounter) {
  return strata::runtime::RuntimeManager(ctx.repo(), mounter, ctx.config().mount_point,
                                         ctx.config().max_layers);
}

void print_status(const strata::runtime::Runtime &rt) {
  std::cout << "runtime:  " << rt.id() << "\n";
  std::cout << "editable: " << (rt.is_editable() ? "yes" : "no") << "\n";
  std::cout << "mounted:  " << (rt.is_mounted() ? "yes" : "no") << "\n";
  std::cout << "dirty:    " << (rt.is_dirty() ? "yes" : "no") << "\n";
  std::cout << "stack (bottom first):\n";
  for (const auto &d : rt.stack()) {
    std::cout << "  " << strata::to_base32(d) << "\n";
  }
}

int runtime_create(const strata::Context &ctx, int argc, char **argv) {
  std::optional<std::string> name;
  bool do_mount = true;
  std::optional<std::string> spec;
  for (int i = 2; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--name" && i + 1 < argc) {
      name = argv[++i];
    } else if (a == "--no-mount") {
      do_mount = false;
    } else if (!spec) {
      spec = a;
    } else {
      print_usage();
      return 2;
    }
  }

  strata::runtime::OverlayMounter mounter;
  auto mgr = make_manager(ctx, mounter);
  auto rt = ctx.runtimes().create_runtime(name);
  try {
    if (spec) {
      for (const auto &item : strata::tracking::parse_env_spec(*spec).items) {
        rt.push_digest(ctx.repo().resolve_ref(item));
      }
      (void)ctx.repo().resolve_stack_to_layers(rt.stack());
    }
    if (do_mount) {
      mgr.mount(rt);
    }
  } catch (const std::exception &) {
    ctx.runtimes().remove_runtime(rt.id());
    throw;
  }
  std::cout << rt.id() << "\n";
  return 0;
}

int runtime_ls(const strata::Context &ctx) {
  for (const auto &rt : ctx.runtimes().list_runtimes()) {
    std::cout << rt.id() << "\t" << rt.stack().size() << " layers"
              << (rt.is_editable() ? "\teditable" : "") << (rt.is_mounted() ? "\tmounted" : "")
              << "\n";
  }
  return 0;
}

int runtime_rm(const strata::Context &ctx, int argc, char **argv) {
  if (argc != 3) {
    print_usage();
    return 2;
  }
  auto rt = ctx.runtimes().read_runtime(argv[2]);
  if (rt.is_mounted()) {
    strata::runtime::OverlayMounter mounter;
    make_manager(ctx, mounter).unmount(rt);
  }
  ctx.runtimes().remove_runtime(rt.id());
  std::cout << "removed runtime " << rt.id() << "\n";
  return 0;
}

} // namespace

int cmd_runtime(const strata::cli::Options &opts, int argc, char **argv) {
  if (argc < 2) {
    print_usage();
    return 2;
  }
  const std::string sub = argv[1];
  try {
    const auto ctx = strata::cli::make_context(opts);
    if (sub == "create") {
      return runtime_create(ctx, argc, argv);
    }
    if (sub == "ls") {
      return runtime_ls(ctx);
    }
    if (sub == "rm") {
      return runtime_rm(ctx, argc, argv);
    }

    std::string runtime_id;
    const auto rest = take_runtime_flag(argc, argv, runtime_id);
    strata::runtime::OverlayMounter mounter;
    auto mgr = make_manager(ctx, mounter);

    if (sub == "push") {
      if (rest.size() != 1) {
        print_usage();
        return 2;
      }
      auto rt = strata::cli::pick_runtime(ctx, runtime_id);
      for (const auto &item : strata::tracking::parse_env_spec(rest.front()).items) {
        mgr.push_digest(rt, ctx.repo().resolve_ref(item));
      }
      print_status(rt);
      return 0;
    }
    if (sub == "edit") {
      const bool off = rest.size() == 1 && rest.front() == "--off";
      if (!rest.empty() && !off) {
        print_usage();
        return 2;
      }
      auto rt = strata::cli::pick_runtime(ctx, runtime_id);
      mgr.set_editable(rt, !off);
      std::cout << "runtime " << rt.id() << " is " << (off ? "read-only" : "editable") << "\n";
      return 0;
    }
    if (sub == "reset") {
      auto rt = strata::cli::pick_runtime(ctx, runtime_id);
      mgr.reset(rt, rest);
      return 0;
    }
    if (sub == "status") {
      print_status(strata::cli::pick_runtime(ctx, runtime_id));
      return 0;
    }
    std::cerr << "runtime: unknown subcommand '" << sub << "'\n";
    print_usage();
    return 2;
  } catch (const std::exception &e) {
    return strata::cli::report("runtime", e);
  }
}

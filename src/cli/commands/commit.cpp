#include "cli/common.hpp"
#include "strata/commit.hpp"
#include "strata/mount.hpp"
#include "strata/runtime_manager.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

int cmd_commit(const strata::cli::Options &opts, int argc, char **argv) {
  // strata commit [--path DIR] [--kind layer|platform] [-t TAG]... [--runtime ID]
  std::optional<std::filesystem::path> path;
  std::string kind = "layer";
  std::string runtime_id;
  std::vector<std::string> tags;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--path" && i + 1 < argc) {
      path = argv[++i];
    } else if (a == "--kind" && i + 1 < argc) {
      kind = argv[++i];
    } else if ((a == "-t" || a == "--tag") && i + 1 < argc) {
      tags.emplace_back(argv[++i]);
    } else if (a == "--runtime" && i + 1 < argc) {
      runtime_id = argv[++i];
    } else {
      std::cerr << "usage: strata commit [--path DIR] [--kind layer|platform] [-t TAG]...\n";
      return 2;
    }
  }
  if (kind != "layer" && kind != "platform") {
    std::cerr << "commit: --kind must be 'layer' or 'platform'\n";
    return 2;
  }

  try {
    const auto ctx = strata::cli::make_context(opts);
    const auto &repo = ctx.repo();
    strata::Digest digest{};

    if (path) {
      const auto manifest = repo.commit_dir(*path);
      digest = repo.create_layer(manifest);
      if (kind == "platform") {
        digest = repo.create_platform({digest});
      }
    } else {
      auto rt = strata::cli::pick_runtime(ctx, runtime_id);
      digest = kind == "platform" ? strata::commit_platform(repo, rt)
                                  : strata::commit_layer(repo, rt);

      // the committed changes now live in the stack instead of upper/
      strata::runtime::OverlayMounter mounter;
      strata::runtime::RuntimeManager mgr(repo, mounter, ctx.config().mount_point,
                                          ctx.config().max_layers);
      rt.reset();
      if (kind == "platform") {
        mgr.set_stack(rt, {digest});
      } else {
        mgr.push_digest(rt, digest);
      }
    }

    for (const auto &tag : tags) {
      const auto t = repo.tags().push_tag(tag, digest);
      std::cout << "tagged " << t.to_string() << "\n";
    }
    std::cout << strata::to_base32(digest) << "\n";
    return 0;
  } catch (const std::exception &e) {
    return strata::cli::report("commit", e);
  }
}

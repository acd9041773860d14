#include "strata/clean.hpp"
#include "strata/graph.hpp"
#include "strata/hash.hpp"
#include "strata/render.hpp"
#include "strata/repo.hpp"
#include "strata/runtime.hpp"

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

int main() {
  const stdfs::path base =
      stdfs::temp_directory_path() / ("strata_clean_test_" + std::to_string(std::random_device{}()));

  try {
    Repository repo{base / "repo", "tester@host"};
    repo.init();
    runtime::Storage runtimes{base / "runtimes"};

    write_file(base / "kept" / "k.txt", "kept");
    const auto kept_manifest = repo.commit_dir(base / "kept");
    const auto kept = repo.create_layer(kept_manifest);
    (void)repo.tags().push_tag("keep/me", kept);

    // an older tag version still protects its target
    write_file(base / "old" / "o.txt", "old");
    const auto old = repo.create_layer(repo.commit_dir(base / "old"));
    (void)repo.tags().push_tag("keep/history", old);
    (void)repo.tags().push_tag("keep/history", kept);

    // referenced only by a runtime stack
    write_file(base / "live" / "l.txt", "live");
    const auto live = repo.create_layer(repo.commit_dir(base / "live"));
    auto rt = runtimes.create_runtime(std::string("rt"));
    rt.push_digest(live);

    // nothing points at this one
    write_file(base / "junk" / "j.txt", "junk");
    const auto junk_manifest = repo.commit_dir(base / "junk");
    const auto junk = repo.create_layer(junk_manifest);
    const Renderer renderer(repo);
    (void)renderer.render_manifest(junk_manifest);
    (void)renderer.render_manifest(kept_manifest);
    const auto stray_payload = repo.payloads().write_payload(std::string_view("stray"));

    const auto unattached = get_all_unattached_objects(repo, &runtimes);
    if (unattached.size() != 3 || !unattached.count(junk) || !unattached.count(junk_manifest.digest())) {
      std::cerr << "expected the junk layer, manifest and blob to be unattached, got "
                << unattached.size() << "\n";
      return 1;
    }
    if (get_all_unattached_payloads(repo).count(stray_payload) != 1) {
      std::cerr << "stray payload should be unattached\n";
      return 1;
    }

    const auto dry = clean_untagged_objects(repo, &runtimes, true);
    if (dry.objects != 3 || dry.payloads != 2 || dry.renders != 1 ||
        !repo.objects().has_object(junk)) {
      std::cerr << "dry run wrong or removed something\n";
      return 1;
    }

    const auto done = clean_untagged_objects(repo, &runtimes);
    if (done.objects != 3 || done.payloads != 2 || done.renders != 1) {
      std::cerr << "clean removed " << done.objects << "/" << done.payloads << "/"
                << done.renders << "\n";
      return 1;
    }
    if (repo.objects().has_object(junk) || repo.payloads().has_payload(sha256("junk")) ||
        renderer.has_render(junk_manifest.digest())) {
      std::cerr << "junk survived the clean\n";
      return 1;
    }
    // everything reachable is still there
    for (const auto &d : {kept, old, live}) {
      if (!repo.objects().has_object(d)) {
        std::cerr << "attached layer removed\n";
        return 1;
      }
    }
    for (const char *content : {"kept", "old", "live"}) {
      if (!repo.payloads().has_payload(sha256(content))) {
        std::cerr << "attached payload removed: " << content << "\n";
        return 1;
      }
    }
    if (!renderer.has_render(kept_manifest.digest())) {
      std::cerr << "attached render removed\n";
      return 1;
    }

    // a layer referenced only by a tagged platform stays; an untagged platform goes
    write_file(base / "plat" / "p.txt", "plat");
    const auto plat_manifest = repo.commit_dir(base / "plat");
    const auto plat_layer = repo.create_layer(plat_manifest);
    (void)repo.tags().push_tag("keep/platform", repo.create_platform({plat_layer}));
    const auto stale = repo.create_platform({plat_layer, kept});
    const auto second = clean_untagged_objects(repo, &runtimes);
    if (second.objects != 1 || second.payloads != 0 || repo.objects().has_object(stale)) {
      std::cerr << "only the untagged platform should be collected, removed " << second.objects
                << "\n";
      return 1;
    }
    if (!repo.objects().has_object(plat_layer) || !repo.objects().has_object(plat_manifest.digest()) ||
        !repo.payloads().has_payload(sha256("plat"))) {
      std::cerr << "platform-held layer was collected\n";
      return 1;
    }

    // without the runtime storage, the live layer is collectable
    if (!get_all_unattached_objects(repo).count(live)) {
      std::cerr << "runtime stacks should only count when runtimes are given\n";
      return 1;
    }

    stdfs::remove_all(base);
    std::cout << "OK\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "Exception: " << e.what() << "\n";
    return 1;
  }
}

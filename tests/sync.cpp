#include "strata/check.hpp"
#include "strata/config.hpp"
#include "strata/context.hpp"
#include "strata/error.hpp"
#include "strata/graph.hpp"
#include "strata/hash.hpp"
#include "strata/repo.hpp"
#include "strata/sync.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <vector>

namespace stdfs = std::filesystem;
using namespace strata;

static void write_file(const stdfs::path &p, std::string_view s) {
  stdfs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

int main() {
  const stdfs::path base =
      stdfs::temp_directory_path() / ("strata_sync_test_" + std::to_string(std::random_device{}()));

  try {
    Repository src{base / "src", "tester@host"};
    Repository dest{base / "dest", "tester@host"};
    src.init();
    dest.init();

    write_file(base / "work" / "dir" / "f.txt", "payload");
    const auto manifest = src.commit_dir(base / "work");
    const auto layer = src.create_layer(manifest);
    (void)src.tags().push_tag("v1", layer);
    const auto blob = graph::blob_digest(sha256("payload"), 7);

    // a plain sync copies the graph but not the tag
    if (sync_ref("v1", src, dest) != layer) {
      std::cerr << "sync_ref returned the wrong digest\n";
      return 1;
    }
    if (dest.tags().has_tag("v1")) {
      std::cerr << "sync_ref should not copy tags\n";
      return 1;
    }
    if (!dest.objects().has_object(layer) || !dest.objects().has_object(manifest.digest()) ||
        !dest.objects().has_object(blob) || !dest.payloads().has_payload(sha256("payload"))) {
      std::cerr << "dest is missing part of the synced graph\n";
      return 1;
    }

    // a second pass finds everything in place
    {
      Syncer syncer(src, dest);
      syncer.with_tags(true).sync_ref("v1");
      if (syncer.summary().objects_synced != 0 || syncer.summary().objects_skipped != 1 ||
          syncer.summary().tags_synced != 1) {
        std::cerr << "resync should only copy the tag\n";
        return 1;
      }
      if (dest.tags().resolve_tag("v1").target != layer) {
        std::cerr << "tag not copied\n";
        return 1;
      }
    }

    // a platform sync picks up where an interrupted one stopped
    {
      write_file(base / "work2" / "g.txt", "second");
      const auto layer2 = src.create_layer(src.commit_dir(base / "work2"));
      const auto platform = src.create_platform({layer, layer2});
      const auto blob2 = graph::blob_digest(sha256("second"), 6);

      Repository partial{base / "partial", "tester@host"};
      partial.init();
      (void)partial.payloads().write_payload(std::string_view("second"));
      (void)partial.objects().write_object(src.read_blob(blob2));

      Syncer syncer(src, partial);
      syncer.sync_digest(platform);
      const auto &summary = syncer.summary();
      if (summary.objects_synced != 6 || summary.objects_skipped != 1 ||
          summary.payloads_synced != 1) {
        std::cerr << "resumed sync copied " << summary.objects_synced << " objects, "
                  << summary.payloads_synced << " payloads\n";
        return 1;
      }
      if (!partial.objects().has_object(platform) || !partial.objects().has_object(layer2) ||
          partial.resolve_stack_to_layers({platform}) != std::vector<Digest>{layer, layer2}) {
        std::cerr << "platform not usable after the resumed sync\n";
        return 1;
      }
      if (!check_database_integrity(partial).empty()) {
        std::cerr << "resumed sync left dangling references\n";
        return 1;
      }
    }

    // push and pull through a context with a configured remote
    Config cfg;
    cfg.storage_root = base / "local";
    cfg.runtime_root = base / "runtimes";
    cfg.mount_point = base / "mnt";
    cfg.max_layers = 8;
    cfg.user = "tester";
    cfg.host = "host";
    cfg.remotes["origin"] = base / "src";
    cfg.remotes["archive"] = base / "archive";
    const Context ctx(cfg);
    ctx.ensure_repo();

    const auto pulled = pull_ref(ctx, "v1");
    if (pulled.objects_synced != 3 || pulled.payloads_synced != 1 || pulled.tags_synced != 1) {
      std::cerr << "pull copied " << pulled.objects_synced << " objects, expected 3\n";
      return 1;
    }
    if (ctx.repo().resolve_ref("v1") != layer) {
      std::cerr << "pulled tag does not resolve locally\n";
      return 1;
    }
    if (stdfs::exists(base / "archive")) {
      std::cerr << "pull created a repository at an unused remote path\n";
      return 1;
    }
    try {
      (void)pull_ref(ctx, "missing/tag");
      std::cerr << "pulling an unknown ref succeeded\n";
      return 1;
    } catch (const UnknownReferenceError &) {
    }

    (void)ctx.repo().tags().push_tag("local/only", layer);
    (void)push_ref(ctx, "local/only", "origin");
    if (src.tags().resolve_tag("local/only").target != layer) {
      std::cerr << "pushed tag missing from the remote\n";
      return 1;
    }
    (void)push_ref(ctx, "v1", "archive");
    if (ctx.remote("archive").resolve_ref("v1") != layer) {
      std::cerr << "push should initialise a new remote repository\n";
      return 1;
    }
    try {
      (void)push_ref(ctx, "v1", "nowhere");
      std::cerr << "push to an unknown remote succeeded\n";
      return 1;
    } catch (const UnknownReferenceError &) {
    }

    stdfs::remove_all(base);
    std::cout << "OK\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "Exception: " << e.what() << "\n";
    return 1;
  }
}

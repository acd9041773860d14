#include "strata/error.hpp"
#include "strata/graph.hpp"
#include "strata/hash.hpp"
#include "strata/repo.hpp"

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
      stdfs::temp_directory_path() / ("strata_repo_test_" + std::to_string(std::random_device{}()));
  const stdfs::path work = base / "work";

  try {
    Repository repo{base / "repo", "tester@host"};
    if (repo.is_initialized()) {
      std::cerr << "repo unexpectedly initialized before init()\n";
      return 1;
    }
    repo.init();
    for (const char *dir : {"objects", "payloads", "tags", "renders"}) {
      if (!stdfs::is_directory(repo.root() / dir)) {
        std::cerr << dir << "/ missing\n";
        return 1;
      }
    }
    try {
      repo.init();
      std::cerr << "second init should fail\n";
      return 1;
    } catch (const Error &) {
    }

    // commit a directory and tag the layer
    write_file(work / "a.txt", "hello");
    const auto manifest = repo.commit_dir(work);
    const auto layer = repo.create_layer(manifest);
    (void)repo.tags().push_tag("v1", layer);

    const auto obj = repo.read_ref("v1");
    const auto *l = std::get_if<graph::Layer>(&obj);
    if (!l) {
      std::cerr << "v1 should resolve to a layer\n";
      return 1;
    }
    const auto m = repo.read_manifest(l->manifest);
    const auto *a = m.get_path("a.txt");
    const auto expected_blob = graph::blob_digest(sha256("hello"), 5);
    if (!a || a->object != expected_blob || a->size != 5) {
      std::cerr << "a.txt entry does not describe the hello payload\n";
      return 1;
    }
    const auto blob = repo.read_blob(expected_blob);
    if (blob.payload != sha256("hello") || !repo.payloads().has_payload(blob.payload)) {
      std::cerr << "payload for a.txt not stored\n";
      return 1;
    }

    // committing the same content again is a no-op
    if (repo.create_layer(repo.commit_dir(work)) != layer) {
      std::cerr << "identical commit produced a different layer\n";
      return 1;
    }

    // typed reads reject other kinds
    try {
      (void)repo.read_platform(layer);
      std::cerr << "read a layer as a platform\n";
      return 1;
    } catch (const Error &) {
    }

    // reference resolution
    const auto text = to_base32(layer);
    if (repo.resolve_ref(text.substr(0, 10)) != layer || repo.resolve_ref(text) != layer) {
      std::cerr << "digest refs did not resolve\n";
      return 1;
    }
    if (!repo.has_ref("v1") || repo.has_ref("v2") || repo.has_ref("not a ref!")) {
      std::cerr << "has_ref wrong\n";
      return 1;
    }
    try {
      (void)repo.resolve_ref("nope/missing");
      std::cerr << "unknown tag resolved\n";
      return 1;
    } catch (const UnknownReferenceError &) {
    }
    try {
      (void)repo.resolve_ref("bad ref!");
      std::cerr << "invalid ref resolved\n";
      return 1;
    } catch (const InvalidReferenceError &) {
    }

    (void)repo.tags().push_tag("alias/one", layer);
    const auto aliases = repo.find_aliases("v1");
    if (aliases != std::vector<std::string>{"alias/one"}) {
      std::cerr << "find_aliases wrong\n";
      return 1;
    }

    // a second layer that edits a.txt and adds b.txt, stacked in a platform
    graph::Manifest upper;
    upper.mknod("a.txt", tracking::compute_entry(work / "a.txt"));
    write_file(base / "b.txt", "world");
    auto b_entry = tracking::compute_entry(base / "b.txt");
    upper.mknod("b.txt", b_entry);
    upper.finalize();
    std::ifstream bin(base / "b.txt", std::ios::binary);
    if (repo.commit_blob(bin) != b_entry.object) {
      std::cerr << "commit_blob digest mismatch\n";
      return 1;
    }
    const auto top = repo.create_layer(upper);
    const auto platform = repo.create_platform({layer, top});
    const auto nested = repo.create_platform({platform});

    const auto layers = repo.resolve_stack_to_layers({nested});
    if (layers != std::vector<Digest>{layer, top}) {
      std::cerr << "nested platform did not flatten bottom first\n";
      return 1;
    }
    const auto merged = repo.compute_stack_manifest({nested});
    if (!merged.get_path("a.txt") || !merged.get_path("b.txt")) {
      std::cerr << "stack manifest missing entries\n";
      return 1;
    }
    try {
      (void)repo.create_platform({sha256("missing")});
      std::cerr << "platform over a missing object created\n";
      return 1;
    } catch (const UnknownObjectError &) {
    }
    try {
      (void)repo.resolve_stack_to_layers({expected_blob});
      std::cerr << "a blob should not be stackable\n";
      return 1;
    } catch (const Error &) {
    }

    stdfs::remove_all(base);
    std::cout << "OK\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "Exception: " << e.what() << "\n";
    return 1;
  }
}

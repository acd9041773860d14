#include "strata/error.hpp"
#include "strata/hash.hpp"
#include "strata/tag.hpp"
#include "strata/tag_store.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <random>
#include <string>

namespace stdfs = std::filesystem;
using namespace strata;

int main() {
  const stdfs::path root =
      stdfs::temp_directory_path() / ("strata_tags_test_" + std::to_string(std::random_device{}()));

  try {
    // reference grammar
    {
      const auto spec = tracking::parse_tag_spec("org/sub/name~3");
      if (spec.org != "org/sub" || spec.name != "name" || spec.version != 3 ||
          spec.path() != "org/sub/name" || spec.to_string() != "org/sub/name~3") {
        std::cerr << "tag spec parsed wrong\n";
        return 1;
      }
      for (const char *bad : {"", "a b", "org/", "name~x", "~1", "a//b"}) {
        if (tracking::is_tag_spec(bad)) {
          std::cerr << "accepted bad tag spec '" << bad << "'\n";
          return 1;
        }
      }
      try {
        (void)tracking::parse_tag_spec("no spaces");
        std::cerr << "parse_tag_spec accepted a space\n";
        return 1;
      } catch (const InvalidReferenceError &) {
      }
    }

    TagStore tags{root, "tester@host"};
    const Digest d0 = sha256("zero");
    const Digest d1 = sha256("one");
    const Digest d2 = sha256("two");

    const auto t0 = tags.push_tag("team/app", d0);
    const auto t1 = tags.push_tag("team/app", d1);
    const auto t2 = tags.push_tag("team/app", d2);
    if (t0.version != 0 || t1.version != 1 || t2.version != 2) {
      std::cerr << "versions should count up from 0\n";
      return 1;
    }
    if (t0.parent != kNullDigest || t1.parent != t0.digest() || t2.parent != t1.digest()) {
      std::cerr << "parent chain broken\n";
      return 1;
    }
    if (t2.user != "tester@host" || t2.to_string() != "team/app~2") {
      std::cerr << "tag fields wrong\n";
      return 1;
    }

    // ~k counts back from the newest entry
    if (tags.resolve_tag("team/app").target != d2 || tags.resolve_tag("team/app~1").target != d1 ||
        tags.resolve_tag("team/app~2").target != d0) {
      std::cerr << "offset resolution wrong\n";
      return 1;
    }
    try {
      (void)tags.resolve_tag("team/app~3");
      std::cerr << "offset past the stream resolved\n";
      return 1;
    } catch (const UnknownReferenceError &) {
    }
    try {
      (void)tags.resolve_tag("team/missing");
      std::cerr << "unknown stream resolved\n";
      return 1;
    } catch (const UnknownReferenceError &) {
    }

    const auto stream = tags.read_tag_stream("team/app");
    if (stream.size() != 3 || stream.front() != t2 || stream.back() != t0) {
      std::cerr << "stream should be newest first\n";
      return 1;
    }

    (void)tags.push_tag("top", d1);
    (void)tags.push_tag("team/other", d2);
    const auto listing = tags.ls_tags();
    if (listing != std::vector<std::string>{"team/", "top"}) {
      std::cerr << "ls_tags at the root wrong\n";
      return 1;
    }
    if (tags.ls_tags("team") != std::vector<std::string>{"app", "other"}) {
      std::cerr << "ls_tags in a directory wrong\n";
      return 1;
    }
    // only the latest version of a stream counts
    if (tags.find_tags(d2) != std::vector<std::string>{"team/app", "team/other"} ||
        !tags.find_tags(d0).empty()) {
      std::cerr << "find_tags wrong\n";
      return 1;
    }
    std::vector<std::string> streams(tags.iter_tag_streams().begin(), tags.iter_tag_streams().end());
    std::sort(streams.begin(), streams.end());
    if (streams != std::vector<std::string>{"team/app", "team/other", "top"}) {
      std::cerr << "iter_tag_streams wrong\n";
      return 1;
    }

    // raw tags keep their time and target; duplicates are skipped
    Tag raw;
    raw.path = "team/app";
    raw.target = d0;
    raw.user = "other@elsewhere";
    raw.time = 12345;
    if (!tags.push_raw_tag(raw) || tags.push_raw_tag(raw)) {
      std::cerr << "push_raw_tag should append once\n";
      return 1;
    }
    const auto latest = tags.resolve_tag("team/app");
    if (latest.version != 3 || latest.parent != t2.digest() || latest.time != 12345 ||
        latest.user != "other@elsewhere") {
      std::cerr << "raw tag not renumbered onto the stream\n";
      return 1;
    }

    tags.remove_tag(t1);
    if (tags.read_tag_stream("team/app").size() != 3) {
      std::cerr << "remove_tag did not drop a version\n";
      return 1;
    }
    tags.remove_tag_stream("team/other");
    tags.remove_tag_stream("team/app");
    if (tags.has_tag("team/app") || stdfs::exists(root / "team")) {
      std::cerr << "removed streams left files behind\n";
      return 1;
    }
    try {
      tags.remove_tag_stream("team/app");
      std::cerr << "removing a missing stream should fail\n";
      return 1;
    } catch (const UnknownReferenceError &) {
    }

    stdfs::remove_all(root);
    std::cout << "OK\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "Exception: " << e.what() << "\n";
    return 1;
  }
}

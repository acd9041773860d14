#include "strata/consts.hpp"
#include "strata/encoding.hpp"
#include "strata/error.hpp"
#include "strata/fs.hpp"
#include "strata/graph.hpp"
#include "strata/object_store.hpp"

#include <cctype>
#include <filesystem>
#include <iostream>
#include <map>
#include <random>
#include <string>
#include <vector>

namespace stdfs = std::filesystem;
using namespace strata;

static bool decode_fails(const encoding::Bytes &bytes) {
  try {
    (void)graph::decode(bytes);
    return false;
  } catch (const DecodeError &) {
    return true;
  }
}

int main() {
  const stdfs::path root =
      stdfs::temp_directory_path() / ("strata_objects_test_" + std::to_string(std::random_device{}()));

  try {
    // malformed encodings
    {
      const auto good = graph::encode(graph::Layer{kEmptyDigest});
      if (graph::kind_of(graph::decode(good)) != graph::ObjectKind::Layer) {
        std::cerr << "layer did not decode as a layer\n";
        return 1;
      }
      auto truncated = good;
      truncated.resize(truncated.size() - 3);
      auto trailing = good;
      trailing.push_back(0);
      auto bad_header = good;
      bad_header[2] = 'X';
      encoding::Bytes bad_kind;
      encoding::write_header(bad_kind, consts::kObjectHeader);
      encoding::write_uint(bad_kind, 9);
      if (!decode_fails(truncated) || !decode_fails(trailing) || !decode_fails(bad_header) ||
          !decode_fails(bad_kind)) {
        std::cerr << "malformed object decoded\n";
        return 1;
      }
    }

    ObjectStore store{root};

    // write/read and idempotence
    const graph::Object platform = graph::Platform{{kEmptyDigest, kNullDigest}};
    const auto d = store.write_object(platform);
    if (store.write_object(platform) != d || !store.has_object(d)) {
      std::cerr << "write_object not idempotent\n";
      return 1;
    }
    const auto back = store.read_object(d);
    const auto *p = std::get_if<graph::Platform>(&back);
    if (!p || p->stack.size() != 2 || p->stack[0] != kEmptyDigest) {
      std::cerr << "platform did not read back\n";
      return 1;
    }
    if (!stdfs::exists(root / to_base32(d).substr(0, 2) / to_base32(d).substr(2))) {
      std::cerr << "object not stored under its fanout path\n";
      return 1;
    }

    // corrupt contents are detected
    {
      const auto victim = store.write_object(graph::Layer{kNullDigest});
      const std::vector<std::uint8_t> junk{1, 2, 3, 4};
      strata::fs::write_file_atomic(store.path_for(victim), junk);
      try {
        (void)store.read_object(victim);
        std::cerr << "corrupt object read without error\n";
        return 1;
      } catch (const DecodeError &) {
      }
      store.remove_object(victim);
    }

    // prefix resolution: unique, unknown and ambiguous
    std::map<char, std::vector<Digest>> by_first;
    for (std::uint64_t i = 0; i < 40; ++i) {
      const auto digest = store.write_object(graph::Blob{kEmptyDigest, i});
      by_first[to_base32(digest)[0]].push_back(digest);
    }
    const auto full = to_base32(d);
    if (store.resolve_full_digest(full.substr(0, 20)) != d ||
        store.resolve_full_digest(full) != d) {
      std::cerr << "prefix did not resolve\n";
      return 1;
    }
    std::string lower = full.substr(0, 12);
    for (auto &c : lower) {
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (store.resolve_full_digest(lower) != d) {
      std::cerr << "prefix lookup should ignore case\n";
      return 1;
    }
    bool saw_ambiguous = false;
    for (const auto &[c, digests] : by_first) {
      if (digests.size() < 2) {
        continue;
      }
      try {
        (void)store.resolve_full_digest(std::string(1, c));
      } catch (const AmbiguousReferenceError &) {
        saw_ambiguous = true;
      }
      break;
    }
    if (!saw_ambiguous) {
      std::cerr << "shared prefix did not report ambiguity\n";
      return 1;
    }
    try {
      (void)store.read_object(kNullDigest);
      std::cerr << "unknown object read\n";
      return 1;
    } catch (const UnknownObjectError &) {
    }
    try {
      (void)store.resolve_full_digest("!!");
      std::cerr << "invalid prefix accepted\n";
      return 1;
    } catch (const InvalidReferenceError &) {
    }

    std::size_t count = 0;
    for (const auto &digest : store.iter_digests()) {
      (void)digest;
      ++count;
    }
    if (count != 41) {
      std::cerr << "iter_digests saw " << count << " objects, expected 41\n";
      return 1;
    }

    stdfs::remove_all(root);
    std::cout << "OK\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "Exception: " << e.what() << "\n";
    return 1;
  }
}

#include "strata/error.hpp"
#include "strata/hash.hpp"
#include "strata/payload_store.hpp"

#include <filesystem>
#include <iostream>
#include <iterator>
#include <random>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

static std::string slurp(std::ifstream in) {
  return std::string{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("strata_payloads_test_" + std::to_string(std::random_device{}()));

  try {
    strata::PayloadStore store{root};

    // larger than one hashing chunk
    std::string big;
    for (int i = 0; i < 5000; ++i) {
      big += "line " + std::to_string(i) + "\n";
    }
    std::istringstream in(big);
    std::uint64_t size = 0;
    const auto d = store.write_payload(in, &size);
    if (d != strata::sha256(big) || size != big.size()) {
      std::cerr << "payload digest/size mismatch\n";
      return 1;
    }
    if (slurp(store.open_payload(d)) != big) {
      std::cerr << "payload content mismatch\n";
      return 1;
    }

    // same content again: same digest, still one file
    if (store.write_payload(big) != d) {
      std::cerr << "rewrite changed digest\n";
      return 1;
    }
    const auto empty = store.write_payload(std::string_view{});
    if (empty != strata::kEmptyDigest) {
      std::cerr << "empty payload should hash to kEmptyDigest\n";
      return 1;
    }

    std::size_t stored = 0;
    for (const auto &digest : store.iter_digests()) {
      (void)digest;
      ++stored;
    }
    if (stored != 2) {
      std::cerr << "expected 2 payloads, found " << stored << "\n";
      return 1;
    }
    // no temp files left behind next to the fanout directories
    for (const auto &entry : fs::directory_iterator(root)) {
      if (!entry.is_directory()) {
        std::cerr << "stray file " << entry.path() << "\n";
        return 1;
      }
    }

    store.remove_payload(d);
    if (store.has_payload(d)) {
      std::cerr << "payload still present after remove\n";
      return 1;
    }
    try {
      (void)store.open_payload(d);
      std::cerr << "opened a removed payload\n";
      return 1;
    } catch (const strata::UnknownObjectError &) {
    }

    fs::remove_all(root);
    std::cout << "OK\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "Exception: " << e.what() << "\n";
    return 1;
  }
}

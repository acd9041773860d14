#pragma once
#include "strata/fanout.hpp"
#include "strata/hash.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <string_view>

namespace strata {

// Raw blob contents, stored uncompressed under `root/AB/CDEF...`.
class PayloadStore {
public:
  explicit PayloadStore(std::filesystem::path root) : dir_(std::move(root)) {}

  [[nodiscard]] const std::filesystem::path &root() const { return dir_.root(); }
  [[nodiscard]] auto path_for(const Digest &d) const -> std::filesystem::path {
    return dir_.path_for(d);
  }

  /**
   * Stream `in` to a temp file in fixed-size chunks while hashing, then
   * publish it under its digest. Content already present is not rewritten.
   * `size` receives the byte count when non-null.
   */
  auto write_payload(std::istream &in, std::uint64_t *size = nullptr) const -> Digest;
  auto write_payload(std::string_view bytes, std::uint64_t *size = nullptr) const -> Digest;

  // Throws UnknownObjectError if missing.
  [[nodiscard]] auto open_payload(const Digest &d) const -> std::ifstream;

  [[nodiscard]] bool has_payload(const Digest &d) const { return dir_.contains(d); }

  // Throws UnknownObjectError if missing.
  void remove_payload(const Digest &d) const;

  [[nodiscard]] auto iter_digests() const -> DigestRange { return dir_.iter(); }

private:
  FanoutDir dir_;
};

} // namespace strata

#pragma once
#include "strata/fanout.hpp"
#include "strata/graph.hpp"
#include "strata/hash.hpp"

#include <filesystem>
#include <string_view>
#include <vector>

namespace strata {

// zlib-compressed, encoded graph objects under `root/AB/CDEF...`.
class ObjectStore {
public:
  explicit ObjectStore(std::filesystem::path root) : dir_(std::move(root)) {}

  [[nodiscard]] const std::filesystem::path &root() const { return dir_.root(); }
  [[nodiscard]] auto path_for(const Digest &d) const -> std::filesystem::path {
    return dir_.path_for(d);
  }

  // Idempotent; the object becomes visible only once fully written.
  auto write_object(const graph::Object &obj) const -> Digest;

  // Throws UnknownObjectError if absent, DecodeError if corrupt.
  [[nodiscard]] auto read_object(const Digest &d) const -> graph::Object;

  [[nodiscard]] bool has_object(const Digest &d) const { return dir_.contains(d); }

  // Throws UnknownObjectError if absent.
  void remove_object(const Digest &d) const;

  [[nodiscard]] auto iter_digests() const -> DigestRange { return dir_.iter(); }
  [[nodiscard]] auto find_digests(std::string_view prefix) const -> std::vector<Digest> {
    return dir_.find(prefix);
  }
  [[nodiscard]] auto resolve_full_digest(std::string_view partial) const -> Digest {
    return dir_.resolve(partial);
  }

private:
  FanoutDir dir_;
};

} // namespace strata

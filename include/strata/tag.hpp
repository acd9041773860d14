#pragma once
#include "strata/encoding.hpp"
#include "strata/hash.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace strata::tracking {

/**
 * Parsed tag reference: `[org/]name[~N]`.
 * `version` counts back from the latest entry of the stream (0 = latest).
 */
struct TagSpec {
  std::string org;  // may contain '/'; empty for top-level tags
  std::string name;
  std::uint64_t version = 0;

  // "org/name" (or "name"), the stream this spec selects from.
  [[nodiscard]] auto path() const -> std::string;
  [[nodiscard]] auto to_string() const -> std::string;
};

// Throws InvalidReferenceError on malformed input.
auto parse_tag_spec(std::string_view text) -> TagSpec;

// Non-throwing variant for "is this a tag or a digest?" probes.
bool is_tag_spec(std::string_view text);

// One entry in a tag stream.
struct Tag {
  std::string path;            // "org/name"
  std::uint64_t version = 0;   // 0 for the first push, strictly increasing
  Digest target = kNullDigest;
  Digest parent = kNullDigest; // digest of the previous entry in the stream
  std::string user;            // "name@host"
  std::int64_t time = 0;       // unix seconds

  [[nodiscard]] auto digest() const -> Digest;
  // "org/name~<version>" of this exact entry.
  [[nodiscard]] auto to_string() const -> std::string;

  friend bool operator==(const Tag &a, const Tag &b) = default;
};

void encode_tag(encoding::Bytes &out, const Tag &tag);
auto decode_tag(encoding::Reader &r) -> Tag;

// "$USER@hostname"
auto default_tag_user() -> std::string;

} // namespace strata::tracking

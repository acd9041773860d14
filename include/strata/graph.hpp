#pragma once
#include "strata/encoding.hpp"
#include "strata/hash.hpp"
#include "strata/manifest.hpp"

#include <cstdint>
#include <span>
#include <string_view>
#include <variant>
#include <vector>

// Immutable, content-addressed objects. Every object is stored under the
// digest returned by digest_of().
namespace strata::graph {

enum class ObjectKind : std::uint8_t { Blob = 0, Manifest = 1, Layer = 2, Platform = 3 };

auto kind_name(ObjectKind kind) -> std::string_view;

// Describes one payload: its content digest and byte length.
struct Blob {
  Digest payload = kNullDigest;
  std::uint64_t size = 0;
};

using Manifest = tracking::Manifest;

// One filesystem change set.
struct Layer {
  Digest manifest = kNullDigest;
};

// Ordered stack of layer/platform digests, bottom first.
struct Platform {
  std::vector<Digest> stack;
};

using Object = std::variant<Blob, Manifest, Layer, Platform>;

[[nodiscard]] auto kind_of(const Object &obj) -> ObjectKind;

// Blob/Layer/Platform hash their encoded form; a Manifest is addressed by
// its root tree digest.
[[nodiscard]] auto digest_of(const Object &obj) -> Digest;

// Digests this object references directly. Payloads are not objects and are
// not listed here (see Blob::payload).
[[nodiscard]] auto child_objects(const Object &obj) -> std::vector<Digest>;

[[nodiscard]] auto encode(const Object &obj) -> encoding::Bytes;

// Throws DecodeError on malformed input.
[[nodiscard]] auto decode(std::span<const std::uint8_t> data) -> Object;

// Digest of the Blob object for (payload, size); what manifests store for files.
[[nodiscard]] inline auto blob_digest(const Digest &payload, std::uint64_t size) -> Digest {
  return digest_of(Object{Blob{payload, size}});
}

} // namespace strata::graph

#pragma once

#include <array>
#include <cstdint>
#include <istream>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace strata {

// Raw 32-byte SHA-256 digest (binary, not text)
using Digest = std::array<std::uint8_t, 32>;

// SHA-256 of zero bytes.
inline constexpr Digest kEmptyDigest = {
    227, 176, 196, 66, 152, 252, 28, 20, 154, 251, 244, 200, 153, 111, 185, 36,
    39, 174, 65, 228, 100, 155, 147, 76, 164, 149, 153, 27, 120, 82, 184, 85,
};

// All zero bytes; never the result of hashing anything.
inline constexpr Digest kNullDigest = {};

/**
 * Incremental SHA-256 over the OpenSSL EVP API.
 * Feed bytes with update(), then call finish() exactly once.
 */
class Hasher {
public:
  Hasher();
  ~Hasher();
  Hasher(const Hasher &) = delete;
  Hasher &operator=(const Hasher &) = delete;

  void update(std::span<const std::uint8_t> data);
  void update(std::string_view s) {
    update(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()),
                                         s.size()));
  }

  Digest finish();

private:
  struct Ctx;
  std::unique_ptr<Ctx> ctx_;
  bool finished_ = false;
};

/** Compute SHA-256 of arbitrary bytes. */
Digest sha256(std::span<const std::uint8_t> data);

// Convenience overload for string-like input (no copy).
inline Digest sha256(std::string_view s) {
  return sha256(
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()), s.size()));
}

/**
 * Hash a stream in fixed-size chunks until EOF.
 * `total` receives the number of bytes consumed when non-null.
 */
Digest sha256_stream(std::istream &in, std::uint64_t *total = nullptr);

/** Convert a binary digest to its 52-char base32 text form (no padding). */
std::string to_base32(const Digest &d);

/**
 * Parse 52-char base32 into a binary digest.
 * Returns false if length/characters are invalid.
 */
bool from_base32(std::string_view text, Digest &out);

/** Like from_base32, but throws InvalidReferenceError. */
Digest parse_digest(std::string_view text);

/** True when `text` is a non-empty run of base32 characters no longer than a full digest. */
bool looks_partial_digest(std::string_view text);

} // namespace strata

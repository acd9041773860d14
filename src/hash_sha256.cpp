#include "strata/hash.hpp"

#include "strata/consts.hpp"
#include "strata/error.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <openssl/evp.h> // EVP_* digest API
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

namespace {

constexpr std::string_view kAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";

int base32_value(char c) {
  if (c >= 'A' && c <= 'Z') {
    return c - 'A';
  }
  if (c >= '2' && c <= '7') {
    return 26 + (c - '2');
  }
  return -1;
}

} // namespace

struct Hasher::Ctx {
  EVP_MD_CTX *md = nullptr;
};

Hasher::Hasher() : ctx_(std::make_unique<Ctx>()) {
  ctx_->md = EVP_MD_CTX_new();
  if (!ctx_->md) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(ctx_->md, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(ctx_->md);
    ctx_->md = nullptr;
    throw std::runtime_error("EVP_DigestInit_ex(EVP_sha256) failed");
  }
}

Hasher::~Hasher() {
  if (ctx_ && ctx_->md) {
    EVP_MD_CTX_free(ctx_->md);
  }
}

void Hasher::update(std::span<const std::uint8_t> data) {
  if (finished_) {
    throw std::logic_error("Hasher::update after finish");
  }
  if (!data.empty() && EVP_DigestUpdate(ctx_->md, data.data(), data.size()) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
}

Digest Hasher::finish() {
  if (finished_) {
    throw std::logic_error("Hasher::finish called twice");
  }
  finished_ = true;
  Digest out{};
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx_->md, out.data(), &len) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  if (len != out.size()) {
    throw std::runtime_error("SHA-256 produced unexpected length");
  }
  return out;
}

Digest sha256(std::span<const std::uint8_t> data) {
  Hasher h;
  h.update(data);
  return h.finish();
}

Digest sha256_stream(std::istream &in, std::uint64_t *total) {
  Hasher h;
  std::array<char, consts::kChunkSize> buf{};
  std::uint64_t n = 0;
  while (in) {
    in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    const auto got = static_cast<std::size_t>(in.gcount());
    if (got == 0) {
      break;
    }
    h.update(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(buf.data()),
                                           got));
    n += got;
  }
  if (in.bad()) {
    throw std::runtime_error("read failed while hashing stream");
  }
  if (total) {
    *total = n;
  }
  return h.finish();
}

std::string to_base32(const Digest &d) {
  std::string s;
  s.reserve(consts::kDigestBase32Len);
  std::uint32_t buffer = 0;
  int bits = 0;
  for (const std::uint8_t byte : d) {
    buffer = (buffer << 8U) | byte;
    bits += 8;
    while (bits >= 5) {
      s.push_back(kAlphabet[(buffer >> static_cast<unsigned>(bits - 5)) & 0x1FU]);
      bits -= 5;
    }
  }
  if (bits > 0) {
    s.push_back(kAlphabet[(buffer << static_cast<unsigned>(5 - bits)) & 0x1FU]);
  }
  return s;
}

bool from_base32(std::string_view text, Digest &out) {
  if (text.size() != consts::kDigestBase32Len) {
    return false;
  }
  std::uint32_t buffer = 0;
  int bits = 0;
  std::size_t pos = 0;
  for (const char c : text) {
    const int v = base32_value(c);
    if (v < 0) {
      return false;
    }
    buffer = (buffer << 5U) | static_cast<std::uint32_t>(v);
    bits += 5;
    if (bits >= 8) {
      if (pos >= out.size()) {
        return false;
      }
      out[pos++] = static_cast<std::uint8_t>((buffer >> static_cast<unsigned>(bits - 8)) & 0xFFU);
      bits -= 8;
    }
  }
  // 52 chars carry 260 bits; the 4 trailing pad bits must be zero
  if (pos != out.size() || (buffer & ((1U << static_cast<unsigned>(bits)) - 1U)) != 0) {
    return false;
  }
  return true;
}

Digest parse_digest(std::string_view text) {
  Digest d{};
  if (!from_base32(text, d)) {
    throw InvalidReferenceError("not a digest: " + std::string(text));
  }
  return d;
}

bool looks_partial_digest(std::string_view text) {
  if (text.empty() || text.size() > consts::kDigestBase32Len) {
    return false;
  }
  return std::ranges::all_of(text, [](char c) { return base32_value(c) >= 0; });
}

} // namespace strata

#pragma once
#include "strata/hash.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// Stable binary encoding shared by graph objects and tag records:
// headers end with '\n', integers are 8-byte big-endian, digests are
// written raw, strings are NUL-terminated.
namespace strata::encoding {

using Bytes = std::vector<std::uint8_t>;

void write_header(Bytes &out, std::string_view header);
void write_uint(Bytes &out, std::uint64_t value);
void write_int(Bytes &out, std::int64_t value);
void write_digest(Bytes &out, const Digest &digest);
// Throws Error if `s` contains a NUL byte.
void write_string(Bytes &out, std::string_view s);

class Reader {
public:
  explicit Reader(std::span<const std::uint8_t> data) : data_(data) {}

  // Throws DecodeError unless the next bytes are `header` + '\n'.
  void consume_header(std::string_view header);
  std::uint64_t read_uint();
  std::int64_t read_int();
  Digest read_digest();
  std::string read_string();

  [[nodiscard]] bool at_end() const { return pos_ >= data_.size(); }
  [[nodiscard]] std::size_t position() const { return pos_; }

private:
  void need(std::size_t n, const char *what) const;

  std::span<const std::uint8_t> data_;
  std::size_t pos_ = 0;
};

} // namespace strata::encoding

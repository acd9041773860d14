#include "strata/encoding.hpp"

#include "strata/error.hpp"

#include <algorithm>
#include <string>

namespace strata::encoding {

void write_header(Bytes &out, std::string_view header) {
  out.insert(out.end(), header.begin(), header.end());
  out.push_back('\n');
}

void write_uint(Bytes &out, std::uint64_t value) {
  for (int shift = 56; shift >= 0; shift -= 8) {
    out.push_back(static_cast<std::uint8_t>((value >> static_cast<unsigned>(shift)) & 0xFFU));
  }
}

void write_int(Bytes &out, std::int64_t value) { write_uint(out, static_cast<std::uint64_t>(value)); }

void write_digest(Bytes &out, const Digest &digest) {
  out.insert(out.end(), digest.begin(), digest.end());
}

void write_string(Bytes &out, std::string_view s) {
  if (s.find('\0') != std::string_view::npos) {
    throw Error("cannot encode string containing NUL byte");
  }
  out.insert(out.end(), s.begin(), s.end());
  out.push_back('\0');
}

void Reader::need(std::size_t n, const char *what) const {
  if (pos_ > data_.size() || data_.size() - pos_ < n) {
    throw DecodeError(std::string("truncated ") + what);
  }
}

void Reader::consume_header(std::string_view header) {
  need(header.size() + 1, "header");
  const auto *p = data_.data() + pos_;
  if (!std::equal(header.begin(), header.end(), p) || p[header.size()] != '\n') {
    throw DecodeError("invalid header, wanted " + std::string(header));
  }
  pos_ += header.size() + 1;
}

std::uint64_t Reader::read_uint() {
  need(8, "integer");
  std::uint64_t v = 0;
  for (int i = 0; i < 8; ++i) {
    v = (v << 8U) | data_[pos_++];
  }
  return v;
}

std::int64_t Reader::read_int() { return static_cast<std::int64_t>(read_uint()); }

Digest Reader::read_digest() {
  Digest d{};
  need(d.size(), "digest");
  std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(pos_), d.size(), d.begin());
  pos_ += d.size();
  return d;
}

std::string Reader::read_string() {
  const auto begin = data_.begin() + static_cast<std::ptrdiff_t>(pos_);
  const auto nul = std::find(begin, data_.end(), static_cast<std::uint8_t>('\0'));
  if (nul == data_.end()) {
    throw DecodeError("unterminated string");
  }
  std::string s(begin, nul);
  pos_ += s.size() + 1;
  return s;
}

} // namespace strata::encoding

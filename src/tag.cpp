#include "strata/tag.hpp"

#include "strata/consts.hpp"
#include "strata/error.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <unistd.h>

namespace strata::tracking {

namespace {

bool valid_component(std::string_view s) {
  if (s.empty() || s == "." || s == "..") {
    return false;
  }
  for (const char c : s) {
    const auto uc = static_cast<unsigned char>(c);
    if (!std::isalnum(uc) && c != '-' && c != '_' && c != '.' && c != ':') {
      return false;
    }
  }
  return true;
}

} // namespace

auto TagSpec::path() const -> std::string { return org.empty() ? name : org + "/" + name; }

auto TagSpec::to_string() const -> std::string {
  auto out = path();
  if (version != 0) {
    out += consts::kTagVersionSep + std::to_string(version);
  }
  return out;
}

auto parse_tag_spec(std::string_view text) -> TagSpec {
  TagSpec spec;
  std::string_view rest = text;
  const auto tilde = rest.rfind(consts::kTagVersionSep);
  if (tilde != std::string_view::npos) {
    const auto num = rest.substr(tilde + 1);
    std::uint64_t v = 0;
    const auto [ptr, ec] = std::from_chars(num.data(), num.data() + num.size(), v);
    if (num.empty() || ec != std::errc{} || ptr != num.data() + num.size()) {
      throw InvalidReferenceError("bad tag version in '" + std::string(text) + "'");
    }
    spec.version = v;
    rest = rest.substr(0, tilde);
  }

  const auto slash = rest.rfind('/');
  if (slash != std::string_view::npos) {
    spec.org = std::string(rest.substr(0, slash));
    rest = rest.substr(slash + 1);
  }
  spec.name = std::string(rest);

  if (!valid_component(spec.name)) {
    throw InvalidReferenceError("bad tag name '" + std::string(text) + "'");
  }
  if (!spec.org.empty()) {
    std::string_view org = spec.org;
    while (!org.empty()) {
      const auto p = org.find('/');
      if (!valid_component(org.substr(0, p))) {
        throw InvalidReferenceError("bad tag org '" + std::string(text) + "'");
      }
      org = p == std::string_view::npos ? std::string_view{} : org.substr(p + 1);
      if (p != std::string_view::npos && org.empty()) {
        throw InvalidReferenceError("bad tag org '" + std::string(text) + "'");
      }
    }
  }
  return spec;
}

bool is_tag_spec(std::string_view text) {
  try {
    (void)parse_tag_spec(text);
    return true;
  } catch (const InvalidReferenceError &) {
    return false;
  }
}

auto Tag::digest() const -> Digest {
  encoding::Bytes buf;
  encode_tag(buf, *this);
  return sha256(buf);
}

auto Tag::to_string() const -> std::string {
  return path + consts::kTagVersionSep + std::to_string(version);
}

void encode_tag(encoding::Bytes &out, const Tag &tag) {
  encoding::write_header(out, consts::kTagHeader);
  encoding::write_string(out, tag.path);
  encoding::write_uint(out, tag.version);
  encoding::write_digest(out, tag.target);
  encoding::write_digest(out, tag.parent);
  encoding::write_string(out, tag.user);
  encoding::write_int(out, tag.time);
}

auto decode_tag(encoding::Reader &r) -> Tag {
  Tag t;
  r.consume_header(consts::kTagHeader);
  t.path = r.read_string();
  t.version = r.read_uint();
  t.target = r.read_digest();
  t.parent = r.read_digest();
  t.user = r.read_string();
  t.time = r.read_int();
  return t;
}

auto default_tag_user() -> std::string {
  const char *user = std::getenv("USER");
  char host[256] = {};
  if (::gethostname(host, sizeof(host) - 1) != 0 || host[0] == '\0') {
    host[0] = '\0';
  }
  return std::string(user && *user ? user : "unknown") + "@" + (host[0] ? host : "localhost");
}

} // namespace strata::tracking

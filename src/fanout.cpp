#include "strata/fanout.hpp"

#include "strata/consts.hpp"
#include "strata/error.hpp"
#include "strata/fs.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace strata {

namespace {

bool digest_from_path(const std::filesystem::path &p, Digest &out) {
  const auto dir = p.parent_path().filename().string();
  const auto name = p.filename().string();
  if (dir.size() != consts::kFanoutLen) {
    return false;
  }
  return from_base32(dir + name, out);
}

std::string upper(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return out;
}

} // namespace

DigestIterator::DigestIterator(const std::filesystem::path &root) {
  std::error_code ec;
  it_ = std::filesystem::recursive_directory_iterator(root, ec);
  if (ec) {
    it_ = {};
    return;
  }
  settle();
}

DigestIterator &DigestIterator::operator++() {
  // never descend into a stored entry (renders are directories)
  if (it_ != std::filesystem::recursive_directory_iterator() && it_.depth() >= 1) {
    it_.disable_recursion_pending();
  }
  std::error_code ec;
  it_.increment(ec);
  if (ec) {
    throw std::runtime_error("directory walk failed: " + ec.message());
  }
  settle();
  return *this;
}

void DigestIterator::settle() {
  const std::filesystem::recursive_directory_iterator end;
  while (it_ != end) {
    if (it_.depth() == 1 && digest_from_path(it_->path(), current_)) {
      return;
    }
    if (it_.depth() >= 1) {
      it_.disable_recursion_pending();
    }
    std::error_code ec;
    it_.increment(ec);
    if (ec) {
      throw std::runtime_error("directory walk failed: " + ec.message());
    }
  }
}

auto FanoutDir::path_for(const Digest &d) const -> std::filesystem::path {
  const auto text = to_base32(d);
  return root_ / text.substr(0, consts::kFanoutLen) / text.substr(consts::kFanoutLen);
}

bool FanoutDir::contains(const Digest &d) const { return fs::exists(path_for(d)); }

auto FanoutDir::find(std::string_view prefix) const -> std::vector<Digest> {
  const auto want = upper(prefix);
  std::vector<Digest> out;
  if (want.size() < consts::kFanoutLen) {
    for (const auto &d : iter()) {
      if (to_base32(d).rfind(want, 0) == 0) {
        out.push_back(d);
      }
    }
    return out;
  }

  const auto dir = root_ / want.substr(0, consts::kFanoutLen);
  const auto rest = want.substr(consts::kFanoutLen);
  std::error_code ec;
  std::filesystem::directory_iterator it(dir, ec);
  if (ec) {
    return out;
  }
  for (const auto &entry : it) {
    const auto name = entry.path().filename().string();
    Digest d{};
    if (name.rfind(rest, 0) == 0 && digest_from_path(entry.path(), d)) {
      out.push_back(d);
    }
  }
  return out;
}

auto FanoutDir::resolve(std::string_view prefix) const -> Digest {
  if (!looks_partial_digest(upper(prefix))) {
    throw InvalidReferenceError("not a digest prefix: " + std::string(prefix));
  }
  const auto matches = find(prefix);
  if (matches.empty()) {
    throw UnknownReferenceError(std::string(prefix));
  }
  if (matches.size() > 1) {
    throw AmbiguousReferenceError(std::string(prefix) + " matches " +
                                  std::to_string(matches.size()) + " digests");
  }
  return matches.front();
}

} // namespace strata

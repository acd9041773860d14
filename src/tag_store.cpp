#include "strata/tag_store.hpp"

#include "strata/consts.hpp"
#include "strata/encoding.hpp"
#include "strata/error.hpp"
#include "strata/fs.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <spdlog/spdlog.h>
#include <thread>
#include <unistd.h>

namespace sfs = strata::fs;

namespace strata {

namespace {

constexpr int kLockAttempts = 1000;
constexpr auto kLockBackoff = std::chrono::milliseconds(10);

// Exclusive lock file held for the lifetime of the object.
class StreamLock {
public:
  explicit StreamLock(std::filesystem::path file) : path_(std::move(file)) {
    sfs::ensure_parent_dir(path_);
    for (int attempt = 0; attempt < kLockAttempts; ++attempt) {
      const int fd = ::open(path_.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644);
      if (fd >= 0) {
        ::close(fd);
        return;
      }
      if (errno != EEXIST) {
        throw std::runtime_error("cannot create lock " + path_.string() + ": " +
                                 std::strerror(errno));
      }
      std::this_thread::sleep_for(kLockBackoff);
    }
    throw Error("timed out waiting for tag lock " + path_.string());
  }
  ~StreamLock() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }
  StreamLock(const StreamLock &) = delete;
  StreamLock &operator=(const StreamLock &) = delete;

private:
  std::filesystem::path path_;
};

std::filesystem::path lock_file_for(const std::filesystem::path &stream) {
  auto p = stream;
  p += consts::kLockExt;
  return p;
}

bool ends_with(std::string_view s, std::string_view suffix) {
  return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

} // namespace

TagStreamIterator::TagStreamIterator(const std::filesystem::path &root) : root_(root) {
  std::error_code ec;
  it_ = std::filesystem::recursive_directory_iterator(root, ec);
  if (ec) {
    it_ = {};
    return;
  }
  settle();
}

TagStreamIterator &TagStreamIterator::operator++() {
  std::error_code ec;
  it_.increment(ec);
  if (ec) {
    throw std::runtime_error("tag walk failed: " + ec.message());
  }
  settle();
  return *this;
}

void TagStreamIterator::settle() {
  const std::filesystem::recursive_directory_iterator end;
  while (it_ != end) {
    const auto name = it_->path().filename().string();
    std::error_code ec;
    if (it_->is_regular_file(ec) && ends_with(name, consts::kTagExt)) {
      auto rel = std::filesystem::relative(it_->path(), root_, ec).generic_string();
      if (!ec) {
        current_ = rel.substr(0, rel.size() - consts::kTagExt.size());
        return;
      }
    }
    it_.increment(ec);
    if (ec) {
      throw std::runtime_error("tag walk failed: " + ec.message());
    }
  }
}

TagStore::TagStore(std::filesystem::path root, std::string user)
    : root_(std::move(root)), user_(std::move(user)) {}

auto TagStore::stream_file(std::string_view path) const -> std::filesystem::path {
  auto p = root_ / std::filesystem::path(std::string(path));
  p += consts::kTagExt;
  return p;
}

auto TagStore::read_file_records(const std::filesystem::path &file) const -> std::vector<Tag> {
  const auto bytes = sfs::read_file(file);
  const std::span<const std::uint8_t> all(bytes);
  std::vector<Tag> out;
  std::size_t offset = 0;
  while (offset < all.size()) {
    encoding::Reader len_reader(all.subspan(offset));
    const auto len = len_reader.read_uint();
    offset += len_reader.position();
    if (len > all.size() - offset) {
      throw DecodeError("tag record overruns " + file.string());
    }
    encoding::Reader rec(all.subspan(offset, len));
    out.push_back(tracking::decode_tag(rec));
    offset += len;
  }
  return out;
}

void TagStore::write_file_records(const std::filesystem::path &file,
                                  const std::vector<Tag> &tags) const {
  encoding::Bytes out;
  for (const auto &t : tags) {
    encoding::Bytes rec;
    tracking::encode_tag(rec, t);
    encoding::write_uint(out, rec.size());
    out.insert(out.end(), rec.begin(), rec.end());
  }
  sfs::write_file_atomic(file, out);
}

void TagStore::prune_empty_dirs(std::filesystem::path dir) const {
  std::error_code ec;
  while (dir != root_ && dir.string().size() > root_.string().size()) {
    if (!std::filesystem::is_empty(dir, ec) || ec) {
      return;
    }
    std::filesystem::remove(dir, ec);
    dir = dir.parent_path();
  }
}

auto TagStore::push_tag(const TagSpec &spec, const Digest &target) const -> Tag {
  return push_tag(spec.path(), target);
}

auto TagStore::push_tag(std::string_view path, const Digest &target) const -> Tag {
  const auto spec = tracking::parse_tag_spec(path);
  const auto file = stream_file(spec.path());
  StreamLock lock(lock_file_for(file));

  std::vector<Tag> records;
  if (sfs::exists(file)) {
    records = read_file_records(file);
  }
  Tag tag;
  tag.path = spec.path();
  tag.target = target;
  tag.user = user_;
  tag.time = static_cast<std::int64_t>(std::time(nullptr));
  if (!records.empty()) {
    tag.version = records.back().version + 1;
    tag.parent = records.back().digest();
  }
  records.push_back(tag);
  write_file_records(file, records);
  spdlog::debug("tagged {} -> {}", tag.to_string(), to_base32(target));
  return tag;
}

bool TagStore::push_raw_tag(const Tag &tag) const {
  const auto spec = tracking::parse_tag_spec(tag.path);
  const auto file = stream_file(spec.path());
  StreamLock lock(lock_file_for(file));

  std::vector<Tag> records;
  if (sfs::exists(file)) {
    records = read_file_records(file);
  }
  if (!records.empty()) {
    const auto &last = records.back();
    if (last.target == tag.target && last.time == tag.time && last.user == tag.user) {
      return false;
    }
  }
  Tag copy = tag;
  copy.path = spec.path();
  copy.version = records.empty() ? 0 : records.back().version + 1;
  copy.parent = records.empty() ? kNullDigest : records.back().digest();
  records.push_back(copy);
  write_file_records(file, records);
  return true;
}

auto TagStore::read_tag_stream(std::string_view path) const -> std::vector<Tag> {
  const auto file = stream_file(path);
  if (!sfs::exists(file)) {
    throw UnknownReferenceError("tag " + std::string(path));
  }
  auto records = read_file_records(file);
  std::reverse(records.begin(), records.end());
  return records;
}

auto TagStore::resolve_tag(const TagSpec &spec) const -> Tag {
  const auto stream = read_tag_stream(spec.path());
  if (spec.version >= stream.size()) {
    throw UnknownReferenceError("tag " + spec.to_string() + " (stream has " +
                                std::to_string(stream.size()) + " versions)");
  }
  return stream[spec.version];
}

auto TagStore::resolve_tag(std::string_view spec) const -> Tag {
  return resolve_tag(tracking::parse_tag_spec(spec));
}

bool TagStore::has_tag(std::string_view path) const {
  return tracking::is_tag_spec(path) && sfs::exists(stream_file(tracking::parse_tag_spec(path).path()));
}

auto TagStore::iter_tags() const -> std::vector<std::pair<std::string, Tag>> {
  std::vector<std::pair<std::string, Tag>> out;
  for (const auto &path : iter_tag_streams()) {
    const auto stream = read_tag_stream(path);
    if (!stream.empty()) {
      out.emplace_back(path, stream.front());
    }
  }
  return out;
}

auto TagStore::find_tags(const Digest &digest) const -> std::vector<std::string> {
  std::vector<std::string> out;
  for (const auto &[path, tag] : iter_tags()) {
    if (tag.target == digest) {
      out.push_back(path);
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

auto TagStore::ls_tags(std::string_view dir) const -> std::vector<std::string> {
  std::vector<std::string> out;
  const auto base = dir.empty() ? root_ : root_ / std::filesystem::path(std::string(dir));
  std::error_code ec;
  std::filesystem::directory_iterator it(base, ec);
  if (ec) {
    return out;
  }
  for (const auto &entry : it) {
    const auto name = entry.path().filename().string();
    if (entry.is_directory()) {
      out.push_back(name + "/");
    } else if (ends_with(name, consts::kTagExt)) {
      out.push_back(name.substr(0, name.size() - consts::kTagExt.size()));
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

void TagStore::remove_tag_stream(std::string_view path) const {
  const auto file = stream_file(path);
  if (!sfs::exists(file)) {
    throw UnknownReferenceError("tag " + std::string(path));
  }
  {
    StreamLock lock(lock_file_for(file));
    std::error_code ec;
    if (!std::filesystem::remove(file, ec)) {
      if (ec) {
        throw std::runtime_error("remove failed: " + file.string() + ": " + ec.message());
      }
      throw UnknownReferenceError("tag " + std::string(path));
    }
  }
  prune_empty_dirs(file.parent_path());
  spdlog::debug("removed tag stream {}", path);
}

void TagStore::remove_tag(const Tag &tag) const {
  const auto file = stream_file(tag.path);
  if (!sfs::exists(file)) {
    throw UnknownReferenceError("tag " + tag.path);
  }
  {
    StreamLock lock(lock_file_for(file));
    auto records = read_file_records(file);
    const auto it = std::find_if(records.begin(), records.end(),
                                 [&](const Tag &t) { return t.version == tag.version; });
    if (it == records.end()) {
      throw UnknownReferenceError("tag " + tag.to_string());
    }
    records.erase(it);
    if (records.empty()) {
      std::filesystem::remove(file);
    } else {
      write_file_records(file, records);
    }
  }
  prune_empty_dirs(file.parent_path());
  spdlog::debug("removed tag {}", tag.to_string());
}

} // namespace strata

#pragma once
#include "strata/hash.hpp"
#include "strata/tag.hpp"

#include <filesystem>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace strata {

using tracking::Tag;
using tracking::TagSpec;

// Lazily yields every tag stream path ("org/name") under a tags directory.
class TagStreamIterator {
public:
  using iterator_category = std::input_iterator_tag;
  using value_type = std::string;
  using difference_type = std::ptrdiff_t;
  using pointer = const std::string *;
  using reference = const std::string &;

  TagStreamIterator() = default;
  explicit TagStreamIterator(const std::filesystem::path &root);

  reference operator*() const { return current_; }
  pointer operator->() const { return &current_; }
  TagStreamIterator &operator++();
  void operator++(int) { ++*this; }

  friend bool operator==(const TagStreamIterator &a, const TagStreamIterator &b) {
    return a.it_ == b.it_;
  }

private:
  void settle();

  std::filesystem::path root_;
  std::filesystem::recursive_directory_iterator it_;
  std::string current_;
};

class TagStreamRange {
public:
  explicit TagStreamRange(std::filesystem::path root) : root_(std::move(root)) {}
  [[nodiscard]] TagStreamIterator begin() const { return TagStreamIterator(root_); }
  [[nodiscard]] TagStreamIterator end() const { return {}; }

private:
  std::filesystem::path root_;
};

/**
 * Append-only version history per tag path, one `<path>.tag` file per
 * stream. Writers serialise through a `<path>.tag.lock` file so reading the
 * latest version and appending the next one happen atomically.
 */
class TagStore {
public:
  explicit TagStore(std::filesystem::path root, std::string user = tracking::default_tag_user());

  [[nodiscard]] const std::filesystem::path &root() const { return root_; }
  [[nodiscard]] const std::string &user() const { return user_; }
  void set_user(std::string user) { user_ = std::move(user); }

  // Appends version (latest + 1), or 0 for a new stream.
  auto push_tag(const TagSpec &spec, const Digest &target) const -> Tag;
  auto push_tag(std::string_view path, const Digest &target) const -> Tag;

  // Append an already-built tag, keeping its target/user/time. The version
  // and parent are renumbered to follow the local stream. Returns false
  // (and writes nothing) if the latest local entry already records it.
  bool push_raw_tag(const Tag &tag) const;

  // Throws UnknownReferenceError if the stream or offset does not exist.
  [[nodiscard]] auto resolve_tag(const TagSpec &spec) const -> Tag;
  [[nodiscard]] auto resolve_tag(std::string_view spec) const -> Tag;

  [[nodiscard]] bool has_tag(std::string_view path) const;

  // Newest first. Throws UnknownReferenceError for an unknown stream.
  [[nodiscard]] auto read_tag_stream(std::string_view path) const -> std::vector<Tag>;

  [[nodiscard]] auto iter_tag_streams() const -> TagStreamRange { return TagStreamRange(root_); }

  // (path, latest tag) for every stream.
  [[nodiscard]] auto iter_tags() const -> std::vector<std::pair<std::string, Tag>>;

  // Every stream path whose latest version targets `digest`.
  [[nodiscard]] auto find_tags(const Digest &digest) const -> std::vector<std::string>;

  // Names directly under `dir`: streams as "name", sub-directories as "name/".
  [[nodiscard]] auto ls_tags(std::string_view dir = "") const -> std::vector<std::string>;

  void remove_tag_stream(std::string_view path) const;
  // Remove one version; drops the stream file once it is empty.
  void remove_tag(const Tag &tag) const;

private:
  [[nodiscard]] auto stream_file(std::string_view path) const -> std::filesystem::path;
  [[nodiscard]] auto read_file_records(const std::filesystem::path &file) const
      -> std::vector<Tag>;
  void write_file_records(const std::filesystem::path &file, const std::vector<Tag> &tags) const;
  void prune_empty_dirs(std::filesystem::path dir) const;

  std::filesystem::path root_;
  std::string user_;
};

} // namespace strata

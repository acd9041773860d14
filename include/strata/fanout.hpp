#pragma once
#include "strata/hash.hpp"

#include <cstddef>
#include <filesystem>
#include <iterator>
#include <string_view>
#include <vector>

namespace strata {

/**
 * Input iterator over the digests stored in a fanout directory
 * (`root/AB/CDEF...`). Files whose names do not spell a digest (temp files
 * of in-flight writes, for example) are skipped.
 */
class DigestIterator {
public:
  using iterator_category = std::input_iterator_tag;
  using value_type = Digest;
  using difference_type = std::ptrdiff_t;
  using pointer = const Digest *;
  using reference = const Digest &;

  DigestIterator() = default;
  explicit DigestIterator(const std::filesystem::path &root);

  reference operator*() const { return current_; }
  pointer operator->() const { return &current_; }
  DigestIterator &operator++();
  void operator++(int) { ++*this; }

  friend bool operator==(const DigestIterator &a, const DigestIterator &b) { return a.it_ == b.it_; }

private:
  void settle();

  std::filesystem::recursive_directory_iterator it_;
  Digest current_{};
};

// Restartable lazy sequence: every begin() starts a fresh directory walk.
class DigestRange {
public:
  explicit DigestRange(std::filesystem::path root) : root_(std::move(root)) {}
  [[nodiscard]] DigestIterator begin() const { return DigestIterator(root_); }
  [[nodiscard]] DigestIterator end() const { return {}; }

private:
  std::filesystem::path root_;
};

// Two-level digest-addressed directory shared by the object and payload stores.
class FanoutDir {
public:
  explicit FanoutDir(std::filesystem::path root) : root_(std::move(root)) {}

  [[nodiscard]] const std::filesystem::path &root() const { return root_; }
  [[nodiscard]] auto path_for(const Digest &d) const -> std::filesystem::path;
  [[nodiscard]] bool contains(const Digest &d) const;
  [[nodiscard]] auto iter() const -> DigestRange { return DigestRange(root_); }

  // All stored digests whose text form starts with `prefix` (case-insensitive).
  [[nodiscard]] auto find(std::string_view prefix) const -> std::vector<Digest>;

  /**
   * Expand a digest prefix to the single stored digest it names.
   * Throws InvalidReferenceError for non-base32 text, UnknownReferenceError
   * when nothing matches and AmbiguousReferenceError on several matches.
   */
  [[nodiscard]] auto resolve(std::string_view prefix) const -> Digest;

private:
  std::filesystem::path root_;
};

} // namespace strata

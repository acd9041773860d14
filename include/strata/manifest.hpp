#pragma once
#include "strata/consts.hpp"
#include "strata/hash.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata::tracking {

enum class EntryKind : std::uint8_t { Tree = 0, Blob = 1, Symlink = 2, Mask = 3 };

std::string_view kind_name(EntryKind kind);

// One node of a directory snapshot. The entry's name is its key in the
// parent's `entries` map, which keeps siblings sorted by name.
struct Entry {
  EntryKind kind = EntryKind::Tree;
  std::uint32_t mode = consts::kDefaultDirMode; // full st_mode bits
  std::uint64_t size = 0;                       // byte size of blob/symlink content
  // Tree: digest of the ordered children. Blob/Symlink: digest of the Blob
  // object describing the payload. Mask: kEmptyDigest.
  Digest object = kEmptyDigest;
  std::map<std::string, Entry> entries; // only populated for trees

  [[nodiscard]] bool is_tree() const { return kind == EntryKind::Tree; }
  [[nodiscard]] bool is_mask() const { return kind == EntryKind::Mask; }
  [[nodiscard]] bool has_payload() const {
    return kind == EntryKind::Blob || kind == EntryKind::Symlink;
  }

  // Compares everything except children (trees compare by digest instead).
  [[nodiscard]] bool same_node(const Entry &other) const {
    return kind == other.kind && mode == other.mode && size == other.size &&
           object == other.object;
  }
};

// Recompute the digests of every tree below (and including) `tree`.
void update_tree_digests(Entry &tree);

// Hash over the encoded, name-ordered children of a tree entry.
Digest compute_tree_digest(const Entry &tree);

struct WalkNode {
  std::string path; // "dir/file", no leading '/'
  const Entry *entry;
};

/**
 * Immutable-by-convention structural snapshot of a directory tree.
 * Editing helpers (mkdirs/mknod/remove/update) leave digests stale until
 * finalize() is called.
 */
class Manifest {
public:
  Manifest();
  explicit Manifest(Entry root);

  [[nodiscard]] const Entry &root() const { return root_; }
  // Digest of the root tree; identical contents always give identical digests.
  [[nodiscard]] const Digest &digest() const { return root_.object; }
  [[nodiscard]] bool is_empty() const { return root_.entries.empty(); }

  // nullptr if the path does not exist. "" or "/" is the root.
  [[nodiscard]] const Entry *get_path(std::string_view path) const;
  [[nodiscard]] std::optional<std::vector<std::string>> list_dir(std::string_view path) const;

  // Depth-first, name-ordered walk of every entry below the root.
  [[nodiscard]] std::vector<WalkNode> walk() const;

  Entry &mkdirs(std::string_view path);
  Entry &mknod(std::string_view path, Entry entry);
  // Returns false when nothing existed at `path`.
  bool remove(std::string_view path);

  // Layer `top` over this manifest: masks remove paths, trees merge,
  // everything else replaces what was below.
  void update(const Manifest &top);

  void finalize();

  friend bool operator==(const Manifest &a, const Manifest &b) { return a.digest() == b.digest(); }

private:
  Entry root_;
};

// True for an overlayfs whiteout: a character device numbered 0/0.
bool is_removed_entry(std::uint32_t st_mode, std::uint64_t st_rdev);

/**
 * Snapshot `root` from disk. Children are visited in name order, files are
 * hashed in fixed-size chunks, whiteouts become Mask entries, and any other
 * special file raises UnsupportedFileTypeError.
 */
Manifest compute_manifest(const std::filesystem::path &root);

// Snapshot a single regular file or symlink as a Blob/Symlink entry.
Entry compute_entry(const std::filesystem::path &path);

} // namespace strata::tracking

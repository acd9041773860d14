#include "strata/manifest.hpp"

#include "strata/encoding.hpp"
#include "strata/error.hpp"
#include "strata/graph.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sys/stat.h>
#include <unistd.h>

namespace strata::tracking {

namespace {

// "a//b/" -> {"a", "b"}
std::vector<std::string> split_path(std::string_view path) {
  std::vector<std::string> parts;
  std::size_t i = 0;
  while (i < path.size()) {
    const auto j = path.find('/', i);
    const auto end = j == std::string_view::npos ? path.size() : j;
    if (end > i) {
      std::string part(path.substr(i, end - i));
      if (part != ".") {
        parts.push_back(std::move(part));
      }
    }
    i = end + 1;
  }
  return parts;
}

std::string join(const std::string &prefix, const std::string &name) {
  return prefix.empty() ? name : prefix + "/" + name;
}

void walk_into(const Entry &tree, const std::string &prefix, std::vector<WalkNode> &out) {
  for (const auto &[name, child] : tree.entries) {
    auto path = join(prefix, name);
    out.push_back({path, &child});
    if (child.is_tree()) {
      walk_into(child, path, out);
    }
  }
}

void merge_into(Entry &base, const Entry &top) {
  for (const auto &[name, incoming] : top.entries) {
    if (incoming.is_mask()) {
      base.entries.erase(name);
      continue;
    }
    auto it = base.entries.find(name);
    if (incoming.is_tree() && it != base.entries.end() && it->second.is_tree()) {
      it->second.mode = incoming.mode;
      merge_into(it->second, incoming);
      continue;
    }
    if (incoming.is_tree()) {
      // Masks only make sense against a lower tree, so drop them here.
      Entry fresh = incoming;
      fresh.entries.clear();
      merge_into(fresh, incoming);
      base.entries.insert_or_assign(name, std::move(fresh));
    } else {
      base.entries.insert_or_assign(name, incoming);
    }
  }
}

struct stat lstat_or_throw(const std::filesystem::path &p) {
  struct stat st {};
  if (::lstat(p.c_str(), &st) != 0) {
    throw Error("lstat failed: " + p.string() + ": " + std::strerror(errno));
  }
  return st;
}

Entry entry_from_stat(const std::filesystem::path &path, const struct stat &st) {
  Entry e;
  e.mode = static_cast<std::uint32_t>(st.st_mode);
  if (S_ISLNK(st.st_mode)) {
    e.kind = EntryKind::Symlink;
    std::string target(static_cast<std::size_t>(st.st_size) + 1, '\0');
    const auto n = ::readlink(path.c_str(), target.data(), target.size());
    if (n < 0) {
      throw Error("readlink failed: " + path.string() + ": " + std::strerror(errno));
    }
    target.resize(static_cast<std::size_t>(n));
    e.size = target.size();
    e.object = graph::blob_digest(sha256(target), e.size);
  } else if (S_ISREG(st.st_mode)) {
    e.kind = EntryKind::Blob;
    std::ifstream in(path, std::ios::binary);
    if (!in) {
      throw Error("open for read failed: " + path.string());
    }
    std::uint64_t size = 0;
    const auto payload = sha256_stream(in, &size);
    e.size = size;
    e.object = graph::blob_digest(payload, size);
  } else if (is_removed_entry(e.mode, st.st_rdev)) {
    e.kind = EntryKind::Mask;
    e.object = kEmptyDigest;
  } else {
    throw UnsupportedFileTypeError(path.string());
  }
  return e;
}

void compute_tree(const std::filesystem::path &dir, Entry &tree) {
  std::error_code ec;
  std::filesystem::directory_iterator it(dir, ec);
  if (ec) {
    throw Error("cannot list " + dir.string() + ": " + ec.message());
  }
  // std::map keeps children name-ordered regardless of readdir order.
  for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
    const auto path = it->path();
    const auto st = lstat_or_throw(path);
    Entry child;
    if (S_ISDIR(st.st_mode)) {
      child.kind = EntryKind::Tree;
      child.mode = static_cast<std::uint32_t>(st.st_mode);
      compute_tree(path, child);
    } else {
      child = entry_from_stat(path, st);
    }
    tree.entries.insert_or_assign(path.filename().string(), std::move(child));
  }
  if (ec) {
    throw Error("cannot list " + dir.string() + ": " + ec.message());
  }
  tree.object = compute_tree_digest(tree);
}

} // namespace

std::string_view kind_name(EntryKind kind) {
  switch (kind) {
  case EntryKind::Tree:
    return "tree";
  case EntryKind::Blob:
    return "file";
  case EntryKind::Symlink:
    return "symlink";
  case EntryKind::Mask:
    return "mask";
  }
  return "unknown";
}

Digest compute_tree_digest(const Entry &tree) {
  Hasher h;
  for (const auto &[name, child] : tree.entries) {
    encoding::Bytes buf;
    encoding::write_uint(buf, static_cast<std::uint64_t>(child.kind));
    encoding::write_uint(buf, child.mode);
    encoding::write_uint(buf, child.size);
    encoding::write_digest(buf, child.object);
    encoding::write_string(buf, name);
    h.update(buf);
  }
  return h.finish();
}

void update_tree_digests(Entry &tree) {
  for (auto &[name, child] : tree.entries) {
    if (child.is_tree()) {
      update_tree_digests(child);
    }
  }
  tree.size = 0;
  tree.object = compute_tree_digest(tree);
}

Manifest::Manifest() { root_.object = compute_tree_digest(root_); }

Manifest::Manifest(Entry root) : root_(std::move(root)) {
  root_.kind = EntryKind::Tree;
  update_tree_digests(root_);
}

const Entry *Manifest::get_path(std::string_view path) const {
  const Entry *cur = &root_;
  for (const auto &part : split_path(path)) {
    if (!cur->is_tree()) {
      return nullptr;
    }
    auto it = cur->entries.find(part);
    if (it == cur->entries.end()) {
      return nullptr;
    }
    cur = &it->second;
  }
  return cur;
}

std::optional<std::vector<std::string>> Manifest::list_dir(std::string_view path) const {
  const auto *e = get_path(path);
  if (!e || !e->is_tree()) {
    return std::nullopt;
  }
  std::vector<std::string> names;
  names.reserve(e->entries.size());
  for (const auto &[name, child] : e->entries) {
    names.push_back(name);
  }
  return names;
}

std::vector<WalkNode> Manifest::walk() const {
  std::vector<WalkNode> out;
  walk_into(root_, "", out);
  return out;
}

Entry &Manifest::mkdirs(std::string_view path) {
  Entry *cur = &root_;
  for (const auto &part : split_path(path)) {
    auto it = cur->entries.find(part);
    if (it == cur->entries.end()) {
      it = cur->entries.emplace(part, Entry{}).first;
    } else if (!it->second.is_tree()) {
      throw Error("not a directory: " + std::string(path));
    }
    cur = &it->second;
  }
  return *cur;
}

Entry &Manifest::mknod(std::string_view path, Entry entry) {
  auto parts = split_path(path);
  if (parts.empty()) {
    throw Error("cannot replace manifest root");
  }
  const auto name = parts.back();
  parts.pop_back();
  std::string parent;
  for (const auto &p : parts) {
    parent = join(parent, p);
  }
  auto &dir = mkdirs(parent);
  return dir.entries.insert_or_assign(name, std::move(entry)).first->second;
}

bool Manifest::remove(std::string_view path) {
  auto parts = split_path(path);
  if (parts.empty()) {
    return false;
  }
  Entry *cur = &root_;
  for (std::size_t i = 0; i + 1 < parts.size(); ++i) {
    auto it = cur->entries.find(parts[i]);
    if (it == cur->entries.end() || !it->second.is_tree()) {
      return false;
    }
    cur = &it->second;
  }
  return cur->entries.erase(parts.back()) > 0;
}

void Manifest::update(const Manifest &top) { merge_into(root_, top.root_); }

void Manifest::finalize() {
  root_.kind = EntryKind::Tree;
  update_tree_digests(root_);
}

bool is_removed_entry(std::uint32_t st_mode, std::uint64_t st_rdev) {
  return S_ISCHR(st_mode) && st_rdev == 0;
}

Manifest compute_manifest(const std::filesystem::path &root) {
  const auto st = lstat_or_throw(root);
  if (!S_ISDIR(st.st_mode)) {
    throw Error("not a directory: " + root.string());
  }
  Entry tree;
  compute_tree(root, tree);
  return Manifest(std::move(tree));
}

Entry compute_entry(const std::filesystem::path &path) {
  const auto st = lstat_or_throw(path);
  if (S_ISDIR(st.st_mode)) {
    throw Error("expected a file: " + path.string());
  }
  return entry_from_stat(path, st);
}

} // namespace strata::tracking

#pragma once
#include "strata/hash.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata::runtime {

// Persisted state of one runtime (the `status` file).
struct Status {
  std::vector<Digest> stack; // bottom first
  bool editable = false;
  bool mounted = false;
};

/**
 * A runtime directory: `upper/` collects local edits, `work/` is overlayfs
 * scratch space and `status` records the stack and flags. The runtime refers
 * to graph objects by digest only.
 */
class Runtime {
public:
  // Loads `root/status`; a missing status file means an empty stack.
  explicit Runtime(std::filesystem::path root);

  [[nodiscard]] auto id() const -> std::string { return root_.filename().string(); }
  [[nodiscard]] const std::filesystem::path &root() const { return root_; }
  [[nodiscard]] auto upper_dir() const -> std::filesystem::path;
  [[nodiscard]] auto work_dir() const -> std::filesystem::path;

  [[nodiscard]] const std::vector<Digest> &stack() const { return status_.stack; }
  [[nodiscard]] bool is_editable() const { return status_.editable; }
  [[nodiscard]] bool is_mounted() const { return status_.mounted; }
  [[nodiscard]] const Status &status() const { return status_; }

  // Append on top of the stack and persist.
  void push_digest(const Digest &d);
  void set_editable(bool editable);
  void set_mounted(bool mounted);
  // Replace every field at once and persist.
  void set_status(Status status);
  // Empty the stack; editability is kept.
  void reset_stack();

  // True when the upper directory holds any change, whiteouts included.
  [[nodiscard]] bool is_dirty() const;

  // Discard every local change.
  void reset();
  // Discard changes at or below each of `paths` ("/a/b" or "a/b").
  void reset(const std::vector<std::string> &paths);

  void save() const;
  void reload();

private:
  std::filesystem::path root_;
  Status status_;
};

// All runtimes under one root directory, one sub-directory each.
class Storage {
public:
  explicit Storage(std::filesystem::path root) : root_(std::move(root)) {}

  [[nodiscard]] const std::filesystem::path &root() const { return root_; }

  // Throws RuntimeExistsError if `name` is taken; a random id is used when unset.
  auto create_runtime(std::optional<std::string> name = std::nullopt) const -> Runtime;
  // Throws NoRuntimeError if absent.
  [[nodiscard]] auto read_runtime(std::string_view id) const -> Runtime;
  void remove_runtime(std::string_view id) const;
  [[nodiscard]] auto list_runtimes() const -> std::vector<Runtime>;

private:
  std::filesystem::path root_;
};

} // namespace strata::runtime

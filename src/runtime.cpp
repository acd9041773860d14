#include "strata/runtime.hpp"

#include "strata/config.hpp"
#include "strata/consts.hpp"
#include "strata/diff.hpp"
#include "strata/error.hpp"
#include "strata/fs.hpp"
#include "strata/manifest.hpp"

#include <algorithm>
#include <cstdio>
#include <random>
#include <spdlog/spdlog.h>
#include <sstream>
#include <utility>

namespace stdfs = std::filesystem;
namespace sfs = strata::fs;

namespace strata::runtime {

namespace {

std::string join_stack(const std::vector<Digest> &stack) {
  std::string out;
  for (const auto &d : stack) {
    if (!out.empty()) {
      out += ' ';
    }
    out += to_base32(d);
  }
  return out;
}

std::vector<Digest> split_stack(std::string_view text) {
  std::vector<Digest> out;
  std::istringstream iss{std::string(text)};
  std::string word;
  while (iss >> word) {
    out.push_back(parse_digest(word));
  }
  return out;
}

bool parse_bool(const std::string &v) { return v == "true" || v == "1" || v == "yes"; }

std::string random_id() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  char buf[17];
  std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(rng()));
  return buf;
}

bool valid_id(std::string_view id) {
  return !id.empty() && id != "." && id != ".." && id.find('/') == std::string_view::npos;
}

} // namespace

Runtime::Runtime(stdfs::path root) : root_(std::move(root)) { reload(); }

auto Runtime::upper_dir() const -> stdfs::path { return root_ / consts::kUpperDir; }
auto Runtime::work_dir() const -> stdfs::path { return root_ / consts::kWorkDir; }

void Runtime::reload() {
  status_ = Status{};
  const auto file = root_ / consts::kStatusFile;
  if (!sfs::exists(file)) {
    return;
  }
  for (const auto &[key, value] : parse_key_values(sfs::read_text(file))) {
    if (key == "stack") {
      status_.stack = split_stack(value);
    } else if (key == "editable") {
      status_.editable = parse_bool(value);
    } else if (key == "mounted") {
      status_.mounted = parse_bool(value);
    } else {
      spdlog::warn("runtime {}: ignoring unknown status key '{}'", id(), key);
    }
  }
}

void Runtime::save() const {
  const KeyValues kv{
      {"stack", join_stack(status_.stack)},
      {"editable", status_.editable ? "true" : "false"},
      {"mounted", status_.mounted ? "true" : "false"},
  };
  sfs::write_text_atomic(root_ / consts::kStatusFile, format_key_values(kv));
}

void Runtime::push_digest(const Digest &d) {
  status_.stack.push_back(d);
  save();
}

void Runtime::set_editable(bool editable) {
  status_.editable = editable;
  save();
}

void Runtime::set_mounted(bool mounted) {
  status_.mounted = mounted;
  save();
}

void Runtime::set_status(Status status) {
  status_ = std::move(status);
  save();
}

void Runtime::reset_stack() {
  status_.stack.clear();
  save();
}

bool Runtime::is_dirty() const {
  if (!sfs::exists(upper_dir())) {
    return false;
  }
  const auto upper = tracking::compute_manifest(upper_dir());
  return tracking::has_changes(tracking::compute_diff(tracking::Manifest{}, upper));
}

void Runtime::reset() {
  const auto upper = upper_dir();
  if (sfs::exists(upper)) {
    for (const auto &entry : stdfs::directory_iterator(upper)) {
      sfs::remove_tree(entry.path());
    }
  }
  sfs::ensure_dir(upper);
  spdlog::debug("runtime {}: discarded all changes", id());
}

void Runtime::reset(const std::vector<std::string> &paths) {
  if (paths.empty()) {
    reset();
    return;
  }
  const auto upper = upper_dir().lexically_normal();
  for (const auto &raw : paths) {
    std::string_view rel = raw;
    while (!rel.empty() && rel.front() == '/') {
      rel.remove_prefix(1);
    }
    const auto target = (upper / std::string(rel)).lexically_normal();
    if (target == upper || target == upper / "") {
      reset();
      return;
    }
    const auto rel_check = target.lexically_relative(upper);
    if (rel_check.empty() || *rel_check.begin() == "..") {
      throw Error("path escapes runtime: " + raw);
    }
    sfs::remove_tree(target);
    spdlog::debug("runtime {}: reset {}", id(), raw);
  }
}

auto Storage::create_runtime(std::optional<std::string> name) const -> Runtime {
  const auto id = name ? *name : random_id();
  if (!valid_id(id)) {
    throw Error("invalid runtime name '" + id + "'");
  }
  const auto dir = root_ / id;
  if (sfs::exists(dir)) {
    throw RuntimeExistsError(id);
  }
  sfs::ensure_dir(dir / consts::kUpperDir);
  sfs::ensure_dir(dir / consts::kWorkDir);
  Runtime rt(dir);
  rt.save();
  spdlog::debug("created runtime {}", id);
  return rt;
}

auto Storage::read_runtime(std::string_view id) const -> Runtime {
  const auto dir = root_ / std::string(id);
  if (!valid_id(id) || !sfs::exists(dir / consts::kStatusFile)) {
    throw NoRuntimeError(std::string(id));
  }
  return Runtime(dir);
}

void Storage::remove_runtime(std::string_view id) const {
  const auto rt = read_runtime(id);
  sfs::remove_tree(rt.root());
  spdlog::debug("removed runtime {}", id);
}

auto Storage::list_runtimes() const -> std::vector<Runtime> {
  std::vector<Runtime> out;
  std::error_code ec;
  stdfs::directory_iterator it(root_, ec);
  if (ec) {
    return out;
  }
  for (const auto &entry : it) {
    if (entry.is_directory() && sfs::exists(entry.path() / consts::kStatusFile)) {
      out.emplace_back(entry.path());
    }
  }
  std::sort(out.begin(), out.end(),
            [](const Runtime &a, const Runtime &b) { return a.id() < b.id(); });
  return out;
}

} // namespace strata::runtime

#include "strata/render.hpp"

#include "strata/error.hpp"
#include "strata/fs.hpp"
#include "strata/repo.hpp"

#include <cerrno>
#include <cstring>
#include <iterator>
#include <spdlog/spdlog.h>
#include <sys/stat.h>
#include <sys/sysmacros.h>

namespace stdfs = std::filesystem;
namespace sfs = strata::fs;

namespace strata {

namespace {

void copy_payload(const PayloadStore &payloads, const Digest &payload, const stdfs::path &dst) {
  if (!payloads.has_payload(payload)) {
    throw UnknownObjectError("payload " + to_base32(payload));
  }
  std::error_code ec;
  stdfs::copy_file(payloads.path_for(payload), dst, stdfs::copy_options::overwrite_existing, ec);
  if (ec) {
    throw std::runtime_error("copy payload to " + dst.string() + " failed: " + ec.message());
  }
}

// A render without its whiteouts would expose removed paths, so any failure aborts it.
void make_whiteout(const stdfs::path &p) {
  if (::mknod(p.c_str(), S_IFCHR | 0000, ::makedev(0, 0)) != 0) {
    throw Error("cannot create whiteout " + p.string() + ": " + std::strerror(errno));
  }
}

} // namespace

Renderer::Renderer(const Repository &repo) : repo_(repo), dir_(repo.renders_dir()) {}

auto Renderer::render_manifest(const graph::Manifest &manifest) const -> stdfs::path {
  const auto target = render_path(manifest.digest());
  if (sfs::exists(target)) {
    return target;
  }
  sfs::ensure_parent_dir(target);
  const auto tmp = sfs::temp_sibling(target);
  sfs::ensure_dir(tmp);
  const auto nodes = manifest.walk();
  try {
    for (const auto &node : nodes) {
      const auto &entry = *node.entry;
      const auto path = tmp / node.path;
      switch (entry.kind) {
      case tracking::EntryKind::Tree:
        sfs::ensure_dir(path);
        break;
      case tracking::EntryKind::Mask:
        make_whiteout(path);
        break;
      case tracking::EntryKind::Symlink: {
        const auto blob = repo_.read_blob(entry.object);
        auto in = repo_.payloads().open_payload(blob.payload);
        const std::string link_target((std::istreambuf_iterator<char>(in)),
                                      std::istreambuf_iterator<char>());
        stdfs::create_symlink(link_target, path);
        break;
      }
      case tracking::EntryKind::Blob:
        copy_payload(repo_.payloads(), repo_.read_blob(entry.object).payload, path);
        break;
      }
    }
    // Modes go on last, deepest first, so read-only directories are filled before they lock.
    for (auto it = nodes.rbegin(); it != nodes.rend(); ++it) {
      const auto &entry = *it->entry;
      if (entry.kind == tracking::EntryKind::Symlink || entry.is_mask()) {
        continue;
      }
      const auto path = tmp / it->path;
      if (::chmod(path.c_str(), entry.mode & 07777) != 0) {
        spdlog::warn("chmod {} failed: {}", path.string(), std::strerror(errno));
      }
    }
  } catch (...) {
    sfs::remove_tree(tmp);
    throw;
  }

  std::error_code ec;
  stdfs::rename(tmp, target, ec);
  if (ec) {
    sfs::remove_tree(tmp);
    // another process published the same render first
    if (sfs::exists(target)) {
      return target;
    }
    throw std::runtime_error("publish render " + target.string() + " failed: " + ec.message());
  }
  spdlog::debug("rendered {} to {}", to_base32(manifest.digest()), target.string());
  return target;
}

void Renderer::remove_render(const Digest &manifest) const {
  const auto path = render_path(manifest);
  if (!sfs::exists(path)) {
    return;
  }
  // Move aside first so a half-deleted render is never visible under its digest.
  const auto doomed = sfs::temp_sibling(path);
  stdfs::rename(path, doomed);
  sfs::remove_tree(doomed);
  std::error_code ec;
  stdfs::remove(path.parent_path(), ec);
}

} // namespace strata

#include "strata/payload_store.hpp"

#include "strata/consts.hpp"
#include "strata/error.hpp"
#include "strata/fs.hpp"

#include <array>
#include <spdlog/spdlog.h>
#include <sstream>

namespace sfs = strata::fs;

namespace strata {

auto PayloadStore::write_payload(std::istream &in, std::uint64_t *size) const -> Digest {
  sfs::ensure_dir(root());
  const auto tmp = sfs::temp_sibling(root() / "incoming");
  Hasher hasher;
  std::uint64_t total = 0;
  try {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw std::runtime_error("open temp for write failed: " + tmp.string());
    }
    std::array<char, consts::kChunkSize> buf{};
    while (in) {
      in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
      const auto got = static_cast<std::size_t>(in.gcount());
      if (got == 0) {
        break;
      }
      hasher.update(std::span<const std::uint8_t>(
          reinterpret_cast<const std::uint8_t *>(buf.data()), got));
      out.write(buf.data(), static_cast<std::streamsize>(got));
      total += got;
    }
    if (in.bad()) {
      throw std::runtime_error("read failed while storing payload");
    }
    out.flush();
    if (!out) {
      throw std::runtime_error("write failed: " + tmp.string());
    }
  } catch (...) {
    std::error_code ec;
    std::filesystem::remove(tmp, ec);
    throw;
  }

  const auto digest = hasher.finish();
  const auto path = path_for(digest);
  std::error_code ec;
  if (sfs::exists(path)) {
    std::filesystem::remove(tmp, ec);
  } else {
    sfs::ensure_parent_dir(path);
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
      std::error_code ignored;
      std::filesystem::remove(tmp, ignored);
      throw std::runtime_error("publish payload failed: " + path.string() + ": " + ec.message());
    }
    spdlog::debug("wrote payload {} ({} bytes)", to_base32(digest), total);
  }
  if (size) {
    *size = total;
  }
  return digest;
}

auto PayloadStore::write_payload(std::string_view bytes, std::uint64_t *size) const -> Digest {
  std::istringstream in{std::string(bytes)};
  return write_payload(in, size);
}

auto PayloadStore::open_payload(const Digest &d) const -> std::ifstream {
  std::ifstream in(path_for(d), std::ios::binary);
  if (!in) {
    throw UnknownObjectError("payload " + to_base32(d));
  }
  return in;
}

void PayloadStore::remove_payload(const Digest &d) const {
  const auto path = path_for(d);
  std::error_code ec;
  if (!std::filesystem::remove(path, ec)) {
    if (ec) {
      throw std::runtime_error("remove failed: " + path.string() + ": " + ec.message());
    }
    throw UnknownObjectError("payload " + to_base32(d));
  }
  std::filesystem::remove(path.parent_path(), ec);
}

} // namespace strata

#include "strata/object_store.hpp"

#include "strata/error.hpp"
#include "strata/fs.hpp"

#include <spdlog/spdlog.h>

namespace sfs = strata::fs;

namespace strata {

auto ObjectStore::write_object(const graph::Object &obj) const -> Digest {
  const auto digest = graph::digest_of(obj);
  const auto path = path_for(digest);
  if (!sfs::exists(path)) {
    const auto encoded = graph::encode(obj);
    sfs::write_file_atomic(path, sfs::z_compress(encoded));
    spdlog::debug("wrote {} {}", graph::kind_name(graph::kind_of(obj)), to_base32(digest));
  }
  return digest;
}

auto ObjectStore::read_object(const Digest &d) const -> graph::Object {
  const auto path = path_for(d);
  if (!sfs::exists(path)) {
    throw UnknownObjectError(to_base32(d));
  }
  std::vector<std::uint8_t> raw;
  try {
    raw = sfs::z_decompress(sfs::read_file(path));
  } catch (const std::runtime_error &e) {
    throw DecodeError(to_base32(d) + ": " + e.what());
  }
  auto obj = graph::decode(raw);
  if (graph::digest_of(obj) != d) {
    throw DecodeError("object " + to_base32(d) + " does not match its digest");
  }
  return obj;
}

void ObjectStore::remove_object(const Digest &d) const {
  const auto path = path_for(d);
  std::error_code ec;
  if (!std::filesystem::remove(path, ec)) {
    if (ec) {
      throw std::runtime_error("remove failed: " + path.string() + ": " + ec.message());
    }
    throw UnknownObjectError(to_base32(d));
  }
  // Drop the fanout directory once it empties; ignore failure if it is not empty.
  std::filesystem::remove(path.parent_path(), ec);
}

} // namespace strata

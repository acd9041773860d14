#include "strata/graph.hpp"

#include "strata/consts.hpp"
#include "strata/error.hpp"

#include <algorithm>
#include <string>
#include <type_traits>

namespace strata::graph {

namespace {

template <class> inline constexpr bool kAlwaysFalse = false;

void encode_tree(encoding::Bytes &out, const tracking::Entry &tree) {
  encoding::write_uint(out, tree.entries.size());
  for (const auto &[name, child] : tree.entries) {
    encoding::write_uint(out, static_cast<std::uint64_t>(child.kind));
    encoding::write_uint(out, child.mode);
    encoding::write_uint(out, child.size);
    encoding::write_digest(out, child.object);
    encoding::write_string(out, name);
    if (child.is_tree()) {
      encode_tree(out, child);
    }
  }
}

void decode_tree(encoding::Reader &r, tracking::Entry &tree, int depth) {
  if (depth > 4096) {
    throw DecodeError("manifest nested too deeply");
  }
  const auto count = r.read_uint();
  for (std::uint64_t i = 0; i < count; ++i) {
    tracking::Entry child;
    const auto kind = r.read_uint();
    if (kind > static_cast<std::uint64_t>(tracking::EntryKind::Mask)) {
      throw DecodeError("bad entry kind " + std::to_string(kind));
    }
    child.kind = static_cast<tracking::EntryKind>(kind);
    child.mode = static_cast<std::uint32_t>(r.read_uint());
    child.size = r.read_uint();
    child.object = r.read_digest();
    auto name = r.read_string();
    if (name.empty() || name.find('/') != std::string::npos || name == "." || name == "..") {
      throw DecodeError("bad entry name '" + name + "'");
    }
    if (child.is_tree()) {
      decode_tree(r, child, depth + 1);
    }
    if (!tree.entries.emplace(std::move(name), std::move(child)).second) {
      throw DecodeError("duplicate entry name");
    }
  }
}

} // namespace

auto kind_name(ObjectKind kind) -> std::string_view {
  switch (kind) {
  case ObjectKind::Blob:
    return "blob";
  case ObjectKind::Manifest:
    return "manifest";
  case ObjectKind::Layer:
    return "layer";
  case ObjectKind::Platform:
    return "platform";
  }
  return "unknown";
}

auto kind_of(const Object &obj) -> ObjectKind {
  return static_cast<ObjectKind>(obj.index());
}

auto encode(const Object &obj) -> encoding::Bytes {
  encoding::Bytes out;
  encoding::write_header(out, consts::kObjectHeader);
  encoding::write_uint(out, static_cast<std::uint64_t>(kind_of(obj)));
  std::visit(
      [&out](const auto &o) {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, Blob>) {
          encoding::write_digest(out, o.payload);
          encoding::write_uint(out, o.size);
        } else if constexpr (std::is_same_v<T, Manifest>) {
          encode_tree(out, o.root());
        } else if constexpr (std::is_same_v<T, Layer>) {
          encoding::write_digest(out, o.manifest);
        } else if constexpr (std::is_same_v<T, Platform>) {
          encoding::write_uint(out, o.stack.size());
          for (const auto &d : o.stack) {
            encoding::write_digest(out, d);
          }
        } else {
          static_assert(kAlwaysFalse<T>, "unhandled object kind");
        }
      },
      obj);
  return out;
}

auto decode(std::span<const std::uint8_t> data) -> Object {
  encoding::Reader r(data);
  r.consume_header(consts::kObjectHeader);
  const auto kind = r.read_uint();
  Object out;
  switch (kind) {
  case static_cast<std::uint64_t>(ObjectKind::Blob): {
    Blob b;
    b.payload = r.read_digest();
    b.size = r.read_uint();
    out = b;
    break;
  }
  case static_cast<std::uint64_t>(ObjectKind::Manifest): {
    tracking::Entry root;
    decode_tree(r, root, 0);
    Manifest m(std::move(root));
    m.finalize();
    out = std::move(m);
    break;
  }
  case static_cast<std::uint64_t>(ObjectKind::Layer): {
    Layer l;
    l.manifest = r.read_digest();
    out = l;
    break;
  }
  case static_cast<std::uint64_t>(ObjectKind::Platform): {
    Platform p;
    const auto count = r.read_uint();
    if (count > data.size() / consts::kDigestSize) {
      throw DecodeError("platform stack length out of range");
    }
    p.stack.reserve(count);
    for (std::uint64_t i = 0; i < count; ++i) {
      p.stack.push_back(r.read_digest());
    }
    out = std::move(p);
    break;
  }
  default:
    throw DecodeError("unknown object kind " + std::to_string(kind));
  }
  if (!r.at_end()) {
    throw DecodeError("trailing bytes after object");
  }
  return out;
}

auto digest_of(const Object &obj) -> Digest {
  if (const auto *m = std::get_if<Manifest>(&obj)) {
    return m->digest();
  }
  return sha256(encode(obj));
}

auto child_objects(const Object &obj) -> std::vector<Digest> {
  return std::visit(
      [](const auto &o) -> std::vector<Digest> {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, Blob>) {
          return {};
        } else if constexpr (std::is_same_v<T, Manifest>) {
          // Distinct blob digests referenced by files and symlinks.
          std::vector<Digest> out;
          for (const auto &node : o.walk()) {
            if (node.entry->has_payload()) {
              out.push_back(node.entry->object);
            }
          }
          std::sort(out.begin(), out.end());
          out.erase(std::unique(out.begin(), out.end()), out.end());
          return out;
        } else if constexpr (std::is_same_v<T, Layer>) {
          return {o.manifest};
        } else {
          return o.stack;
        }
      },
      obj);
}

} // namespace strata::graph

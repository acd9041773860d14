#include "strata/diff.hpp"

#include <set>
#include <sstream>

namespace strata::tracking {

namespace {

Entry shallow(const Entry &e) {
  Entry out;
  out.kind = e.kind;
  out.mode = e.mode;
  out.size = e.size;
  out.object = e.object;
  return out;
}

std::string join(const std::string &prefix, const std::string &name) {
  return prefix.empty() ? name : prefix + "/" + name;
}

void diff_trees(const Entry *a, const Entry *b, const std::string &prefix,
                std::vector<Diff> &out) {
  std::set<std::string> names;
  if (a) {
    for (const auto &[name, _] : a->entries) {
      names.insert(name);
    }
  }
  if (b) {
    for (const auto &[name, _] : b->entries) {
      names.insert(name);
    }
  }

  for (const auto &name : names) {
    const Entry *ea = nullptr;
    const Entry *eb = nullptr;
    if (a) {
      auto it = a->entries.find(name);
      ea = it == a->entries.end() ? nullptr : &it->second;
    }
    if (b) {
      auto it = b->entries.find(name);
      eb = it == b->entries.end() ? nullptr : &it->second;
    }
    const auto path = join(prefix, name);

    if (eb && eb->is_mask()) {
      Diff d{DiffMode::Removed, path, std::nullopt, shallow(*eb)};
      if (ea) {
        d.a = shallow(*ea);
      }
      out.push_back(std::move(d));
      continue;
    }
    if (ea && !eb) {
      out.push_back({DiffMode::Removed, path, shallow(*ea), std::nullopt});
      if (ea->is_tree()) {
        diff_trees(ea, nullptr, path, out);
      }
      continue;
    }
    if (!ea && eb) {
      out.push_back({DiffMode::Added, path, std::nullopt, shallow(*eb)});
      if (eb->is_tree()) {
        diff_trees(nullptr, eb, path, out);
      }
      continue;
    }

    const auto mode = ea->same_node(*eb) ? DiffMode::Unchanged : DiffMode::Changed;
    out.push_back({mode, path, shallow(*ea), shallow(*eb)});
    if (ea->is_tree() || eb->is_tree()) {
      diff_trees(ea->is_tree() ? ea : nullptr, eb->is_tree() ? eb : nullptr, path, out);
    }
  }
}

} // namespace

std::vector<Diff> compute_diff(const Manifest &a, const Manifest &b) {
  std::vector<Diff> out;
  diff_trees(&a.root(), &b.root(), "", out);
  return out;
}

bool has_changes(const std::vector<Diff> &diffs) {
  for (const auto &d : diffs) {
    if (d.mode != DiffMode::Unchanged) {
      return true;
    }
  }
  return false;
}

std::string to_string(const Diff &diff) {
  std::ostringstream os;
  switch (diff.mode) {
  case DiffMode::Added:
    os << "+ " << diff.path;
    break;
  case DiffMode::Removed:
    os << "- " << diff.path;
    break;
  case DiffMode::Unchanged:
    os << "= " << diff.path;
    break;
  case DiffMode::Changed:
    os << "~ " << diff.path;
    if (diff.a && diff.b) {
      if (diff.a->mode != diff.b->mode) {
        os << " {mode " << std::oct << diff.a->mode << " => " << diff.b->mode << std::dec << "}";
      }
      if (diff.a->object != diff.b->object) {
        os << " {!content!}";
      }
    }
    break;
  }
  return os.str();
}

} // namespace strata::tracking

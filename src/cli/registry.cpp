#include "cli/registry.hpp"

#include <algorithm>
#include <iostream>
#include <map>
#include <stdexcept>

namespace strata::cli {

struct entry {
  command_fn fn;
  std::string help;
};
static std::map<std::string, entry> &table() {
  static std::map<std::string, entry> t;
  return t;
}

void register_command(const std::string &name, command_fn fn, const std::string &help) {
  if (!table().emplace(name, entry{.fn = fn, .help = help}).second) {
    throw std::logic_error("command registered twice: " + name);
  }
}

command_fn find_command(const std::string &name) {
  const auto it = table().find(name);
  return it == table().end() ? nullptr : it->second.fn;
}

void print_usage() {
  std::size_t width = 0;
  for (const auto &[name, e] : table()) {
    width = std::max(width, name.size());
  }
  std::cerr << "usage: strata [-v|--verbose] <command> [args]\n\n";
  std::cerr << "commands:\n";
  for (const auto &[name, e] : table()) {
    std::cerr << "  " << name << std::string(width - name.size() + 2, ' ') << e.help << "\n";
  }
  std::cerr << "\n-v raises logging to debug; STRATA_RUNTIME selects the active runtime.\n";
}

} // namespace strata::cli

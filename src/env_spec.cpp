#include "strata/env_spec.hpp"

#include "strata/consts.hpp"
#include "strata/error.hpp"

namespace strata::tracking {

auto EnvSpec::to_string() const -> std::string {
  std::string out;
  for (const auto &item : items) {
    if (!out.empty()) {
      out += consts::kEnvSpecSep;
    }
    out += item;
  }
  return out;
}

auto parse_env_spec(std::string_view text) -> EnvSpec {
  if (text.empty()) {
    throw InvalidReferenceError("empty environment spec");
  }
  EnvSpec spec;
  std::size_t start = 0;
  while (true) {
    const auto sep = text.find(consts::kEnvSpecSep, start);
    const auto item = text.substr(start, sep == std::string_view::npos ? text.npos : sep - start);
    if (item.empty()) {
      throw InvalidReferenceError("empty component in environment spec '" + std::string(text) +
                                  "'");
    }
    spec.items.emplace_back(item);
    if (sep == std::string_view::npos) {
      break;
    }
    start = sep + 1;
  }
  return spec;
}

} // namespace strata::tracking

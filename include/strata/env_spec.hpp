#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace strata::tracking {

// `ref1+ref2+...`: an ordered request for tags or digests, bottom first.
struct EnvSpec {
  std::vector<std::string> items;

  [[nodiscard]] auto to_string() const -> std::string;
};

// Throws InvalidReferenceError for an empty spec or an empty component.
auto parse_env_spec(std::string_view text) -> EnvSpec;

} // namespace strata::tracking

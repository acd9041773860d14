#pragma once
#include <string_view>

namespace strata::log {

// Configure spdlog's default logger to write to stderr at `level`
// ("trace", "debug", "info", "warn", "error", "off"). Unknown levels
// fall back to info.
void init(std::string_view level);

} // namespace strata::log

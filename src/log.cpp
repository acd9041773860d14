#include "strata/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <string>

namespace strata::log {

void init(std::string_view level) {
  auto logger = spdlog::get("strata");
  if (!logger) {
    logger = spdlog::stderr_color_mt("strata");
    logger->set_pattern("%^%l%$: %v");
    spdlog::set_default_logger(logger);
  }
  const auto parsed = spdlog::level::from_str(std::string(level));
  // from_str maps unrecognised names to "off"
  if (parsed == spdlog::level::off && level != "off") {
    spdlog::set_level(spdlog::level::info);
  } else {
    spdlog::set_level(parsed);
  }
}

} // namespace strata::log

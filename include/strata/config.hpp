#pragma once
#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace strata {

// Ordered "key: value" pairs as read from a config-style file.
using KeyValues = std::vector<std::pair<std::string, std::string>>;

// Parse "key: value" lines; blank lines and '#' comments are skipped.
auto parse_key_values(std::string_view text) -> KeyValues;
auto format_key_values(const KeyValues& kv) -> std::string;

struct Config {
  std::filesystem::path storage_root;
  std::filesystem::path runtime_root;
  std::filesystem::path mount_point;
  std::size_t max_layers = 0;
  std::string log_level = "info";
  std::string user;
  std::string host;
  // remote name -> repository path
  std::map<std::string, std::filesystem::path> remotes;
};

// Defaults with user/host taken from the environment.
auto default_config() -> Config;

// $STRATA_CONFIG, else ~/.config/strata/config
auto config_path() -> std::filesystem::path;

// Defaults overlaid with the file at `path` (if it exists).
auto load_config(const std::filesystem::path& path) -> Config;

// Apply STRATA_* environment overrides in place.
void apply_env_overrides(Config& cfg);

// load_config(config_path()) + apply_env_overrides
auto load_config() -> Config;

void save_config(const std::filesystem::path& path, const Config& cfg);

} // namespace strata

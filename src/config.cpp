#include "strata/config.hpp"

#include "strata/consts.hpp"
#include "strata/error.hpp"
#include "strata/fs.hpp"

#include <cstdlib>
#include <sstream>
#include <unistd.h>

namespace {

std::string trim(std::string_view sv) {
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    sv.remove_prefix(1);
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    sv.remove_suffix(1);
  return std::string(sv);
}

std::string env_or(std::string_view name, std::string fallback) {
  const char *v = std::getenv(std::string(name).c_str());
  return (v && *v) ? std::string(v) : std::move(fallback);
}

std::filesystem::path home_dir() { return env_or("HOME", "/tmp"); }

constexpr std::string_view kRemotePrefix = "remote.";

} // namespace

namespace strata {

auto parse_key_values(std::string_view text) -> KeyValues {
  KeyValues out;
  std::istringstream iss{std::string(text)};
  std::string line;
  while (std::getline(iss, line)) {
    const auto t = trim(line);
    if (t.empty() || t[0] == '#')
      continue; // allow comments
    const auto colon = t.find(':');
    if (colon == std::string::npos) {
      throw Error("malformed config line: " + t);
    }
    out.emplace_back(trim(std::string_view(t).substr(0, colon)),
                     trim(std::string_view(t).substr(colon + 1)));
  }
  return out;
}

auto format_key_values(const KeyValues &kv) -> std::string {
  std::ostringstream os;
  for (const auto &[k, v] : kv) {
    os << k << ": " << v << '\n';
  }
  return os.str();
}

auto default_config() -> Config {
  Config cfg;
  cfg.storage_root = home_dir() / ".local" / "share" / "strata";
  cfg.runtime_root = std::string(consts::kDefaultRuntimeRoot);
  cfg.mount_point = std::string(consts::kDefaultMountPoint);
  cfg.max_layers = consts::kDefaultMaxLayers;
  cfg.user = env_or("USER", "unknown");
  char host[256] = {};
  cfg.host = ::gethostname(host, sizeof(host) - 1) == 0 && host[0] ? host : "localhost";
  return cfg;
}

auto config_path() -> std::filesystem::path {
  const auto explicit_path = env_or(consts::kEnvConfig, "");
  if (!explicit_path.empty()) {
    return explicit_path;
  }
  return home_dir() / ".config" / "strata" / "config";
}

auto load_config(const std::filesystem::path &path) -> Config {
  Config cfg = default_config();
  if (!fs::exists(path))
    return cfg;

  for (const auto &[key, value] : parse_key_values(fs::read_text(path))) {
    if (key == "storage_root") {
      cfg.storage_root = value;
    } else if (key == "runtime_root") {
      cfg.runtime_root = value;
    } else if (key == "mount_point") {
      cfg.mount_point = value;
    } else if (key == "max_layers") {
      try {
        cfg.max_layers = static_cast<std::size_t>(std::stoul(value));
      } catch (const std::exception &) {
        throw Error("max_layers must be a number, got '" + value + "'");
      }
      if (cfg.max_layers == 0) {
        throw Error("max_layers must be positive");
      }
    } else if (key == "log_level") {
      cfg.log_level = value;
    } else if (key == "user") {
      cfg.user = value;
    } else if (key == "host") {
      cfg.host = value;
    } else if (key.rfind(kRemotePrefix, 0) == 0 && key.size() > kRemotePrefix.size()) {
      cfg.remotes[key.substr(kRemotePrefix.size())] = value;
    } else {
      throw Error("unknown config key '" + key + "' in " + path.string());
    }
  }
  return cfg;
}

void apply_env_overrides(Config &cfg) {
  cfg.storage_root = env_or(consts::kEnvStorageRoot, cfg.storage_root.string());
  cfg.runtime_root = env_or(consts::kEnvRuntimeRoot, cfg.runtime_root.string());
  cfg.mount_point = env_or(consts::kEnvMountPoint, cfg.mount_point.string());
  cfg.log_level = env_or(consts::kEnvLogLevel, cfg.log_level);
}

auto load_config() -> Config {
  auto cfg = load_config(config_path());
  apply_env_overrides(cfg);
  return cfg;
}

void save_config(const std::filesystem::path &path, const Config &cfg) {
  KeyValues kv{
      {"storage_root", cfg.storage_root.string()},
      {"runtime_root", cfg.runtime_root.string()},
      {"mount_point", cfg.mount_point.string()},
      {"max_layers", std::to_string(cfg.max_layers)},
      {"log_level", cfg.log_level},
      {"user", cfg.user},
      {"host", cfg.host},
  };
  for (const auto &[name, p] : cfg.remotes) {
    kv.emplace_back(std::string(kRemotePrefix) + name, p.string());
  }
  fs::write_text_atomic(path, format_key_values(kv));
}

} // namespace strata

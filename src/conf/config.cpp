// conf/config.cpp - Configuration implementation
#include "config.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace rip {

static std::string env_or_empty(const char *name) {
  const char *value = std::getenv(name);
  return value ? std::string(value) : std::string();
}

static void trim(std::string &value, const char *chars) {
  value.erase(0, value.find_first_not_of(chars));
  value.erase(value.find_last_not_of(chars) + 1);
}

fs::path default_config_path() {
  std::string config_home = env_or_empty(XDG_CONFIG_HOME_ENV);
  if (config_home.empty()) {
    std::string home = env_or_empty("HOME");
    if (home.empty()) {
      return fs::path();
    }
    config_home = (fs::path(home) / ".config").string();
  }
  return fs::path(config_home) / CONFIG_SUBDIR / CONFIG_FILENAME;
}

std::string current_user() {
  std::string user = env_or_empty("USER");
  return user.empty() ? "unknown" : user;
}

Config Config::load_default() {
  Config config;
  fs::path default_path = default_config_path();
  if (!default_path.empty() && fs::exists(default_path)) {
    try {
      return from_file(default_path);
    } catch (const std::exception &e) {
      LOG_WARN("Failed to load " + default_path.string() +
               ", using defaults: " + e.what());
    }
  }
  return config;
}

Config Config::from_file(const fs::path &path) {
  Config config;

  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open config file " + path.string());
  }

  std::string line;
  std::size_t line_no = 0;
  while (std::getline(file, line)) {
    ++line_no;
    trim(line, " \t");
    if (line.empty() || line[0] == '#')
      continue;

    auto eq_pos = line.find('=');
    if (eq_pos == std::string::npos) {
      LOG_WARN("Ignoring malformed line " + std::to_string(line_no) + " in " +
               path.string());
      continue;
    }

    std::string key = line.substr(0, eq_pos);
    std::string value = line.substr(eq_pos + 1);
    trim(key, " \t");
    trim(value, " \t\"");

    if (key == "graveyard") {
      config.graveyard = value;
    } else if (key == "max_depth") {
      try {
        config.max_depth = static_cast<std::size_t>(std::stoul(value));
      } catch (const std::exception &) {
        throw std::runtime_error("Invalid max_depth '" + value + "' in " +
                                 path.string());
      }
    } else if (key == "verbose") {
      config.verbose = (value == "true");
    } else if (key == "inspect") {
      config.inspect = (value == "true");
    } else if (key == "log_file") {
      config.log_file = value;
    } else {
      LOG_WARN("Unknown config key '" + key + "' in " + path.string());
    }
  }

  return config;
}

bool Config::save_to_file(const fs::path &path) const {
  if (path.has_parent_path() && !ensure_dir_exists(path.parent_path())) {
    return false;
  }

  std::ofstream file(path);
  if (!file.is_open()) {
    return false;
  }

  file << "# rip configuration\n";
  if (!graveyard.empty()) {
    file << "graveyard = \"" << graveyard.string() << "\"\n";
  }
  file << "max_depth = " << max_depth << "\n";
  file << "verbose = " << (verbose ? "true" : "false") << "\n";
  file << "inspect = " << (inspect ? "true" : "false") << "\n";
  if (!log_file.empty()) {
    file << "log_file = \"" << log_file.string() << "\"\n";
  }

  return static_cast<bool>(file);
}

void Config::merge_with_cli(std::size_t max_depth_override,
                            bool verbose_override, bool inspect_override) {
  if (max_depth_override != 0) {
    max_depth = max_depth_override;
  }
  if (verbose_override) {
    verbose = true;
  }
  if (inspect_override) {
    inspect = true;
  }
}

fs::path Config::resolve_graveyard(const fs::path &cli_override) const {
  if (!cli_override.empty()) {
    return cli_override;
  }

  std::string env = env_or_empty(GRAVEYARD_ENV);
  if (!env.empty()) {
    return env;
  }

  if (!graveyard.empty()) {
    return graveyard;
  }

  std::string data_home = env_or_empty(XDG_DATA_HOME_ENV);
  if (!data_home.empty()) {
    return fs::path(data_home) / XDG_GRAVEYARD_NAME;
  }

  return std::string(DEFAULT_GRAVEYARD_PREFIX) + "-" + current_user();
}

} // namespace rip

// conf/config.hpp - Configuration management
#pragma once

#include "../defs.hpp"
#include <cstddef>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace rip {

struct Config {
  fs::path graveyard;
  std::size_t max_depth = DEFAULT_MAX_DEPTH;
  bool verbose = false;
  bool inspect = false;
  fs::path log_file;

  static Config load_default();
  static Config from_file(const fs::path &path);
  bool save_to_file(const fs::path &path) const;

  // A zero max depth leaves the configured value in place
  void merge_with_cli(std::size_t max_depth_override, bool verbose_override,
                      bool inspect_override);

  // --graveyard, then $GRAVEYARD, then the config file, then
  // $XDG_DATA_HOME/graveyard, then /tmp/graveyard-$USER
  fs::path resolve_graveyard(const fs::path &cli_override) const;
};

fs::path default_config_path();
std::string current_user();

} // namespace rip

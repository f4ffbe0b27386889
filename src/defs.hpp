// Constants and definitions
#pragma once

#include <cstddef>
#include <cstdint>

namespace rip {

constexpr const char *VERSION = "0.9.0";

// Directories
constexpr const char *DEFAULT_GRAVEYARD_PREFIX = "/tmp/graveyard";
constexpr const char *XDG_GRAVEYARD_NAME = "graveyard";
constexpr const char *CONFIG_SUBDIR = "rip";
constexpr const char *CONFIG_FILENAME = "config.toml";

// Environment
constexpr const char *GRAVEYARD_ENV = "GRAVEYARD";
constexpr const char *XDG_DATA_HOME_ENV = "XDG_DATA_HOME";
constexpr const char *XDG_CONFIG_HOME_ENV = "XDG_CONFIG_HOME";

// Record log, kept at the top of the graveyard
constexpr const char *RECORD_FILE_NAME = ".record";
constexpr const char *RECORD_TIME_FORMAT = "%a %b %e %T %Y";

// Inspection
constexpr std::size_t LINES_TO_INSPECT = 6;
constexpr std::size_t FILES_TO_INSPECT = 6;

// Files above 500 MiB are considered large
constexpr std::uintmax_t BIG_FILE_THRESHOLD = 500ULL * 1024 * 1024;

// $HOME/.local/share/graveyard is already fairly deep
constexpr std::size_t DEFAULT_MAX_DEPTH = 10;

constexpr const char *SPECIAL_FILE_MARKER =
    "This is a marker for a file that was permanently deleted.  "
    "Requiescat in pace.";

} // namespace rip

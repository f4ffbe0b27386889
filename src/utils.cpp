// utils.cpp - Utility functions implementation
#include "utils.hpp"
#include <array>
#include <iostream>
#include <system_error>

namespace rip {

// Logger implementation
Logger &Logger::getInstance() {
  static Logger instance;
  return instance;
}

void Logger::init(bool verbose, const fs::path &log_path) {
  verbose_ = verbose;
  log_file_.reset();

  if (!log_path.empty()) {
    if (log_path.has_parent_path()) {
      ensure_dir_exists(log_path.parent_path());
    }
    log_file_ = std::make_unique<std::ofstream>(log_path, std::ios::app);
  }
}

void Logger::log(const std::string &level, const std::string &message) {
  // Skip DEBUG messages if not in verbose mode
  if (level == "DEBUG" && !verbose_) {
    return;
  }

  std::string log_line = "[" +
                         format_local_time(std::time(nullptr),
                                           "%Y-%m-%d %H:%M:%S") +
                         "] [" + level + "] " + message + "\n";

  if (log_file_ && log_file_->is_open()) {
    *log_file_ << log_line;
    log_file_->flush();
  }

  std::cerr << log_line;
}

// File system utilities
bool ensure_dir_exists(const fs::path &path) {
  try {
    if (!fs::exists(path)) {
      fs::create_directories(path);
    }
    return true;
  } catch (const std::exception &e) {
    LOG_ERROR("Failed to create directory " + path.string() + ": " + e.what());
    return false;
  }
}

std::uintmax_t tree_size(const fs::path &path) {
  std::error_code ec;
  auto status = fs::symlink_status(path, ec);
  if (ec) {
    return 0;
  }
  if (fs::is_regular_file(status)) {
    auto size = fs::file_size(path, ec);
    return ec ? 0 : size;
  }
  if (!fs::is_directory(status)) {
    return 0;
  }

  std::uintmax_t total = 0;
  for (fs::recursive_directory_iterator
           it(path, fs::directory_options::skip_permission_denied, ec),
       end;
       !ec && it != end; it.increment(ec)) {
    std::error_code size_ec;
    if (it->is_regular_file(size_ec) && !it->is_symlink(size_ec)) {
      auto size = it->file_size(size_ec);
      if (!size_ec) {
        total += size;
      }
    }
  }
  return total;
}

// Formatting
std::string humanize_bytes(std::uintmax_t bytes) {
  static const std::array<const char *, 5> units = {"bytes", "KB", "MB", "GB",
                                                    "TB"};
  // Largest unit that still leaves more than ten of it
  std::size_t unit = 0;
  std::uintmax_t scaled = bytes;
  std::uintmax_t divisor = 1;
  for (std::size_t i = 0; i < units.size(); ++i) {
    if (bytes / divisor <= 10) {
      break;
    }
    unit = i;
    scaled = bytes / divisor;
    if (i + 1 < units.size()) {
      divisor *= 1000;
    }
  }
  return std::to_string(scaled) + " " + units[unit];
}

std::string format_local_time(std::time_t when, const char *format) {
  std::tm local{};
  localtime_r(&when, &local);
  char time_buf[64];
  std::size_t len = std::strftime(time_buf, sizeof(time_buf), format, &local);
  return std::string(time_buf, len);
}

} // namespace rip

// core/mover.cpp - Relocation implementation
#include "mover.hpp"
#include "../utils.hpp"
#include "errors.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sys/stat.h>
#include <utility>
#include <vector>

namespace rip {

static void throw_io(const fs::path &path, const std::string &phase,
                     const std::string &detail) {
  throw RipError(ErrorKind::IoFailure, path, phase, detail);
}

static fs::perms mode_perms(mode_t mode) {
  return static_cast<fs::perms>(mode & 07777);
}

static void write_marker(const fs::path &dest) {
  std::ofstream marker(dest, std::ios::binary | std::ios::trunc);
  if (!marker.is_open()) {
    throw_io(dest, "write marker", std::strerror(errno));
  }
  marker << SPECIAL_FILE_MARKER;
  marker.flush();
  if (!marker) {
    throw_io(dest, "write marker", "write failed");
  }
}

void copy_entry(const fs::path &source, const fs::path &dest,
                const ConfirmFn &confirm, const MoveOptions &options) {
  struct stat st;
  if (lstat(source.c_str(), &st) != 0) {
    throw RipError(errno == ENOENT ? ErrorKind::NotFound : ErrorKind::IoFailure,
                   source, "stat", std::strerror(errno));
  }

  std::error_code ec;
  if (S_ISREG(st.st_mode)) {
    auto size = static_cast<std::uintmax_t>(st.st_size);
    if (size > options.big_file_threshold) {
      if (confirm("About to copy a big file (" + source.string() + " is " +
                  humanize_bytes(size) +
                  "). Permanently delete this file instead?")) {
        LOG_INFO("Not copying " + source.string() +
                 ", it will be deleted outright");
        return;
      }
    }
    fs::copy_file(source, dest, fs::copy_options::none, ec);
    if (ec) {
      throw_io(source, "copy", "to " + dest.string() + ": " + ec.message());
    }
    fs::permissions(dest, mode_perms(st.st_mode), ec);
    if (ec) {
      LOG_WARN("Failed to copy permissions to " + dest.string() + ": " +
               ec.message());
    }
  } else if (S_ISLNK(st.st_mode)) {
    fs::path target = fs::read_symlink(source, ec);
    if (ec) {
      throw_io(source, "read symlink", ec.message());
    }
    fs::create_symlink(target, dest, ec);
    if (ec) {
      throw_io(dest, "create symlink", ec.message());
    }
  } else if (S_ISFIFO(st.st_mode)) {
    if (mkfifo(dest.c_str(), st.st_mode & 07777) != 0) {
      throw_io(dest, "create fifo", std::strerror(errno));
    }
    // mkfifo is subject to the umask
    fs::permissions(dest, mode_perms(st.st_mode), ec);
    if (ec) {
      LOG_WARN("Failed to copy permissions to " + dest.string() + ": " +
               ec.message());
    }
  } else {
    // Device nodes, sockets
    if (!confirm("Non-regular file or directory: " + source.string() +
                 ". Permanently delete the file?")) {
      throw RipError(ErrorKind::SpecialFileDeclined, source, "copy",
                     "cannot copy special file");
    }
    write_marker(dest);
  }
}

void copy_then_remove(const fs::path &source, const fs::path &dest,
                      const ConfirmFn &confirm, const MoveOptions &options) {
  std::error_code ec;
  auto status = fs::symlink_status(source, ec);
  if (ec || !fs::exists(status)) {
    throw RipError(ErrorKind::NotFound, source, "stat",
                   ec ? ec.message() : "no such file or directory");
  }

  if (dest.has_parent_path() && !ensure_dir_exists(dest.parent_path())) {
    throw_io(dest.parent_path(), "create parent", "cannot create directory");
  }

  if (!fs::is_directory(status)) {
    copy_entry(source, dest, confirm, options);
    fs::remove(source, ec);
    if (ec) {
      throw_io(source, "remove source", ec.message());
    }
    return;
  }

  // Directory modes are applied last so read-only directories can be filled
  std::vector<std::pair<fs::path, fs::perms>> dir_modes;

  fs::create_directory(dest, ec);
  if (ec) {
    throw_io(dest, "create directory", ec.message());
  }
  dir_modes.emplace_back(dest, status.permissions());

  fs::recursive_directory_iterator it(source, ec), end;
  if (ec) {
    throw_io(source, "walk", ec.message());
  }
  for (; it != end; it.increment(ec)) {
    if (ec) {
      throw_io(source, "walk", ec.message());
    }
    const fs::path &entry = it->path();
    fs::path target = dest / entry.lexically_relative(source);
    auto entry_status = it->symlink_status(ec);
    if (ec) {
      throw_io(entry, "stat", ec.message());
    }

    if (fs::is_directory(entry_status)) {
      fs::create_directory(target, ec);
      if (ec) {
        throw_io(target, "create directory", ec.message());
      }
      dir_modes.emplace_back(target, entry_status.permissions());
    } else {
      copy_entry(entry, target, confirm, options);
    }
  }
  if (ec) {
    throw_io(source, "walk", ec.message());
  }

  for (auto mode = dir_modes.rbegin(); mode != dir_modes.rend(); ++mode) {
    fs::permissions(mode->first, mode->second, ec);
    if (ec) {
      LOG_WARN("Failed to copy permissions to " + mode->first.string() + ": " +
               ec.message());
    }
  }

  fs::remove_all(source, ec);
  if (ec) {
    throw_io(source, "remove source", ec.message());
  }
}

void relocate(const fs::path &source, const fs::path &dest,
              const ConfirmFn &confirm, const MoveOptions &options) {
  if (dest.has_parent_path() && !ensure_dir_exists(dest.parent_path())) {
    throw_io(dest.parent_path(), "create parent", "cannot create directory");
  }

  std::error_code ec;
  fs::rename(source, dest, ec);
  if (!ec) {
    LOG_DEBUG("Renamed " + source.string() + " -> " + dest.string());
    return;
  }

  if (ec != std::errc::cross_device_link) {
    throw_io(source, "rename", "to " + dest.string() + ": " + ec.message());
  }

  LOG_DEBUG("Cross-device move, copying " + source.string() + " -> " +
            dest.string());
  copy_then_remove(source, dest, confirm, options);
}

} // namespace rip

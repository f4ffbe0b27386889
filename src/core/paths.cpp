// core/paths.cpp - Grave path resolution implementation
#include "paths.hpp"
#include "../utils.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cstdint>
#include <limits>
#include <sys/stat.h>

namespace rip {

fs::path normalize_path(fs::path path) {
  path = path.lexically_normal();
  if (path.has_relative_path() && path.filename().empty()) {
    path = path.parent_path();
  }
  return path;
}

bool entry_exists(const fs::path &path) {
  struct stat st;
  return lstat(path.c_str(), &st) == 0;
}

bool is_under(const fs::path &path, const fs::path &directory) {
  fs::path p = normalize_path(path);
  fs::path d = normalize_path(directory);
  return std::mismatch(d.begin(), d.end(), p.begin(), p.end()).first ==
         d.end();
}

fs::path grave_path_for(const fs::path &graveyard, const fs::path &original) {
  if (original.has_root_directory() || original.has_root_name()) {
    return graveyard / original.relative_path();
  }
  return graveyard / original;
}

fs::path resolve_conflict(const fs::path &candidate) {
  if (!entry_exists(candidate)) {
    return candidate;
  }

  const std::string name = candidate.string();
  for (std::uint64_t i = 1; i < std::numeric_limits<std::uint64_t>::max();
       ++i) {
    fs::path renamed = name + "~" + std::to_string(i);
    if (!entry_exists(renamed)) {
      return renamed;
    }
  }

  throw RipError(ErrorKind::ConflictResolutionExhausted, candidate,
                 "resolve conflict", "no free numeric suffix left");
}

std::optional<fs::path> find_blocking_ancestor(const fs::path &candidate) {
  for (fs::path ancestor = candidate; !ancestor.empty();
       ancestor = ancestor.parent_path()) {
    std::error_code ec;
    // A dangling symlink blocks as well as a plain file does
    if (entry_exists(ancestor) && !fs::is_directory(ancestor, ec)) {
      return ancestor;
    }
    if (ancestor == ancestor.parent_path()) {
      break;
    }
  }
  return std::nullopt;
}

void prune_empty_parents(const fs::path &path, const fs::path &stop) {
  const fs::path root = normalize_path(stop);
  for (fs::path dir = normalize_path(path).parent_path();
       dir != root && is_under(dir, root); dir = dir.parent_path()) {
    std::error_code ec;
    if (!fs::is_empty(dir, ec) || ec || !fs::remove(dir, ec)) {
      break;
    }
    LOG_DEBUG("Removed empty directory " + dir.string());
  }
}

fs::path resolve_grave_destination(const fs::path &candidate) {
  if (entry_exists(candidate)) {
    fs::path renamed = resolve_conflict(candidate);
    LOG_DEBUG("Grave " + candidate.string() + " taken, using " +
              renamed.string());
    return renamed;
  }

  if (auto ancestor = find_blocking_ancestor(candidate)) {
    fs::path renamed_ancestor = resolve_conflict(*ancestor);
    fs::path relative = candidate.lexically_relative(*ancestor);
    LOG_DEBUG("Ancestor " + ancestor->string() + " is a file, re-rooting " +
              candidate.string() + " under " + renamed_ancestor.string());
    return renamed_ancestor / relative;
  }

  return candidate;
}

} // namespace rip

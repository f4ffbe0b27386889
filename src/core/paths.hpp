// core/paths.hpp - Mapping between original paths and graves
#pragma once

#include <filesystem>
#include <optional>

namespace fs = std::filesystem;

namespace rip {

// lexically_normal without a trailing separator
fs::path normalize_path(fs::path path);

// lstat-based: a dangling symlink exists
bool entry_exists(const fs::path &path);

// Component-wise prefix test; a path is under itself
bool is_under(const fs::path &path, const fs::path &directory);

// Concatenate even if original is absolute
fs::path grave_path_for(const fs::path &graveyard, const fs::path &original);

// candidate, or the first free candidate~N
fs::path resolve_conflict(const fs::path &candidate);

// First ancestor (the path itself included) that exists as a non-directory
std::optional<fs::path> find_blocking_ancestor(const fs::path &candidate);

// Remove empty directories above path, stopping at (and keeping) stop
void prune_empty_parents(const fs::path &path, const fs::path &stop);

fs::path resolve_grave_destination(const fs::path &candidate);

} // namespace rip

// core/glob.hpp - Shell-glob selection of graves
#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace rip {

// '*', '?', '[', '{' anywhere or a leading '!'
bool has_glob_chars(const std::string &target);

// {a,b{c,d}} -> a, bc, bd
std::vector<std::string> expand_braces(const std::string &pattern);

// Match a '/'-separated relative path. A pattern without '/' is tried
// against the last component only.
bool glob_match(const std::string &pattern, const std::string &relative_path);

// Walks base at most max_depth levels deep and returns matching entries as
// absolute paths in walk order. Whitespace separates several patterns; a
// leading '!' excludes (excluded directories are not descended into).
std::vector<fs::path> expand(const std::string &pattern,
                             const fs::path &base_directory,
                             std::size_t max_depth);
std::vector<fs::path> expand(const std::vector<std::string> &patterns,
                             const fs::path &base_directory,
                             std::size_t max_depth);

} // namespace rip

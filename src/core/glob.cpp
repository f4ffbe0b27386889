// core/glob.cpp - Glob expansion implementation
#include "glob.hpp"
#include "../utils.hpp"
#include <fnmatch.h>
#include <sstream>

namespace rip {

namespace {

struct PatternSet {
  std::vector<std::string> include;
  std::vector<std::string> exclude;
};

std::vector<std::string> split_segments(const std::string &path) {
  std::vector<std::string> segments;
  std::stringstream ss(path);
  std::string segment;
  while (std::getline(ss, segment, '/')) {
    if (!segment.empty() && segment != ".") {
      segments.push_back(segment);
    }
  }
  return segments;
}

bool match_segments(const std::vector<std::string> &pattern, std::size_t pi,
                    const std::vector<std::string> &path, std::size_t si) {
  if (pi == pattern.size()) {
    return si == path.size();
  }

  if (pattern[pi] == "**") {
    // Zero or more whole segments
    for (std::size_t skip = si; skip <= path.size(); ++skip) {
      if (match_segments(pattern, pi + 1, path, skip)) {
        return true;
      }
    }
    return false;
  }

  if (si == path.size()) {
    return false;
  }

  return fnmatch(pattern[pi].c_str(), path[si].c_str(), 0) == 0 &&
         match_segments(pattern, pi + 1, path, si + 1);
}

PatternSet build_pattern_set(const std::vector<std::string> &patterns) {
  PatternSet set;
  for (const auto &raw : patterns) {
    if (raw.empty()) {
      continue;
    }
    bool negated = raw[0] == '!';
    std::string body = negated ? raw.substr(1) : raw;
    if (body.empty()) {
      continue;
    }
    for (auto &alternative : expand_braces(body)) {
      (negated ? set.exclude : set.include).push_back(std::move(alternative));
    }
  }
  return set;
}

bool any_match(const std::vector<std::string> &patterns,
               const std::string &relative_path) {
  for (const auto &pattern : patterns) {
    if (glob_match(pattern, relative_path)) {
      return true;
    }
  }
  return false;
}

} // namespace

bool has_glob_chars(const std::string &target) {
  if (!target.empty() && target[0] == '!') {
    return true;
  }
  return target.find_first_of("*?[{") != std::string::npos;
}

std::vector<std::string> expand_braces(const std::string &pattern) {
  // Locate the first top-level {...} group
  std::size_t open = std::string::npos;
  std::size_t close = std::string::npos;
  std::vector<std::size_t> commas;
  int depth = 0;
  for (std::size_t i = 0; i < pattern.size(); ++i) {
    char c = pattern[i];
    if (c == '\\') {
      ++i;
      continue;
    }
    if (c == '{') {
      if (depth == 0) {
        open = i;
        commas.clear();
      }
      ++depth;
    } else if (c == '}' && depth > 0) {
      --depth;
      if (depth == 0) {
        close = i;
        break;
      }
    } else if (c == ',' && depth == 1) {
      commas.push_back(i);
    }
  }

  if (open == std::string::npos || close == std::string::npos) {
    return {pattern};
  }

  std::string prefix = pattern.substr(0, open);
  std::string suffix = pattern.substr(close + 1);
  std::vector<std::string> alternatives;
  std::size_t start = open + 1;
  for (std::size_t comma : commas) {
    alternatives.push_back(pattern.substr(start, comma - start));
    start = comma + 1;
  }
  alternatives.push_back(pattern.substr(start, close - start));

  std::vector<std::string> result;
  for (const auto &alternative : alternatives) {
    // Nested groups and later groups are handled by recursion
    for (auto &expanded : expand_braces(prefix + alternative + suffix)) {
      result.push_back(std::move(expanded));
    }
  }
  return result;
}

bool glob_match(const std::string &pattern, const std::string &relative_path) {
  std::string body = pattern;
  bool anchored = false;
  if (!body.empty() && body[0] == '/') {
    body.erase(0, 1);
    anchored = true;
  }
  if (body.find('/') != std::string::npos) {
    anchored = true;
  }

  auto path_segments = split_segments(relative_path);
  if (path_segments.empty()) {
    return false;
  }

  if (!anchored) {
    return fnmatch(body.c_str(), path_segments.back().c_str(), 0) == 0;
  }

  return match_segments(split_segments(body), 0, path_segments, 0);
}

std::vector<fs::path> expand(const std::vector<std::string> &patterns,
                             const fs::path &base_directory,
                             std::size_t max_depth) {
  std::vector<fs::path> matches;
  PatternSet set = build_pattern_set(patterns);
  if (set.include.empty() || max_depth == 0) {
    return matches;
  }

  std::error_code ec;
  if (!fs::is_directory(base_directory, ec)) {
    LOG_DEBUG("Glob base " + base_directory.string() + " is not a directory");
    return matches;
  }

  fs::recursive_directory_iterator
      it(base_directory, fs::directory_options::skip_permission_denied, ec),
      end;
  for (; !ec && it != end; it.increment(ec)) {
    std::size_t depth = static_cast<std::size_t>(it.depth()) + 1;
    std::error_code type_ec;
    bool is_dir = fs::is_directory(it->symlink_status(type_ec));
    if (is_dir && depth >= max_depth) {
      it.disable_recursion_pending();
    }

    std::string relative =
        it->path().lexically_relative(base_directory).generic_string();

    if (any_match(set.exclude, relative)) {
      if (is_dir) {
        it.disable_recursion_pending();
      }
      continue;
    }

    if (any_match(set.include, relative)) {
      matches.push_back(it->path());
    }
  }

  if (ec) {
    LOG_WARN("Glob walk under " + base_directory.string() +
             " stopped early: " + ec.message());
  }

  return matches;
}

std::vector<fs::path> expand(const std::string &pattern,
                             const fs::path &base_directory,
                             std::size_t max_depth) {
  std::vector<std::string> patterns;
  std::stringstream ss(pattern);
  std::string word;
  while (ss >> word) {
    patterns.push_back(word);
  }
  return expand(patterns, base_directory, max_depth);
}

} // namespace rip

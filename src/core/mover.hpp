// core/mover.hpp - Physical relocation of files and directory trees
#pragma once

#include "../defs.hpp"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

namespace fs = std::filesystem;

namespace rip {

using ConfirmFn = std::function<bool(const std::string &message)>;

struct MoveOptions {
  std::uintmax_t big_file_threshold = BIG_FILE_THRESHOLD;
};

using RelocateFn =
    std::function<void(const fs::path &source, const fs::path &dest,
                       const ConfirmFn &confirm, const MoveOptions &options)>;

// Rename source to dest, falling back to copy-then-delete across devices.
// Throws RipError; the caller removes any partial dest on failure.
void relocate(const fs::path &source, const fs::path &dest,
              const ConfirmFn &confirm, const MoveOptions &options = {});

// The cross-device path of relocate(): copy everything, then remove source
void copy_then_remove(const fs::path &source, const fs::path &dest,
                      const ConfirmFn &confirm,
                      const MoveOptions &options = {});

// Copy a single non-directory entry without following symlinks
void copy_entry(const fs::path &source, const fs::path &dest,
                const ConfirmFn &confirm, const MoveOptions &options = {});

} // namespace rip

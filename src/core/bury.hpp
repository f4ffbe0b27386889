// core/bury.hpp - Send targets to the graveyard
#pragma once

#include "operation.hpp"
#include <string>

namespace rip {

OperationReport bury(const BuryOptions &options, const Context &ctx);

// Size plus the first entries of a directory or the first lines of a file
std::string inspect_preview(const std::string &target, const fs::path &source);

} // namespace rip

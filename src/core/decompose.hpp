// core/decompose.hpp - Erase the whole graveyard
#pragma once

#include "operation.hpp"

namespace rip {

OperationReport decompose(const DecomposeOptions &options, const Context &ctx);

} // namespace rip

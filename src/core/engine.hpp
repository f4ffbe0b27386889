// core/engine.hpp - Operation dispatch
#pragma once

#include "operation.hpp"

namespace rip {

// Per-target failures come back as Failed outcomes; a corrupt or
// unwritable record log throws
OperationReport run_operation(const Operation &operation, const Context &ctx);

const char *operation_name(const Operation &operation);

} // namespace rip

// core/seance.hpp - List recorded graves
#pragma once

#include "operation.hpp"
#include <string>

namespace rip {

OperationReport seance(const SeanceOptions &options, const Context &ctx);

GraveListing describe_grave(std::size_t index, const RecordEntry &entry);

// plain: path only; otherwise "index  modified  type  path". Without
// full_path the graveyard prefix is dropped.
std::string format_grave_listing(const GraveListing &listing,
                                 const fs::path &graveyard, bool full_path,
                                 bool plain);

} // namespace rip

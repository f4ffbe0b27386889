// core/unbury.hpp - Restore graves to their original location
#pragma once

#include "operation.hpp"
#include <string>
#include <vector>

namespace rip {

struct GraveCandidate {
  fs::path grave;
  bool named = false; // named on the command line or picked as last bury
};

OperationReport unbury(const UnburyOptions &options, const Context &ctx);

// Explicit target -> grave: local join, graveyard prefix, join under root
fs::path resolve_unbury_target(const std::string &target, const Context &ctx,
                               bool local);

// Union of explicit targets, glob matches and (with seance) every grave
// under the current directory, in that order and without duplicates
std::vector<GraveCandidate> collect_graves(const UnburyOptions &options,
                                           const Context &ctx,
                                           const RecordStore &store);

} // namespace rip

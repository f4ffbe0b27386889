// core/engine.cpp - Operation dispatch implementation
#include "engine.hpp"
#include "../utils.hpp"
#include "bury.hpp"
#include "decompose.hpp"
#include "seance.hpp"
#include "unbury.hpp"
#include <algorithm>

namespace rip {

bool OperationReport::ok() const {
  return std::none_of(outcomes.begin(), outcomes.end(),
                      [](const Outcome &outcome) {
                        return outcome.kind == OutcomeKind::Failed;
                      });
}

std::size_t OperationReport::count(OutcomeKind kind) const {
  return static_cast<std::size_t>(
      std::count_if(outcomes.begin(), outcomes.end(),
                    [kind](const Outcome &outcome) {
                      return outcome.kind == kind;
                    }));
}

Outcome failure_outcome(const RipError &error) {
  return Outcome{OutcomeKind::Failed, error.path(), fs::path(), error.what(),
                 error.kind()};
}

Outcome skipped_outcome(const fs::path &path, const std::string &reason,
                        ErrorKind error) {
  return Outcome{OutcomeKind::Skipped, path, fs::path(), reason, error};
}

namespace {

struct OperationRunner {
  const Context &ctx;

  OperationReport operator()(const BuryOptions &options) const {
    return bury(options, ctx);
  }
  OperationReport operator()(const UnburyOptions &options) const {
    return unbury(options, ctx);
  }
  OperationReport operator()(const SeanceOptions &options) const {
    return seance(options, ctx);
  }
  OperationReport operator()(const DecomposeOptions &options) const {
    return decompose(options, ctx);
  }
};

struct OperationNamer {
  const char *operator()(const BuryOptions &) const { return "bury"; }
  const char *operator()(const UnburyOptions &) const { return "unbury"; }
  const char *operator()(const SeanceOptions &) const { return "seance"; }
  const char *operator()(const DecomposeOptions &) const {
    return "decompose";
  }
};

} // namespace

const char *operation_name(const Operation &operation) {
  return std::visit(OperationNamer{}, operation);
}

OperationReport run_operation(const Operation &operation, const Context &ctx) {
  LOG_DEBUG(std::string("Running ") + operation_name(operation) +
            " with graveyard " + ctx.graveyard.string() + " from " +
            ctx.cwd.string());

  OperationReport report = std::visit(OperationRunner{ctx}, operation);

  LOG_DEBUG(std::string("Finished ") + operation_name(operation) + ": " +
            std::to_string(report.outcomes.size()) + " outcome(s), " +
            std::to_string(report.count(OutcomeKind::Failed)) + " failed");
  return report;
}

} // namespace rip

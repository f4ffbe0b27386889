// core/decompose.cpp - Decompose implementation
#include "decompose.hpp"
#include "../utils.hpp"
#include "paths.hpp"
#include "seance.hpp"

namespace rip {

OperationReport decompose(const DecomposeOptions &, const Context &ctx) {
  OperationReport report;

  if (!entry_exists(ctx.graveyard)) {
    report.outcomes.push_back(
        skipped_outcome(ctx.graveyard, "graveyard does not exist"));
    return report;
  }

  if (!ctx.confirm("Really unlink the entire graveyard?")) {
    report.outcomes.push_back(skipped_outcome(
        ctx.graveyard, "graveyard kept", ErrorKind::PromptDeclined));
    return report;
  }

  if (ctx.verbose) {
    RecordStore store(ctx.record_path());
    try {
      std::size_t index = 0;
      for (const auto &entry : store.scan()) {
        report.graves.push_back(describe_grave(index++, entry));
      }
    } catch (const RipError &e) {
      // Everything is about to go anyway
      LOG_WARN(std::string("Cannot list graves before decomposing: ") +
               e.what());
    }
  }

  std::error_code ec;
  auto removed = fs::remove_all(ctx.graveyard, ec);
  if (ec) {
    report.outcomes.push_back(failure_outcome(RipError(
        ErrorKind::IoFailure, ctx.graveyard, "decompose", ec.message())));
    return report;
  }

  LOG_DEBUG("Removed " + std::to_string(removed) + " entries from " +
            ctx.graveyard.string());
  report.outcomes.push_back(Outcome{OutcomeKind::Deleted, ctx.graveyard,
                                    fs::path(), "graveyard decomposed",
                                    ErrorKind::None});
  return report;
}

} // namespace rip

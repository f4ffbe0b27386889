// core/unbury.cpp - Unbury implementation
#include "unbury.hpp"
#include "../utils.hpp"
#include "glob.hpp"
#include "paths.hpp"
#include <set>

namespace rip {

fs::path resolve_unbury_target(const std::string &target, const Context &ctx,
                               bool local) {
  // "dir/" and "./file" must compare equal to the recorded grave
  if (local) {
    return normalize_path(
        grave_path_for(grave_path_for(ctx.graveyard, ctx.cwd), target));
  }
  if (is_under(target, ctx.graveyard)) {
    return normalize_path(target);
  }
  return normalize_path(grave_path_for(ctx.graveyard, target));
}

std::vector<GraveCandidate> collect_graves(const UnburyOptions &options,
                                           const Context &ctx,
                                           const RecordStore &store) {
  std::vector<GraveCandidate> candidates;
  std::set<fs::path> seen;
  auto add = [&](const fs::path &grave, bool named) {
    if (seen.insert(grave).second) {
      candidates.push_back(GraveCandidate{grave, named});
    }
  };

  const fs::path local_root = grave_path_for(ctx.graveyard, ctx.cwd);

  std::vector<std::string> patterns;
  for (const auto &target : options.targets) {
    if (has_glob_chars(target)) {
      patterns.push_back(target);
    } else {
      add(resolve_unbury_target(target, ctx, options.local), true);
    }
  }

  if (!patterns.empty()) {
    const fs::path &base = options.local ? local_root : ctx.graveyard;
    for (const auto &match : expand(patterns, base, options.max_depth)) {
      if (match != store.path()) {
        add(match, false);
      }
    }
  }

  if (options.seance) {
    for (const auto &entry : store.scan()) {
      if (is_under(entry.grave, local_root)) {
        add(entry.grave, false);
      }
    }
  }

  return candidates;
}

static const RecordEntry *latest_entry_for(const std::vector<RecordEntry> &log,
                                           const fs::path &grave) {
  for (auto it = log.rbegin(); it != log.rend(); ++it) {
    if (it->grave == grave) {
      return &*it;
    }
  }
  return nullptr;
}

static void remove_partial_restore(const fs::path &dest) {
  if (!entry_exists(dest)) {
    return;
  }
  std::error_code ec;
  fs::remove_all(dest, ec);
  if (ec) {
    LOG_WARN("Failed to clean up partial restore " + dest.string() + ": " +
             ec.message());
  }
}

OperationReport unbury(const UnburyOptions &options, const Context &ctx) {
  OperationReport report;
  RecordStore store(ctx.record_path());

  auto candidates = collect_graves(options, ctx, store);
  LOG_DEBUG("Exhuming " + std::to_string(candidates.size()) +
            " grave(s) from the command line");

  if (candidates.empty()) {
    const fs::path local_root = grave_path_for(ctx.graveyard, ctx.cwd);
    ScopePredicate in_scope;
    if (options.local) {
      LOG_DEBUG("Exhuming the last bury under " + local_root.string());
      in_scope = [local_root](const fs::path &grave) {
        return is_under(grave, local_root);
      };
    } else {
      LOG_DEBUG("Exhuming the last bury globally");
    }

    auto latest = store.find_latest(in_scope);
    if (!latest) {
      report.outcomes.push_back(skipped_outcome(
          options.local ? local_root : ctx.graveyard, "nothing to exhume"));
      return report;
    }
    candidates.push_back(GraveCandidate{latest->grave, true});
  }

  const auto log = store.scan();
  std::set<fs::path> exhumed;

  for (const auto &candidate : candidates) {
    const RecordEntry *entry = latest_entry_for(log, candidate.grave);
    if (!entry) {
      if (candidate.named) {
        report.outcomes.push_back(failure_outcome(
            RipError(ErrorKind::NotFound, candidate.grave, "unbury",
                     "no record of this grave")));
      } else {
        LOG_DEBUG("Skipping unrecorded match " + candidate.grave.string());
      }
      continue;
    }

    fs::path dest;
    try {
      if (!entry_exists(entry->grave)) {
        throw RipError(ErrorKind::NotFound, entry->grave, "unbury",
                       "grave is missing from the graveyard");
      }

      dest = entry_exists(entry->original) ? resolve_conflict(entry->original)
                                           : entry->original;
      LOG_DEBUG("Returning " + entry->grave.string() + " to " + dest.string());

      try {
        ctx.mover(entry->grave, dest, ctx.confirm, ctx.move);
      } catch (const RipError &e) {
        if (e.phase() == "remove source") {
          // Restored in full; only the grave could not be cleared
          exhumed.insert(entry->grave);
        } else {
          remove_partial_restore(dest);
        }
        throw;
      }

      exhumed.insert(entry->grave);
      report.outcomes.push_back(Outcome{OutcomeKind::Exhumed, entry->grave,
                                        dest, "", ErrorKind::None});
    } catch (const RecordLogError &) {
      throw;
    } catch (const RipError &e) {
      if (e.is_fatal()) {
        throw;
      }
      LOG_DEBUG("Unbury of " + entry->grave.string() + " failed: " + e.what());
      report.outcomes.push_back(failure_outcome(e));
    }
  }

  store.remove(exhumed);
  return report;
}

} // namespace rip

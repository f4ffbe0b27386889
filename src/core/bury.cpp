// core/bury.cpp - Bury implementation
#include "bury.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include "paths.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <set>
#include <sys/stat.h>

namespace rip {

static fs::path resolve_source(const std::string &target, const fs::path &cwd,
                               bool is_symlink) {
  fs::path joined = cwd / target;
  // The link itself is buried, never what it points to
  if (is_symlink) {
    return fs::weakly_canonical(joined.parent_path()) / joined.filename();
  }
  return fs::canonical(joined);
}

static void remove_partial_grave(const fs::path &grave,
                                 const fs::path &graveyard) {
  if (entry_exists(grave)) {
    std::error_code ec;
    fs::remove_all(grave, ec);
    if (ec) {
      LOG_WARN("Failed to clean up partial grave " + grave.string() + ": " +
               ec.message());
      return;
    }
    LOG_DEBUG("Removed partial grave " + grave.string());
  }
  prune_empty_parents(grave, graveyard);
}

std::string inspect_preview(const std::string &target, const fs::path &source) {
  std::string preview;
  std::error_code ec;

  if (fs::is_directory(fs::symlink_status(source, ec))) {
    preview += target + ": directory, " + humanize_bytes(tree_size(source)) +
               " including:\n";
    std::size_t shown = 0;
    for (fs::directory_iterator it(source, ec), end;
         !ec && it != end && shown < FILES_TO_INSPECT; it.increment(ec)) {
      preview += it->path().string() + "\n";
      ++shown;
    }
    return preview;
  }

  preview += target + ": file, " + humanize_bytes(tree_size(source)) + "\n";
  std::ifstream file(source);
  if (!file.is_open()) {
    preview += "Error: problem reading " + source.string() + "\n";
    return preview;
  }
  std::string line;
  for (std::size_t i = 0; i < LINES_TO_INSPECT && std::getline(file, line);
       ++i) {
    preview += "> " + line + "\n";
  }
  return preview;
}

// graves holds every spelling the record may use for source
static Outcome delete_from_graveyard(const fs::path &source,
                                     const std::set<fs::path> &graves,
                                     const RecordStore &store,
                                     const Context &ctx) {
  if (!ctx.confirm(source.string() +
                   " is already in the graveyard. Permanently unlink it?")) {
    return skipped_outcome(source, "kept in the graveyard",
                           ErrorKind::PromptDeclined);
  }

  std::error_code ec;
  fs::remove_all(source, ec);
  if (ec) {
    throw RipError(ErrorKind::IoFailure, source, "unlink", ec.message());
  }
  store.remove(graves);

  Outcome outcome{OutcomeKind::Deleted, source, fs::path(),
                  "permanently unlinked", ErrorKind::None};
  return outcome;
}

static Outcome bury_one(const std::string &target, const RecordStore &store,
                        const BuryOptions &options, const Context &ctx) {
  fs::path joined = ctx.cwd / target;
  struct stat st;
  if (lstat(joined.c_str(), &st) != 0) {
    throw RipError(ErrorKind::NotFound, joined, "bury",
                   errno == ENOENT ? "no such file or directory"
                                   : std::strerror(errno));
  }

  fs::path source;
  try {
    source = resolve_source(target, ctx.cwd, S_ISLNK(st.st_mode));
  } catch (const fs::filesystem_error &e) {
    throw RipError(ErrorKind::IoFailure, joined, "canonicalize", e.what());
  }
  LOG_DEBUG("Resolved target " + target + " to " + source.string());

  if (options.inspect &&
      !ctx.confirm(inspect_preview(target, source) + "Send " + target +
                   " to the graveyard?")) {
    return skipped_outcome(source, "not sent to the graveyard",
                           ErrorKind::PromptDeclined);
  }

  if (is_under(source, ctx.graveyard)) {
    return delete_from_graveyard(source, {source}, store, ctx);
  }
  std::error_code ec;
  fs::path canonical_graveyard = fs::weakly_canonical(ctx.graveyard, ec);
  if (!ec && is_under(source, canonical_graveyard)) {
    // Graves are recorded under the configured graveyard spelling
    fs::path configured = normalize_path(
        ctx.graveyard / source.lexically_relative(canonical_graveyard));
    return delete_from_graveyard(source, {source, configured}, store, ctx);
  }

  fs::path grave =
      resolve_grave_destination(grave_path_for(ctx.graveyard, source));
  LOG_DEBUG("Burying " + source.string() + " at " + grave.string());

  try {
    ctx.mover(source, grave, ctx.confirm, ctx.move);
  } catch (const RipError &e) {
    if (e.phase() != "remove source") {
      remove_partial_grave(grave, ctx.graveyard);
      throw;
    }
    // Everything reached the grave; keep it reachable from the record
    store.append(source, grave, record_timestamp());
    throw;
  }

  store.append(source, grave, record_timestamp());
  return Outcome{OutcomeKind::Buried, source, grave, "", ErrorKind::None};
}

OperationReport bury(const BuryOptions &options, const Context &ctx) {
  OperationReport report;
  RecordStore store(ctx.record_path());

  for (const auto &target : options.targets) {
    try {
      report.outcomes.push_back(bury_one(target, store, options, ctx));
    } catch (const RecordLogError &) {
      throw;
    } catch (const RipError &e) {
      if (e.is_fatal()) {
        throw;
      }
      LOG_DEBUG("Bury of " + target + " failed: " + e.what());
      report.outcomes.push_back(failure_outcome(e));
    }
  }

  return report;
}

} // namespace rip

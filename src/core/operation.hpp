// core/operation.hpp - Operation payloads, context and reports
#pragma once

#include "../defs.hpp"
#include "errors.hpp"
#include "mover.hpp"
#include "record.hpp"
#include <cstddef>
#include <filesystem>
#include <string>
#include <variant>
#include <vector>

namespace fs = std::filesystem;

namespace rip {

// Built once at startup; the engine reads nothing else from the process
struct Context {
  fs::path graveyard;
  fs::path cwd;
  bool verbose = false;
  ConfirmFn confirm;
  MoveOptions move;
  RelocateFn mover = relocate;

  fs::path record_path() const { return graveyard / RECORD_FILE_NAME; }
};

struct BuryOptions {
  std::vector<std::string> targets;
  bool inspect = false;
};

struct UnburyOptions {
  std::vector<std::string> targets;
  bool local = false;
  bool seance = false; // also exhume every grave under the current directory
  std::size_t max_depth = DEFAULT_MAX_DEPTH;
  bool full_path = false;
};

struct SeanceOptions {
  bool show_all = false;
  bool full_path = false;
  bool plain = false;
};

struct DecomposeOptions {};

using Operation =
    std::variant<BuryOptions, UnburyOptions, SeanceOptions, DecomposeOptions>;

enum class OutcomeKind { Buried, Exhumed, Deleted, Skipped, Failed };

struct Outcome {
  OutcomeKind kind;
  fs::path source;
  fs::path destination;
  std::string message;
  ErrorKind error = ErrorKind::None;
};

struct GraveListing {
  std::size_t index = 0;
  RecordEntry entry;
  std::string file_type; // file, dir, link, fifo, other, missing
  std::string modified;  // "YYYY-MM-DD HH:MM:SS" or "N/A"
};

struct OperationReport {
  std::vector<Outcome> outcomes;
  std::vector<GraveListing> graves;

  bool ok() const;
  std::size_t count(OutcomeKind kind) const;
};

Outcome failure_outcome(const RipError &error);
Outcome skipped_outcome(const fs::path &path, const std::string &reason,
                        ErrorKind error = ErrorKind::None);

} // namespace rip

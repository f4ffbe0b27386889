// core/record.cpp - Record log implementation
#include "record.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include "errors.hpp"
#include "paths.hpp"
#include <cerrno>
#include <cstring>
#include <ctime>
#include <fstream>

namespace rip {

std::string record_timestamp() {
  return format_local_time(std::time(nullptr), RECORD_TIME_FORMAT);
}

std::string format_record_line(const RecordEntry &entry) {
  return entry.timestamp + "\t" + entry.original.string() + "\t" +
         entry.grave.string();
}

RecordEntry parse_record_line(const std::string &line, std::size_t line_no,
                              const fs::path &record_path) {
  std::vector<std::string> fields;
  std::size_t start = 0;
  while (true) {
    auto tab = line.find('\t', start);
    if (tab == std::string::npos) {
      fields.push_back(line.substr(start));
      break;
    }
    fields.push_back(line.substr(start, tab - start));
    start = tab + 1;
  }

  if (fields.size() != 3) {
    throw RipError(ErrorKind::CorruptRecord, record_path,
                   "parse record line " + std::to_string(line_no),
                   "expected 3 tab-separated fields, found " +
                       std::to_string(fields.size()));
  }

  return RecordEntry{fields[0], fields[1], fields[2]};
}

RecordStore::RecordStore(fs::path record_path)
    : record_path_(std::move(record_path)) {}

void RecordStore::append(const fs::path &original, const fs::path &grave,
                         const std::string &timestamp) const {
  if (record_path_.has_parent_path() &&
      !ensure_dir_exists(record_path_.parent_path())) {
    throw RecordLogError(ErrorKind::IoFailure, record_path_, "append record",
                         "cannot create graveyard directory");
  }

  std::ofstream file(record_path_, std::ios::app);
  if (!file.is_open()) {
    throw RecordLogError(ErrorKind::IoFailure, record_path_, "append record",
                         std::strerror(errno));
  }

  file << format_record_line(RecordEntry{timestamp, original, grave}) << "\n";
  file.flush();
  if (!file) {
    throw RecordLogError(ErrorKind::IoFailure, record_path_, "append record",
                         "write failed");
  }
}

std::vector<RecordEntry> RecordStore::scan() const {
  std::vector<RecordEntry> entries;

  if (!entry_exists(record_path_)) {
    return entries;
  }

  std::ifstream file(record_path_);
  if (!file.is_open()) {
    throw RecordLogError(ErrorKind::IoFailure, record_path_, "read record",
                         std::strerror(errno));
  }

  std::string line;
  std::size_t line_no = 0;
  while (std::getline(file, line)) {
    ++line_no;
    if (line.empty())
      continue;
    entries.push_back(parse_record_line(line, line_no, record_path_));
  }

  if (file.bad()) {
    throw RecordLogError(ErrorKind::IoFailure, record_path_, "read record",
                         "read failed");
  }

  return entries;
}

void RecordStore::remove(const std::set<fs::path> &graves) const {
  if (graves.empty() || !entry_exists(record_path_)) {
    return;
  }

  // Parse everything first so a corrupt log is never half rewritten
  std::vector<RecordEntry> kept;
  for (auto &entry : scan()) {
    if (graves.find(entry.grave) == graves.end()) {
      kept.push_back(std::move(entry));
    }
  }

  fs::path tmp_path = record_path_;
  tmp_path += ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::trunc);
    if (!out.is_open()) {
      throw RecordLogError(ErrorKind::IoFailure, tmp_path, "rewrite record",
                           std::strerror(errno));
    }
    for (const auto &entry : kept) {
      out << format_record_line(entry) << "\n";
    }
    out.flush();
    if (!out) {
      throw RecordLogError(ErrorKind::IoFailure, tmp_path, "rewrite record",
                           "write failed");
    }
  }

  std::error_code ec;
  fs::rename(tmp_path, record_path_, ec);
  if (ec) {
    fs::remove(tmp_path, ec);
    throw RecordLogError(ErrorKind::IoFailure, record_path_, "rewrite record",
                         "cannot replace log");
  }

  LOG_DEBUG("Removed " + std::to_string(graves.size()) +
            " grave(s) from record, " + std::to_string(kept.size()) +
            " entries left");
}

std::optional<RecordEntry>
RecordStore::find_latest(const ScopePredicate &in_scope) const {
  auto entries = scan();
  std::set<fs::path> stale;
  std::optional<RecordEntry> latest;

  for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
    if (in_scope && !in_scope(it->grave)) {
      continue;
    }
    if (entry_exists(it->grave)) {
      latest = *it;
      break;
    }
    LOG_DEBUG("Grave " + it->grave.string() + " is gone, pruning its record");
    stale.insert(it->grave);
  }

  remove(stale);
  return latest;
}

std::optional<RecordEntry>
RecordStore::find_by_grave(const fs::path &grave) const {
  auto entries = scan();
  for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
    if (it->grave == grave) {
      return *it;
    }
  }
  return std::nullopt;
}

} // namespace rip

// core/record.hpp - Append-only record log of buried files
#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace rip {

struct RecordEntry {
  std::string timestamp; // opaque display string
  fs::path original;
  fs::path grave;
};

using ScopePredicate = std::function<bool(const fs::path &grave)>;

// One line per entry: "<timestamp>\t<original>\t<grave>"
class RecordStore {
public:
  explicit RecordStore(fs::path record_path);

  const fs::path &path() const { return record_path_; }

  void append(const fs::path &original, const fs::path &grave,
              const std::string &timestamp) const;

  // Missing log scans as empty; a line that is not exactly three
  // tab-separated fields throws CorruptRecord
  std::vector<RecordEntry> scan() const;

  // Rewrites the log without the entries whose grave is in the set
  void remove(const std::set<fs::path> &graves) const;

  // Newest entry whose grave is in scope and still on disk. Stale in-scope
  // entries met on the way are pruned from the log.
  std::optional<RecordEntry> find_latest(const ScopePredicate &in_scope) const;

  // Newest entry recorded for exactly this grave
  std::optional<RecordEntry> find_by_grave(const fs::path &grave) const;

private:
  fs::path record_path_;
};

std::string record_timestamp();
std::string format_record_line(const RecordEntry &entry);
RecordEntry parse_record_line(const std::string &line, std::size_t line_no,
                              const fs::path &record_path);

} // namespace rip

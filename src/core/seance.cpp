// core/seance.cpp - Seance implementation
#include "seance.hpp"
#include "../utils.hpp"
#include "paths.hpp"
#include <iomanip>
#include <sstream>
#include <sys/stat.h>

namespace rip {

GraveListing describe_grave(std::size_t index, const RecordEntry &entry) {
  GraveListing listing;
  listing.index = index;
  listing.entry = entry;

  struct stat st;
  if (lstat(entry.grave.c_str(), &st) != 0) {
    listing.file_type = "missing";
    listing.modified = "N/A";
    return listing;
  }

  if (S_ISREG(st.st_mode))
    listing.file_type = "file";
  else if (S_ISDIR(st.st_mode))
    listing.file_type = "dir";
  else if (S_ISLNK(st.st_mode))
    listing.file_type = "link";
  else if (S_ISFIFO(st.st_mode))
    listing.file_type = "fifo";
  else
    listing.file_type = "other";

  listing.modified = format_local_time(st.st_mtime, "%Y-%m-%d %H:%M:%S");
  return listing;
}

std::string format_grave_listing(const GraveListing &listing,
                                 const fs::path &graveyard, bool full_path,
                                 bool plain) {
  std::string shown = listing.entry.grave.string();
  if (!full_path) {
    const std::string prefix = graveyard.string();
    if (!prefix.empty() && shown.compare(0, prefix.size(), prefix) == 0) {
      shown.erase(0, prefix.size());
    }
  }

  if (plain) {
    return shown;
  }

  std::ostringstream line;
  line << std::left << std::setw(4) << listing.index << " "
       << listing.modified << "  " << std::setw(7) << listing.file_type << " "
       << shown;
  return line.str();
}

OperationReport seance(const SeanceOptions &options, const Context &ctx) {
  OperationReport report;
  RecordStore store(ctx.record_path());

  const fs::path scope = options.show_all
                             ? ctx.graveyard
                             : grave_path_for(ctx.graveyard, ctx.cwd);
  LOG_DEBUG("Listing graves under " + scope.string());

  std::size_t index = 0;
  for (const auto &entry : store.scan()) {
    if (is_under(entry.grave, scope)) {
      report.graves.push_back(describe_grave(index++, entry));
    }
  }

  return report;
}

} // namespace rip

#include "pgbackup/retention/retention_sweeper.hpp"

#include "pgbackup/util/log.hpp"

#include <algorithm>
#include <chrono>

namespace pgbackup {

namespace fs = std::filesystem;

auto RetentionSweeper::is_artifact_name(std::string_view name) const noexcept
    -> bool {
  return std::ranges::any_of(suffixes_, [name](const std::string& suffix) {
    return name.size() > suffix.size() && name.ends_with(suffix);
  });
}

auto RetentionSweeper::expired(const fs::path& dir, int older_than_days) const
    -> Result<std::vector<fs::path>> {
  if (older_than_days < 0) {
    return fail(Error::InvalidArgument);
  }

  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    log::error("Retention sweep: {} is not a directory", dir.string());
    return fail(Error::FileNotFound);
  }

  // A single threshold taken from the filesystem clock; every file is
  // compared against its own mtime as the filesystem reports it.
  auto threshold = fs::file_time_type::clock::now() -
                   std::chrono::hours(24) * older_than_days;

  std::vector<fs::path> out;
  fs::directory_iterator it{dir, ec};
  if (ec) {
    log::error("Retention sweep: cannot read {}: {}", dir.string(),
               ec.message());
    return fail(ec);
  }
  for (; it != fs::directory_iterator{}; it.increment(ec)) {
    if (ec) {
      log::error("Retention sweep: error reading {}: {}", dir.string(),
                 ec.message());
      return fail(ec);
    }
    const auto& entry = *it;
    std::error_code entry_ec;
    if (!entry.is_regular_file(entry_ec) || entry.is_symlink(entry_ec)) {
      continue;
    }
    if (!is_artifact_name(entry.path().filename().string())) {
      continue;
    }
    auto mtime = entry.last_write_time(entry_ec);
    if (entry_ec) {
      log::warn("Retention sweep: cannot stat {}: {}", entry.path().string(),
                entry_ec.message());
      continue;
    }
    if (mtime < threshold) {
      out.push_back(entry.path());
    }
  }

  std::ranges::sort(out);
  return out;
}

auto RetentionSweeper::sweep(const fs::path& dir, int older_than_days)
    -> Result<SweepResult> {
  auto candidates = expired(dir, older_than_days);
  if (!candidates) {
    return std::unexpected(candidates.error());
  }

  log::info("Cleaning up local backups older than {} days in {}",
            older_than_days, dir.string());

  SweepResult result;
  for (const auto& path : *candidates) {
    std::error_code ec;
    if (fs::remove(path, ec)) {
      ++result.deleted;
      log::info("Deleted expired backup {}", path.filename().string());
    } else if (ec) {
      ++result.failed;
      log::warn("Failed to delete {}: {}", path.string(), ec.message());
    }
  }

  log::info("Retention sweep deleted {} file(s), {} failure(s)",
            result.deleted, result.failed);
  return result;
}

}  // namespace pgbackup

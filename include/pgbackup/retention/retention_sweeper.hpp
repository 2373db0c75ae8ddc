#pragma once

#include "pgbackup/backup/report.hpp"
#include "pgbackup/core/error.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace pgbackup {

class IRetentionSweeper {
public:
  virtual ~IRetentionSweeper() = default;

  [[nodiscard]] virtual auto sweep(const std::filesystem::path& dir,
                                   int older_than_days) -> Result<SweepResult> = 0;
};

// Deletes backup artifacts directly under a directory once their mtime is
// older than the retention window. Only regular files with one of the
// configured suffixes are considered; subdirectories are never entered.
class RetentionSweeper : public IRetentionSweeper {
public:
  RetentionSweeper() : suffixes_{".dump", ".tar.gz"} {
  }
  explicit RetentionSweeper(std::vector<std::string> suffixes)
      : suffixes_{std::move(suffixes)} {
  }

  [[nodiscard]] auto sweep(const std::filesystem::path& dir,
                           int older_than_days) -> Result<SweepResult> override;

  [[nodiscard]] auto is_artifact_name(std::string_view name) const noexcept
      -> bool;

  // Files that `sweep` would delete right now, without deleting them.
  [[nodiscard]] auto expired(const std::filesystem::path& dir,
                             int older_than_days) const
      -> Result<std::vector<std::filesystem::path>>;

private:
  std::vector<std::string> suffixes_;
};

}  // namespace pgbackup

#pragma once

#include <cstddef>
#include <string>

namespace pgbackup::cli {

// Malformed command line (sysexits EX_USAGE).
inline constexpr int kUsageExitCode = 64;

struct RunOptions {
  std::string config_file;
  std::string log_level;
};

struct ValidateOptions {
  std::string config_file;
  bool print{false};
};

struct HistoryOptions {
  std::string config_file;
  std::size_t limit{20};
  std::string run_id;
};

// Each returns the process exit status.
[[nodiscard]] auto cmd_run(const RunOptions& opts) -> int;
[[nodiscard]] auto cmd_validate(const ValidateOptions& opts) -> int;
[[nodiscard]] auto cmd_history(const HistoryOptions& opts) -> int;

}  // namespace pgbackup::cli

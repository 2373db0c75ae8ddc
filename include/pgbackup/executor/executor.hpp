#pragma once

#include "pgbackup/executor/cancellation.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <string>

namespace pgbackup {

struct ShellExecutorConfig {
  std::string command;
  std::string working_dir;
  std::chrono::seconds execution_timeout{std::chrono::seconds(300)};
  // Added to (or replacing entries of) the parent environment.
  std::map<std::string, std::string> env;
  // Written to the child's stdin; empty means stdin is /dev/null.
  std::string stdin_data;
};

struct ExecutorResult {
  int exit_code{0};
  // Combined stdout and stderr, truncated from the front to the last
  // MAX_OUTPUT_TAIL bytes.
  std::string output;
  std::string error;
  bool timed_out{false};
  bool cancelled{false};

  [[nodiscard]] auto succeeded() const noexcept -> bool {
    return exit_code == 0 && error.empty() && !timed_out && !cancelled;
  }

  // One-line description of why the command did not succeed.
  [[nodiscard]] auto describe_failure() const -> std::string;
};

class IExecutor {
public:
  virtual ~IExecutor() = default;

  // Runs the command to completion, timeout or cancellation. Never throws.
  virtual auto execute(const ShellExecutorConfig& config,
                       const CancellationToken& cancel) -> ExecutorResult = 0;
};

[[nodiscard]] auto create_shell_executor() -> std::unique_ptr<IExecutor>;

}  // namespace pgbackup

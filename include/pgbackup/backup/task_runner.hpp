#pragma once

#include "pgbackup/backup/report.hpp"
#include "pgbackup/backup/run_context.hpp"
#include "pgbackup/config/task_spec.hpp"
#include "pgbackup/executor/executor.hpp"

#include <cstddef>

namespace pgbackup {

// Producer output lines kept in a TaskOutcome.
inline constexpr std::size_t kDiagnosticTailLines = 15;

// Archive names pg_basebackup writes in tar mode.
inline constexpr std::string_view kBaseArchiveName = "base.tar.gz";
inline constexpr std::string_view kWalArchiveName = "pg_wal.tar.gz";

class ITaskRunner {
public:
  virtual ~ITaskRunner() = default;

  // Runs one task to completion. Every failure, including timeouts,
  // cancellation and missing or empty output, is reported as a Failed
  // outcome; nothing is thrown.
  [[nodiscard]] virtual auto execute(const TaskSpec& spec,
                                     const RunContext& ctx,
                                     const CancellationToken& cancel)
      -> TaskOutcome = 0;
};

class TaskRunner : public ITaskRunner {
public:
  explicit TaskRunner(IExecutor& executor) : executor_{executor} {
  }

  [[nodiscard]] auto execute(const TaskSpec& spec, const RunContext& ctx,
                             const CancellationToken& cancel)
      -> TaskOutcome override;

private:
  IExecutor& executor_;
};

}  // namespace pgbackup

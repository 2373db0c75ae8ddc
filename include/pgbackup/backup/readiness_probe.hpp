#pragma once

#include "pgbackup/backup/run_context.hpp"
#include "pgbackup/core/error.hpp"
#include "pgbackup/executor/executor.hpp"

namespace pgbackup {

class IReadinessProbe {
public:
  virtual ~IReadinessProbe() = default;

  // Succeeds when the target accepts connections within the probe timeout.
  [[nodiscard]] virtual auto probe(const RunContext& ctx,
                                   const CancellationToken& cancel)
      -> Result<void> = 0;
};

// Runs the configured probe command (pg_isready by default).
class ShellReadinessProbe : public IReadinessProbe {
public:
  explicit ShellReadinessProbe(IExecutor& executor) : executor_{executor} {
  }

  [[nodiscard]] auto probe(const RunContext& ctx,
                           const CancellationToken& cancel)
      -> Result<void> override;

private:
  IExecutor& executor_;
};

}  // namespace pgbackup

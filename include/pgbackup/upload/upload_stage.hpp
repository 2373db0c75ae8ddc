#pragma once

#include "pgbackup/backup/report.hpp"
#include "pgbackup/backup/run_context.hpp"
#include "pgbackup/executor/executor.hpp"
#include "pgbackup/upload/retry_policy.hpp"

#include <vector>

namespace pgbackup {

class IUploadStage {
public:
  virtual ~IUploadStage() = default;

  // One outcome per artifact, in input order. A failed upload never stops
  // the remaining artifacts from being attempted.
  [[nodiscard]] virtual auto upload_all(const std::vector<Artifact>& artifacts,
                                        const RunContext& ctx,
                                        const CancellationToken& cancel)
      -> std::vector<UploadOutcome> = 0;
};

// Copies artifacts to remote storage with the configured sync command
// (rclone by default), several artifacts at a time.
class UploadStage : public IUploadStage {
public:
  static constexpr int MAX_PARALLEL_UPLOADS = 4;

  explicit UploadStage(IExecutor& executor) : executor_{executor} {
  }

  [[nodiscard]] auto upload_all(const std::vector<Artifact>& artifacts,
                                const RunContext& ctx,
                                const CancellationToken& cancel)
      -> std::vector<UploadOutcome> override;

private:
  [[nodiscard]] auto upload_one(const Artifact& artifact, const RunContext& ctx,
                                const RetryPolicy& policy,
                                const CancellationToken& cancel)
      -> UploadOutcome;

  IExecutor& executor_;
};

}  // namespace pgbackup

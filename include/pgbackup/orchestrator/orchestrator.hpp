#pragma once

#include "pgbackup/backup/readiness_probe.hpp"
#include "pgbackup/backup/report.hpp"
#include "pgbackup/backup/run_context.hpp"
#include "pgbackup/backup/task_runner.hpp"
#include "pgbackup/executor/cancellation.hpp"
#include "pgbackup/notify/notifier.hpp"
#include "pgbackup/retention/retention_sweeper.hpp"
#include "pgbackup/storage/run_history.hpp"
#include "pgbackup/upload/upload_stage.hpp"

#include <filesystem>

namespace pgbackup {

// Drives one backup run through
//   Preflight -> RunningTasks -> Uploading -> Notifying -> Sweeping -> Done
// with Aborted reachable from Preflight and RunningTasks. Every run ends
// with exactly one notifier call and a report, whatever fails on the way.
class Orchestrator {
public:
  Orchestrator(IReadinessProbe& probe, ITaskRunner& runner,
               IUploadStage& uploader, INotifier& notifier,
               IRetentionSweeper& sweeper)
      : probe_{probe},
        runner_{runner},
        uploader_{uploader},
        notifier_{notifier},
        sweeper_{sweeper} {
  }

  Orchestrator(const Orchestrator&) = delete;
  Orchestrator& operator=(const Orchestrator&) = delete;

  // Optional sinks for the finished report. Failures writing to them are
  // logged and never change the verdict.
  auto set_history(RunHistory* history) noexcept -> void {
    history_ = history;
  }
  auto set_report_file(std::filesystem::path path) -> void {
    report_file_ = std::move(path);
  }

  [[nodiscard]] auto run(const RunContext& ctx, const CancellationToken& cancel)
      -> RunReport;

private:
  auto enter(RunReport& report, RunState state) -> void;
  auto abort(RunReport& report, const RunContext& ctx, Verdict verdict,
             std::string reason) -> void;

  [[nodiscard]] auto preflight(RunReport& report, const RunContext& ctx,
                               const CancellationToken& cancel) -> bool;
  // Returns false when the run was cancelled and has been aborted.
  [[nodiscard]] auto run_tasks(RunReport& report, const RunContext& ctx,
                               const CancellationToken& cancel) -> bool;
  auto upload(RunReport& report, const RunContext& ctx,
              const CancellationToken& cancel) -> void;
  auto notify_once(RunReport& report, const RunContext& ctx) -> void;
  auto sweep(RunReport& report, const RunContext& ctx) -> void;
  auto record(const RunReport& report) -> void;

  IReadinessProbe& probe_;
  ITaskRunner& runner_;
  IUploadStage& uploader_;
  INotifier& notifier_;
  IRetentionSweeper& sweeper_;

  RunHistory* history_{nullptr};
  std::filesystem::path report_file_;
};

}  // namespace pgbackup

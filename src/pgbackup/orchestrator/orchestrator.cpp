#include "pgbackup/orchestrator/orchestrator.hpp"

#include "pgbackup/storage/report_json.hpp"
#include "pgbackup/util/file_lock.hpp"
#include "pgbackup/util/log.hpp"
#include "pgbackup/util/util.hpp"

#include <algorithm>
#include <format>
#include <optional>

namespace pgbackup {

auto Orchestrator::enter(RunReport& report, RunState state) -> void {
  report.states.push_back(state);
  log::debug("Run {} entering state {}", report.run_id, to_string_view(state));
}

auto Orchestrator::abort(RunReport& report, const RunContext& ctx,
                         Verdict verdict, std::string reason) -> void {
  report.verdict = verdict;
  report.failure_reason = std::move(reason);
  log::error("Backup run aborted: {}", report.failure_reason);
  enter(report, RunState::Aborted);
  notify_once(report, ctx);
}

auto Orchestrator::preflight(RunReport& report, const RunContext& ctx,
                             const CancellationToken& cancel) -> bool {
  if (auto r = probe_.probe(ctx, cancel); !r) {
    auto reason =
        r.error() == make_error_code(Error::Cancelled)
            ? std::string{"run cancelled during preflight"}
            : std::format("database {} on {}:{} is not ready: {}",
                          ctx.target.database, ctx.target.host,
                          ctx.target.port, r.error().message());
    abort(report, ctx, Verdict::PreflightFailure, std::move(reason));
    return false;
  }
  log::info("Database {} on {}:{} is ready", ctx.target.database,
            ctx.target.host, ctx.target.port);
  return true;
}

auto Orchestrator::run_tasks(RunReport& report, const RunContext& ctx,
                             const CancellationToken& cancel) -> bool {
  for (const auto& spec : ctx.tasks) {
    if (cancel.is_cancelled()) {
      abort(report, ctx, Verdict::BackupFailure, "run cancelled");
      return false;
    }

    auto outcome = runner_.execute(spec, ctx, cancel);
    auto succeeded = outcome.succeeded();
    auto error = outcome.error;
    report.tasks.push_back(std::move(outcome));
    if (succeeded) {
      continue;
    }

    if (cancel.is_cancelled()) {
      abort(report, ctx, Verdict::BackupFailure, "run cancelled");
      return false;
    }
    if (spec.fatal) {
      report.verdict = Verdict::BackupFailure;
      report.failure_reason = std::format("{} backup failed: {}", spec.name, error);
      return true;
    }
    log::warn("Task {} is not fatal; continuing with the remaining tasks",
              spec.name);
  }
  return true;
}

auto Orchestrator::upload(RunReport& report, const RunContext& ctx,
                          const CancellationToken& cancel) -> void {
  auto artifacts = report.artifacts();
  if (artifacts.empty()) {
    log::warn("No artifacts to upload");
    return;
  }

  report.uploads = uploader_.upload_all(artifacts, ctx, cancel);
  if (cancel.is_cancelled()) {
    report.verdict = Verdict::BackupFailure;
    report.failure_reason = "run cancelled";
    log::error("Run cancelled while uploading; local files were kept");
    return;
  }

  auto failed = std::count_if(report.uploads.begin(), report.uploads.end(),
                              [](const UploadOutcome& u) {
                                return !u.succeeded();
                              });
  if (failed > 0) {
    report.verdict = Verdict::UploadFailure;
    report.failure_reason =
        std::format("{} of {} upload(s) to {} failed; local files were kept",
                    failed, report.uploads.size(), ctx.upload.remote);
    log::error("Upload to remote storage FAILED: {}", report.failure_reason);
    return;
  }
  log::info("All {} artifact(s) uploaded to {}", report.uploads.size(),
            ctx.upload.remote);
}

auto Orchestrator::notify_once(RunReport& report, const RunContext& ctx)
    -> void {
  if (report.notified) {
    return;
  }
  report.notified = true;
  report.finished_at = std::chrono::system_clock::now();
  report.log_tail = log::tail(
      static_cast<std::size_t>(std::max(0, ctx.notify.log_tail_lines)));

  if (auto r = notifier_.notify(report, ctx); !r) {
    log::error("Notification could not be delivered: {}", r.error().message());
  }
}

auto Orchestrator::sweep(RunReport& report, const RunContext& ctx) -> void {
  auto result = sweeper_.sweep(ctx.output_dir, ctx.retention_days);
  if (!result) {
    log::error("Retention sweep of {} failed: {}", ctx.output_dir.string(),
               result.error().message());
    return;
  }
  report.sweep = *result;
}

auto Orchestrator::record(const RunReport& report) -> void {
  if (history_) {
    if (auto r = history_->record_run(report); !r) {
      log::error("Cannot record run {} in history: {}", report.run_id,
                 r.error().message());
    }
  }
  if (!report_file_.empty()) {
    if (auto r = write_report_file(report_file_, report); !r) {
      log::error("Cannot write report file {}: {}", report_file_.string(),
                 r.error().message());
    }
  }
}

auto Orchestrator::run(const RunContext& ctx, const CancellationToken& cancel)
    -> RunReport {
  RunReport report;
  report.run_id = ctx.run_id;
  report.timestamp = ctx.timestamp;
  report.database = ctx.target.database;
  report.host = ctx.target.host;
  report.started_at = std::chrono::system_clock::now();

  log::info("Starting PostgreSQL backup process (run {})", ctx.run_id);
  enter(report, RunState::Preflight);

  std::optional<FileLock> lock;
  if (!ctx.lock_file.empty()) {
    auto acquired = FileLock::acquire(ctx.lock_file);
    if (!acquired) {
      auto reason =
          acquired.error() == make_error_code(Error::LockHeld)
              ? std::format("another run holds the lock {}",
                            ctx.lock_file.string())
              : std::format("cannot take run lock {}: {}",
                            ctx.lock_file.string(),
                            acquired.error().message());
      abort(report, ctx, Verdict::PreflightFailure, std::move(reason));
      record(report);
      return report;
    }
    lock.emplace(std::move(*acquired));
  }

  auto finished = [&] {
    report.finished_at = std::chrono::system_clock::now();
    record(report);
    log::info("Backup run {} finished: {}", report.run_id,
              to_string_view(report.verdict));
    return report;
  };

  if (!preflight(report, ctx, cancel)) {
    return finished();
  }

  enter(report, RunState::RunningTasks);
  if (!run_tasks(report, ctx, cancel)) {
    return finished();
  }

  if (report.verdict == Verdict::Success) {
    if (ctx.upload.enabled) {
      enter(report, RunState::Uploading);
      upload(report, ctx, cancel);
    } else {
      log::info("Upload disabled; backups kept locally only");
    }
  }

  enter(report, RunState::Notifying);
  notify_once(report, ctx);

  if (report.verdict == Verdict::Success) {
    enter(report, RunState::Sweeping);
    sweep(report, ctx);
  }

  enter(report, RunState::Done);
  return finished();
}

}  // namespace pgbackup

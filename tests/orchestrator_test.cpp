#include "pgbackup/orchestrator/orchestrator.hpp"

#include "test_utils.hpp"

#include "pgbackup/util/file_lock.hpp"
#include "pgbackup/util/log.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <map>
#include <mutex>

#include "gtest/gtest.h"

using namespace pgbackup;

namespace fs = std::filesystem;

namespace {

class FakeProbe : public IReadinessProbe {
public:
  auto probe(const RunContext&, const CancellationToken& cancel)
      -> Result<void> override {
    ++calls;
    if (cancel.is_cancelled()) {
      return fail(Error::Cancelled);
    }
    if (!ready) {
      return fail(Error::TargetUnreachable);
    }
    return ok();
  }

  bool ready{true};
  int calls{0};
};

// Answers each task with a scripted outcome, or a successful one producing
// a single small artifact when nothing was scripted for that name.
class FakeRunner : public ITaskRunner {
public:
  auto execute(const TaskSpec& spec, const RunContext& ctx,
               const CancellationToken&) -> TaskOutcome override {
    executed.push_back(spec.name);
    if (auto it = failures.find(spec.name); it != failures.end()) {
      TaskOutcome outcome;
      outcome.task_name = spec.name;
      outcome.kind = spec.kind;
      outcome.exit_code = 1;
      outcome.error = it->second;
      return outcome;
    }
    TaskOutcome outcome;
    outcome.task_name = spec.name;
    outcome.kind = spec.kind;
    outcome.status = OutcomeStatus::Succeeded;
    auto kind = spec.kind == TaskKind::Physical ? ArtifactKind::Physical
                                                : ArtifactKind::Logical;
    outcome.artifacts.push_back(
        Artifact{ctx.output_dir / (spec.name + ".out"), kind, 100});
    outcome.size_bytes = 100;
    return outcome;
  }

  std::map<std::string, std::string> failures;
  std::vector<std::string> executed;
};

class FakeUploader : public IUploadStage {
public:
  auto upload_all(const std::vector<Artifact>& artifacts, const RunContext&,
                  const CancellationToken&)
      -> std::vector<UploadOutcome> override {
    std::lock_guard lock(mutex_);
    ++calls;
    std::vector<UploadOutcome> outcomes;
    for (const auto& artifact : artifacts) {
      UploadOutcome outcome;
      outcome.artifact = artifact;
      outcome.attempts = 1;
      if (fail_all) {
        outcome.error = "exit code 1";
      } else {
        outcome.status = OutcomeStatus::Succeeded;
      }
      outcomes.push_back(std::move(outcome));
    }
    return outcomes;
  }

  bool fail_all{false};
  int calls{0};

private:
  std::mutex mutex_;
};

class FakeNotifier : public INotifier {
public:
  auto notify(const RunReport& report, const RunContext&)
      -> Result<void> override {
    ++calls;
    last = report;
    if (broken) {
      return fail(Error::DeliveryFailed);
    }
    return ok();
  }

  bool broken{false};
  int calls{0};
  RunReport last;
};

class FakeSweeper : public IRetentionSweeper {
public:
  auto sweep(const fs::path&, int older_than_days) -> Result<SweepResult> override {
    ++calls;
    days = older_than_days;
    return SweepResult{2, 0};
  }

  int calls{0};
  int days{0};
};

}  // namespace

class OrchestratorTest : public ::testing::Test {
protected:
  void SetUp() override {
    ctx_ = test::make_test_context(dir_.path());
  }

  auto run(const CancellationToken& cancel = CancellationToken::none())
      -> RunReport {
    Orchestrator orchestrator{probe_, runner_, uploader_, notifier_, sweeper_};
    return orchestrator.run(ctx_, cancel);
  }

  test::TempDir dir_;
  RunContext ctx_;
  FakeProbe probe_;
  FakeRunner runner_;
  FakeUploader uploader_;
  FakeNotifier notifier_;
  FakeSweeper sweeper_;
};

TEST_F(OrchestratorTest, AllStagesSucceed_IsSuccess) {
  auto report = run();

  EXPECT_EQ(report.verdict, Verdict::Success);
  EXPECT_EQ(exit_code(report.verdict), 0);
  EXPECT_TRUE(report.failure_reason.empty());
  EXPECT_EQ(runner_.executed, (std::vector<std::string>{"logical", "physical"}));
  EXPECT_EQ(uploader_.calls, 1);
  EXPECT_EQ(report.uploads.size(), 2);
  EXPECT_EQ(notifier_.calls, 1);
  EXPECT_EQ(sweeper_.calls, 1);
  EXPECT_EQ(sweeper_.days, 7);
  ASSERT_TRUE(report.sweep.has_value());
  EXPECT_EQ(report.sweep->deleted, 2);
  EXPECT_EQ(report.states,
            (std::vector<RunState>{RunState::Preflight, RunState::RunningTasks,
                                   RunState::Uploading, RunState::Notifying,
                                   RunState::Sweeping, RunState::Done}));
  EXPECT_EQ(report.run_id, ctx_.run_id);
  EXPECT_GE(report.finished_at, report.started_at);
}

TEST_F(OrchestratorTest, PreflightFailure_RunsNoTasks) {
  probe_.ready = false;

  auto report = run();

  EXPECT_EQ(report.verdict, Verdict::PreflightFailure);
  EXPECT_EQ(exit_code(report.verdict), 1);
  EXPECT_NE(report.failure_reason.find("db on localhost:5432 is not ready"),
            std::string::npos);
  EXPECT_TRUE(runner_.executed.empty());
  EXPECT_EQ(uploader_.calls, 0);
  EXPECT_EQ(sweeper_.calls, 0);
  EXPECT_EQ(notifier_.calls, 1);
  EXPECT_EQ(notifier_.last.verdict, Verdict::PreflightFailure);
  EXPECT_EQ(report.states,
            (std::vector<RunState>{RunState::Preflight, RunState::Aborted}));
}

TEST_F(OrchestratorTest, LockHeldByAnotherRun_IsPreflightFailure) {
  auto held = FileLock::acquire(ctx_.lock_file);
  ASSERT_TRUE(held.has_value());

  auto report = run();

  EXPECT_EQ(report.verdict, Verdict::PreflightFailure);
  EXPECT_NE(report.failure_reason.find("another run holds the lock"),
            std::string::npos);
  EXPECT_EQ(probe_.calls, 0);
  EXPECT_TRUE(runner_.executed.empty());
  EXPECT_EQ(notifier_.calls, 1);
}

TEST_F(OrchestratorTest, LockIsReleasedAfterRun) {
  ASSERT_EQ(run().verdict, Verdict::Success);

  auto again = FileLock::acquire(ctx_.lock_file);

  EXPECT_TRUE(again.has_value());
}

TEST_F(OrchestratorTest, FatalTaskFailure_SkipsRemainingTasksAndUpload) {
  runner_.failures["logical"] = "producer failed: exit code 1";

  auto report = run();

  EXPECT_EQ(report.verdict, Verdict::BackupFailure);
  EXPECT_EQ(exit_code(report.verdict), 2);
  EXPECT_EQ(report.failure_reason,
            "logical backup failed: producer failed: exit code 1");
  EXPECT_EQ(runner_.executed, (std::vector<std::string>{"logical"}));
  EXPECT_EQ(uploader_.calls, 0);
  EXPECT_EQ(sweeper_.calls, 0);
  EXPECT_EQ(notifier_.calls, 1);
  EXPECT_LE(notifier_.last.log_tail.size(), 15);
  EXPECT_EQ(report.states,
            (std::vector<RunState>{RunState::Preflight, RunState::RunningTasks,
                                   RunState::Notifying, RunState::Done}));
}

TEST_F(OrchestratorTest, NonFatalTaskFailure_Continues) {
  ctx_.tasks[0].fatal = false;
  runner_.failures["logical"] = "producer failed: exit code 1";

  auto report = run();

  EXPECT_EQ(report.verdict, Verdict::Success);
  EXPECT_EQ(runner_.executed, (std::vector<std::string>{"logical", "physical"}));
  ASSERT_EQ(report.tasks.size(), 2);
  EXPECT_FALSE(report.tasks[0].succeeded());
  ASSERT_EQ(report.uploads.size(), 1);
  EXPECT_EQ(report.uploads[0].artifact.path, dir_ / "physical.out");
}

TEST_F(OrchestratorTest, UploadFailure_KeepsLocalFilesAndSkipsSweep) {
  uploader_.fail_all = true;

  auto report = run();

  EXPECT_EQ(report.verdict, Verdict::UploadFailure);
  EXPECT_EQ(exit_code(report.verdict), 3);
  EXPECT_NE(report.failure_reason.find("2 of 2 upload(s)"), std::string::npos);
  EXPECT_EQ(sweeper_.calls, 0);
  EXPECT_FALSE(report.sweep.has_value());
  EXPECT_EQ(notifier_.calls, 1);
}

TEST_F(OrchestratorTest, UploadDisabled_IsStillSuccess) {
  ctx_.upload.enabled = false;

  auto report = run();

  EXPECT_EQ(report.verdict, Verdict::Success);
  EXPECT_EQ(uploader_.calls, 0);
  EXPECT_TRUE(report.uploads.empty());
  EXPECT_EQ(sweeper_.calls, 1);
  EXPECT_EQ(std::count(report.states.begin(), report.states.end(),
                       RunState::Uploading),
            0);
}

TEST_F(OrchestratorTest, NotifierFailure_DoesNotChangeVerdict) {
  notifier_.broken = true;

  auto report = run();

  EXPECT_EQ(report.verdict, Verdict::Success);
  EXPECT_EQ(notifier_.calls, 1);
  EXPECT_TRUE(report.notified);
}

TEST_F(OrchestratorTest, CancelledBeforeStart_AbortsDuringPreflight) {
  CancellationSource source;
  source.cancel();

  auto report = run(source.token());

  EXPECT_EQ(report.verdict, Verdict::PreflightFailure);
  EXPECT_EQ(report.failure_reason, "run cancelled during preflight");
  EXPECT_TRUE(runner_.executed.empty());
  EXPECT_EQ(notifier_.calls, 1);
}

TEST_F(OrchestratorTest, CancelledBetweenTasks_IsBackupFailure) {
  CancellationSource source;
  class CancellingRunner : public FakeRunner {
  public:
    explicit CancellingRunner(CancellationSource& source) : source_(source) {
    }
    auto execute(const TaskSpec& spec, const RunContext& ctx,
                 const CancellationToken& cancel) -> TaskOutcome override {
      auto outcome = FakeRunner::execute(spec, ctx, cancel);
      source_.cancel();
      return outcome;
    }

  private:
    CancellationSource& source_;
  };
  CancellingRunner runner{source};
  Orchestrator orchestrator{probe_, runner, uploader_, notifier_, sweeper_};

  auto report = orchestrator.run(ctx_, source.token());

  EXPECT_EQ(report.verdict, Verdict::BackupFailure);
  EXPECT_EQ(report.failure_reason, "run cancelled");
  EXPECT_EQ(runner.executed, (std::vector<std::string>{"logical"}));
  EXPECT_EQ(uploader_.calls, 0);
  EXPECT_EQ(notifier_.calls, 1);
  EXPECT_EQ(report.states.back(), RunState::Aborted);
}

TEST_F(OrchestratorTest, CancelledDuringUpload_IsBackupFailure) {
  CancellationSource source;
  class CancellingUploader : public FakeUploader {
  public:
    explicit CancellingUploader(CancellationSource& source) : source_(source) {
    }
    auto upload_all(const std::vector<Artifact>& artifacts, const RunContext& ctx,
                    const CancellationToken& cancel)
        -> std::vector<UploadOutcome> override {
      source_.cancel();
      return FakeUploader::upload_all(artifacts, ctx, cancel);
    }

  private:
    CancellationSource& source_;
  };
  CancellingUploader uploader{source};
  uploader.fail_all = true;
  Orchestrator orchestrator{probe_, runner_, uploader, notifier_, sweeper_};

  auto report = orchestrator.run(ctx_, source.token());

  EXPECT_EQ(report.verdict, Verdict::BackupFailure);
  EXPECT_EQ(exit_code(report.verdict), 2);
  EXPECT_EQ(report.failure_reason, "run cancelled");
  EXPECT_EQ(uploader.calls, 1);
  EXPECT_EQ(notifier_.calls, 1);
  EXPECT_EQ(notifier_.last.verdict, Verdict::BackupFailure);
  EXPECT_EQ(sweeper_.calls, 0);
  EXPECT_EQ(report.states,
            (std::vector<RunState>{RunState::Preflight, RunState::RunningTasks,
                                   RunState::Uploading, RunState::Notifying,
                                   RunState::Done}));
}

TEST_F(OrchestratorTest, ReportFile_IsWrittenForEveryOutcome) {
  probe_.ready = false;
  auto report_path = dir_ / "last_run.json";
  Orchestrator orchestrator{probe_, runner_, uploader_, notifier_, sweeper_};
  orchestrator.set_report_file(report_path);

  auto report = orchestrator.run(ctx_, CancellationToken::none());

  auto saved = nlohmann::json::parse(test::read_file(report_path));
  EXPECT_EQ(saved["run_id"], report.run_id);
  EXPECT_EQ(saved["verdict"], "preflight_failure");
  EXPECT_EQ(saved["exit_code"], 1);
}

// Runs real shell producers, a copy-based "remote" and the real notifier and
// sweeper against a temporary directory.
class OrchestratorEndToEndTest : public ::testing::Test {
protected:
  void SetUp() override {
    ctx_ = test::make_test_context(dir_.path());
    remote_ = dir_ / "remote";
    fs::create_directories(remote_);

    ctx_.preflight.command = "true";
    ctx_.tasks[0].command = "printf dump-data > {output}";
    ctx_.tasks[1].command =
        "cd {staging_dir} && printf base > base.tar.gz && "
        "printf wal > pg_wal.tar.gz";
    ctx_.upload.remote = remote_.string() + "/";
    ctx_.upload.command = "cp {file} {remote}";

    executor_ = create_shell_executor();
  }

  auto run() -> RunReport {
    ShellReadinessProbe probe{*executor_};
    TaskRunner runner{*executor_};
    UploadStage uploader{*executor_};
    auto notifier = make_notifier(ctx_.notify, *executor_);
    RetentionSweeper sweeper;
    Orchestrator orchestrator{probe, runner, uploader, *notifier, sweeper};
    orchestrator.set_history(&history_);
    orchestrator.set_report_file(dir_ / "last_run.json");
    return orchestrator.run(ctx_, CancellationToken::none());
  }

  test::TempDir dir_;
  fs::path remote_;
  RunContext ctx_;
  std::unique_ptr<IExecutor> executor_;
  RunHistory history_{(dir_ / "history.db").string()};
};

TEST_F(OrchestratorEndToEndTest, NightlyRun_UploadsAndSweeps) {
  ASSERT_TRUE(history_.open().has_value());
  auto stale = dir_ / "db_2023-12-01-020000.dump";
  test::write_file(stale, "old dump");
  test::set_age(stale, std::chrono::hours(24 * 10));

  auto report = run();

  ASSERT_EQ(report.verdict, Verdict::Success) << report.failure_reason;
  EXPECT_TRUE(fs::exists(dir_ / "db_2024-01-01-020000.dump"));
  EXPECT_TRUE(fs::exists(dir_ / "pg_base_backup_2024-01-01-020000.tar.gz"));
  EXPECT_TRUE(fs::exists(dir_ / "pg_wal_2024-01-01-020000.tar.gz"));
  EXPECT_TRUE(fs::exists(remote_ / "db_2024-01-01-020000.dump"));
  EXPECT_TRUE(fs::exists(remote_ / "pg_base_backup_2024-01-01-020000.tar.gz"));
  EXPECT_TRUE(fs::exists(remote_ / "pg_wal_2024-01-01-020000.tar.gz"));
  EXPECT_FALSE(fs::exists(stale));
  ASSERT_TRUE(report.sweep.has_value());
  EXPECT_EQ(report.sweep->deleted, 1);

  // No transport is configured, so the notification lands in the fallback.
  auto fallback = test::read_file(ctx_.notify.fallback_file);
  EXPECT_NE(fallback.find("SUCCESS: PostgreSQL Backup and Upload"),
            std::string::npos);

  auto runs = history_.list_runs();
  ASSERT_TRUE(runs.has_value());
  ASSERT_EQ(runs->size(), 1);
  EXPECT_EQ((*runs)[0].run_id, report.run_id);
  EXPECT_EQ((*runs)[0].artifact_count, 3);

  auto saved = nlohmann::json::parse(test::read_file(dir_ / "last_run.json"));
  EXPECT_EQ(saved["verdict"], "success");
}

TEST_F(OrchestratorEndToEndTest, LargeArtifacts_AreReportedWithTheirSizes) {
  ctx_.tasks[0].command =
      "printf x > {output} && truncate -s 120M {output}";
  ctx_.tasks[1].command =
      "cd {staging_dir} && printf b > base.tar.gz && "
      "truncate -s 900M base.tar.gz && printf w > pg_wal.tar.gz";
  ctx_.upload.enabled = false;

  auto report = run();

  ASSERT_EQ(report.verdict, Verdict::Success) << report.failure_reason;
  ASSERT_EQ(report.tasks.size(), 2);
  EXPECT_EQ(report.tasks[0].size_bytes, 120ULL * 1024 * 1024);
  EXPECT_EQ(report.tasks[1].artifacts[0].size_bytes, 900ULL * 1024 * 1024);
  EXPECT_EQ(exit_code(report.verdict), 0);
}

TEST_F(OrchestratorEndToEndTest, FailingDump_LeavesNoArtifactsBehind) {
  log::set_level(log::Level::Info);
  for (int i = 0; i < 20; ++i) {
    log::info("earlier line {}", i);
  }
  ctx_.tasks[0].command = "echo 'pg_dump: error: FATAL: role missing' >&2; exit 1";
  auto recent = dir_ / "db_2023-12-31-020000.dump";
  test::write_file(recent, "yesterday");

  auto report = run();

  EXPECT_EQ(report.verdict, Verdict::BackupFailure);
  EXPECT_FALSE(fs::exists(dir_ / "db_2024-01-01-020000.dump"));
  EXPECT_FALSE(fs::exists(dir_ / "pg_base_backup_2024-01-01-020000.tar.gz"));
  EXPECT_TRUE(fs::exists(recent));
  EXPECT_TRUE(fs::is_empty(remote_));

  auto fallback = test::read_file(ctx_.notify.fallback_file);
  EXPECT_NE(fallback.find("FAILURE: PostgreSQL Backup Task"), std::string::npos);
  EXPECT_NE(fallback.find("role missing"), std::string::npos);

  ASSERT_EQ(report.log_tail.size(), 15);
  for (const auto& line : report.log_tail) {
    EXPECT_NE(fallback.find(line), std::string::npos) << line;
  }
}

TEST_F(OrchestratorEndToEndTest, NonUtf8ProducerOutput_KeepsVerdictExitCode) {
  ASSERT_TRUE(history_.open().has_value());
  ctx_.tasks[0].command =
      "printf 'pg_dump: Fehler: \\344nderung verweigert\\n' >&2; exit 1";

  auto report = run();

  EXPECT_EQ(report.verdict, Verdict::BackupFailure);
  EXPECT_EQ(exit_code(report.verdict), 2);
  ASSERT_FALSE(report.tasks.empty());
  ASSERT_FALSE(report.tasks[0].diagnostics.empty());
  EXPECT_NE(report.tasks[0].diagnostics.back().find('\xe4'), std::string::npos);

  auto runs = history_.list_runs();
  ASSERT_TRUE(runs.has_value());
  ASSERT_EQ(runs->size(), 1);
  EXPECT_EQ((*runs)[0].exit_code, 2);

  auto saved = nlohmann::json::parse(test::read_file(dir_ / "last_run.json"));
  EXPECT_EQ(saved["verdict"], "backup_failure");
  EXPECT_EQ(saved["exit_code"], 2);
}

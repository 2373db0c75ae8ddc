#include "pgbackup/notify/notifier.hpp"

#include "test_utils.hpp"

#include <filesystem>
#include <format>

#include "gtest/gtest.h"

using namespace pgbackup;

namespace {

class RecordingTransport : public ITransport {
public:
  RecordingTransport(std::string name, bool succeeds,
                     std::vector<std::string>& journal)
      : name_(std::move(name)), succeeds_(succeeds), journal_(journal) {
  }

  auto name() const -> std::string_view override {
    return name_;
  }

  auto send(const RenderedMessage& message, const std::vector<std::string>&,
            std::string_view) -> Result<void> override {
    journal_.push_back(std::format("{}: {}", name_, message.subject));
    if (!succeeds_) {
      return fail(Error::DeliveryFailed);
    }
    return ok();
  }

private:
  std::string name_;
  bool succeeds_;
  std::vector<std::string>& journal_;
};

auto make_report(Verdict verdict) -> RunReport {
  RunReport report;
  report.run_id = "run-1";
  report.timestamp = "2024-01-01-020000";
  report.database = "db";
  report.host = "localhost";
  report.verdict = verdict;

  TaskOutcome logical;
  logical.task_name = "logical";
  logical.status = verdict == Verdict::BackupFailure ? OutcomeStatus::Failed
                                                     : OutcomeStatus::Succeeded;
  if (logical.succeeded()) {
    logical.artifacts.push_back(Artifact{"/backups/db_2024-01-01-020000.dump",
                                         ArtifactKind::Logical, 1024});
    logical.size_bytes = 1024;
  } else {
    logical.exit_code = 1;
    logical.error = "producer failed: exit code 1";
    logical.diagnostics = {"pg_dump: error: connection to server failed"};
    report.failure_reason = "logical backup failed: producer failed: exit code 1";
  }
  report.tasks.push_back(logical);

  if (verdict == Verdict::UploadFailure) {
    UploadOutcome upload;
    upload.artifact = logical.artifacts.front();
    upload.attempts = 3;
    upload.error = "exit code 1";
    report.uploads.push_back(upload);
    report.failure_reason = "1 of 1 upload(s) to gdrive_backups: failed";
  }
  report.log_tail = {"[2024-01-01 02:00:00] [info] Starting PostgreSQL backup process"};
  return report;
}

}  // namespace

TEST(RenderReportTest, Subject_DependsOnVerdict) {
  EXPECT_EQ(render_report(make_report(Verdict::Success)).subject,
            "[db@localhost] SUCCESS: PostgreSQL Backup");
  EXPECT_EQ(render_report(make_report(Verdict::BackupFailure)).subject,
            "[db@localhost] FAILURE: PostgreSQL Backup Task");
  EXPECT_EQ(render_report(make_report(Verdict::UploadFailure)).subject,
            "[db@localhost] FAILURE: PostgreSQL Backup Upload");
  EXPECT_EQ(render_report(make_report(Verdict::PreflightFailure)).subject,
            "[db@localhost] FAILURE: PostgreSQL Backup Preflight");
}

TEST(RenderReportTest, SuccessWithUploads_MentionsUpload) {
  auto report = make_report(Verdict::Success);
  UploadOutcome upload;
  upload.artifact = report.tasks[0].artifacts[0];
  upload.status = OutcomeStatus::Succeeded;
  upload.attempts = 1;
  report.uploads.push_back(upload);

  auto message = render_report(report);

  EXPECT_EQ(message.subject, "[db@localhost] SUCCESS: PostgreSQL Backup and Upload");
  EXPECT_NE(message.body.find("Successfully created and uploaded: "
                              "/backups/db_2024-01-01-020000.dump"),
            std::string::npos);
}

TEST(RenderReportTest, SameReport_RendersIdentically) {
  auto report = make_report(Verdict::BackupFailure);

  auto first = render_report(report);
  auto second = render_report(report);

  EXPECT_EQ(first.subject, second.subject);
  EXPECT_EQ(first.body, second.body);
}

TEST(RenderReportTest, FailureBody_ListsDiagnosticsAndLogTail) {
  auto message = render_report(make_report(Verdict::BackupFailure));

  EXPECT_NE(message.body.find("[FAILED] logical"), std::string::npos);
  EXPECT_NE(message.body.find("| pg_dump: error: connection to server failed"),
            std::string::npos);
  EXPECT_NE(message.body.find("(not attempted)"), std::string::npos);
  EXPECT_NE(message.body.find("Recent log:"), std::string::npos);
  EXPECT_NE(message.body.find("Starting PostgreSQL backup process"),
            std::string::npos);
}

TEST(RenderMailTest, Headers_PrecedeBody) {
  RenderedMessage message{"subject line", "body text\n"};

  auto mail = render_mail(message, {"a@x.com", "b@x.com"}, "pgbackup");

  EXPECT_EQ(mail.rfind("To: a@x.com, b@x.com\nFrom: pgbackup\nSubject: subject line\n", 0),
            0);
  EXPECT_NE(mail.find("\n\nbody text\n"), std::string::npos);
}

class NotifierTest : public ::testing::Test {
protected:
  void SetUp() override {
    ctx_ = test::make_test_context(dir_.path());
  }

  auto make_notifier(std::initializer_list<bool> outcomes) -> Notifier {
    std::vector<std::unique_ptr<ITransport>> transports;
    int i = 0;
    for (bool succeeds : outcomes) {
      transports.push_back(std::make_unique<RecordingTransport>(
          std::format("t{}", i++), succeeds, journal_));
    }
    return Notifier{std::move(transports)};
  }

  test::TempDir dir_;
  RunContext ctx_;
  std::vector<std::string> journal_;
};

TEST_F(NotifierTest, FirstWorkingTransport_StopsTheChain) {
  auto notifier = make_notifier({false, true, true});

  auto result = notifier.notify(make_report(Verdict::BackupFailure), ctx_);

  ASSERT_TRUE(result.has_value());
  ASSERT_EQ(journal_.size(), 2);
  EXPECT_EQ(journal_[0].substr(0, 3), "t0:");
  EXPECT_EQ(journal_[1].substr(0, 3), "t1:");
  EXPECT_FALSE(std::filesystem::exists(ctx_.notify.fallback_file));
}

TEST_F(NotifierTest, AllTransportsFail_WritesFallbackFile) {
  auto notifier = make_notifier({false, false});

  auto result = notifier.notify(make_report(Verdict::BackupFailure), ctx_);

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(journal_.size(), 2);
  auto saved = test::read_file(ctx_.notify.fallback_file);
  EXPECT_NE(saved.find("Subject: [db@localhost] FAILURE: PostgreSQL Backup Task"),
            std::string::npos);
  EXPECT_NE(saved.find("To: dba-alerts@yourcompany.com"), std::string::npos);
}

TEST_F(NotifierTest, FallbackUnwritable_ReturnsDeliveryFailed) {
  ctx_.notify.fallback_file = (dir_ / "missing" / "undelivered.log").string();
  auto notifier = make_notifier({false});

  auto result = notifier.notify(make_report(Verdict::UploadFailure), ctx_);

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::DeliveryFailed));
}

TEST_F(NotifierTest, NoRecipients_GoesStraightToFallback) {
  ctx_.notify.recipients.clear();
  auto notifier = make_notifier({true});

  auto result = notifier.notify(make_report(Verdict::BackupFailure), ctx_);

  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(journal_.empty());
  EXPECT_TRUE(std::filesystem::exists(ctx_.notify.fallback_file));
}

TEST_F(NotifierTest, SuccessNotificationsDisabled_SkipsSuccessOnly) {
  ctx_.notify.notify_on_success = false;
  auto notifier = make_notifier({true});

  ASSERT_TRUE(notifier.notify(make_report(Verdict::Success), ctx_).has_value());
  EXPECT_TRUE(journal_.empty());

  ASSERT_TRUE(notifier.notify(make_report(Verdict::UploadFailure), ctx_).has_value());
  EXPECT_EQ(journal_.size(), 1);
}

TEST(ShellTransportTest, Headers_SendsRfc822MessageOnStdin) {
  test::FakeExecutor executor;
  ShellTransport transport{{"sendmail", "/usr/sbin/sendmail -t -f {sender}", true},
                           executor,
                           std::chrono::seconds(30)};
  RenderedMessage message{"[db@localhost] SUCCESS: PostgreSQL Backup", "body\n"};

  auto result = transport.send(message, {"dba@x.com"}, "pgbackup");

  ASSERT_TRUE(result.has_value());
  auto calls = executor.calls();
  ASSERT_EQ(calls.size(), 1);
  EXPECT_EQ(calls[0].command, "/usr/sbin/sendmail -t -f pgbackup");
  EXPECT_EQ(calls[0].execution_timeout, std::chrono::seconds(30));
  EXPECT_NE(calls[0].stdin_data.find("Subject: [db@localhost] SUCCESS"),
            std::string::npos);
  EXPECT_NE(calls[0].stdin_data.find("To: dba@x.com"), std::string::npos);
}

TEST(ShellTransportTest, MailCommand_QuotesSubjectAndSendsBody) {
  test::FakeExecutor executor;
  ShellTransport transport{{"mail", "mail -s {subject} {recipients}", false},
                           executor,
                           std::chrono::seconds(30)};
  RenderedMessage message{"[db@localhost] FAILURE: PostgreSQL Backup Task", "body\n"};

  ASSERT_TRUE(transport.send(message, {"a@x.com", "b@x.com"}, "pgbackup").has_value());

  auto calls = executor.calls();
  ASSERT_EQ(calls.size(), 1);
  EXPECT_EQ(calls[0].command,
            "mail -s '[db@localhost] FAILURE: PostgreSQL Backup Task' a@x.com,b@x.com");
  EXPECT_EQ(calls[0].stdin_data, "body\n");
}

TEST(ShellTransportTest, CommandFailure_IsDeliveryFailed) {
  test::FakeExecutor executor{[](const ShellExecutorConfig&) {
    return test::failed_result(127, "sh: 1: sendmail: not found\n");
  }};
  ShellTransport transport{{"sendmail", "sendmail -t", true}, executor,
                           std::chrono::seconds(30)};

  auto result = transport.send({"s", "b"}, {"a@x.com"}, "pgbackup");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::DeliveryFailed));
}

TEST(ShellTransportTest, Timeout_IsReportedAsTimeout) {
  test::FakeExecutor executor{[](const ShellExecutorConfig&) {
    ExecutorResult r;
    r.exit_code = -1;
    r.timed_out = true;
    return r;
  }};
  ShellTransport transport{{"mail", "mail -s {subject} {recipients}", false},
                           executor, std::chrono::seconds(1)};

  auto result = transport.send({"s", "b"}, {"a@x.com"}, "pgbackup");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::Timeout));
}

TEST(MakeNotifierTest, BuildsOneTransportPerConfigEntry) {
  test::FakeExecutor executor;
  NotifyConfig config;

  auto notifier = make_notifier(config, executor);

  EXPECT_EQ(notifier->transport_count(), 2);
}

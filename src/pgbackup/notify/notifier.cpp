#include "pgbackup/notify/notifier.hpp"

#include "pgbackup/util/command_template.hpp"
#include "pgbackup/util/log.hpp"
#include "pgbackup/util/util.hpp"

#include <cstdio>
#include <format>
#include <iterator>

namespace pgbackup {

namespace {

auto subject_for(const RunReport& report) -> std::string_view {
  switch (report.verdict) {
    case Verdict::Success:
      return report.uploads.empty() ? "SUCCESS: PostgreSQL Backup"
                                    : "SUCCESS: PostgreSQL Backup and Upload";
    case Verdict::BackupFailure: return "FAILURE: PostgreSQL Backup Task";
    case Verdict::UploadFailure: return "FAILURE: PostgreSQL Backup Upload";
    case Verdict::PreflightFailure: return "FAILURE: PostgreSQL Backup Preflight";
  }
  std::unreachable();
}

auto summary_for(const RunReport& report) -> std::string {
  auto names = [&report] {
    std::vector<std::string> out;
    for (const auto& artifact : report.artifacts()) {
      out.push_back(artifact.path.string());
    }
    return join(out, " and ");
  };

  switch (report.verdict) {
    case Verdict::Success:
      return report.uploads.empty()
                 ? std::format("Successfully created: {}", names())
                 : std::format("Successfully created and uploaded: {}", names());
    case Verdict::BackupFailure:
      return "A backup task failed; no files were uploaded.";
    case Verdict::UploadFailure:
      return "Backups were created locally but failed to upload to remote "
             "storage. Check the sync client output below.";
    case Verdict::PreflightFailure:
      return "The database was not reachable; no backup was attempted.";
  }
  std::unreachable();
}

auto format_seconds(std::chrono::milliseconds d) -> std::string {
  return std::format("{:.1f} s", static_cast<double>(d.count()) / 1000.0);
}

}  // namespace

auto render_report(const RunReport& report) -> RenderedMessage {
  RenderedMessage message;
  message.subject =
      std::format("[{}@{}] {}", report.database, report.host, subject_for(report));

  auto out = std::back_inserter(message.body);
  std::format_to(out, "{}\n\n", summary_for(report));
  std::format_to(out, "Run:       {}\n", report.run_id);
  std::format_to(out, "Database:  {} on {}\n", report.database, report.host);
  std::format_to(out, "Timestamp: {}\n", report.timestamp);
  std::format_to(out, "Verdict:   {}\n", to_string_view(report.verdict));
  if (!report.failure_reason.empty()) {
    std::format_to(out, "Reason:    {}\n", report.failure_reason);
  }

  std::format_to(out, "\nTasks:\n");
  if (report.tasks.empty()) {
    std::format_to(out, "  (none run)\n");
  }
  for (const auto& task : report.tasks) {
    if (task.succeeded()) {
      std::format_to(out, "  [ok]     {:<10} {} ({})\n", task.task_name,
                     format_bytes(task.size_bytes), format_seconds(task.duration));
      for (const auto& artifact : task.artifacts) {
        std::format_to(out, "           {} {} ({})\n",
                       to_string_view(artifact.kind), artifact.path.string(),
                       format_bytes(artifact.size_bytes));
      }
    } else {
      std::format_to(out, "  [FAILED] {:<10} {} ({})\n", task.task_name,
                     task.error, format_seconds(task.duration));
      for (const auto& line : task.diagnostics) {
        std::format_to(out, "           | {}\n", line);
      }
    }
  }

  std::format_to(out, "\nUploads:\n");
  if (report.uploads.empty()) {
    std::format_to(out, "  (not attempted)\n");
  }
  for (const auto& upload : report.uploads) {
    if (upload.succeeded()) {
      std::format_to(out, "  [ok]     {} ({} attempt(s))\n",
                     upload.artifact.path.filename().string(), upload.attempts);
    } else {
      std::format_to(out, "  [FAILED] {} after {} attempt(s): {}\n",
                     upload.artifact.path.filename().string(), upload.attempts,
                     upload.error);
    }
  }

  if (!report.log_tail.empty()) {
    std::format_to(out, "\nRecent log:\n");
    for (const auto& line : report.log_tail) {
      std::format_to(out, "{}\n", line);
    }
  }
  return message;
}

auto render_mail(const RenderedMessage& message,
                 const std::vector<std::string>& recipients,
                 std::string_view sender) -> std::string {
  return std::format(
      "To: {}\nFrom: {}\nSubject: {}\nContent-Type: text/plain; "
      "charset=utf-8\nX-Mailer: pgbackup\n\n{}",
      join(recipients, ", "), sender, message.subject, message.body);
}

auto ShellTransport::send(const RenderedMessage& message,
                          const std::vector<std::string>& recipients,
                          std::string_view sender) -> Result<void> {
  TemplateVars vars{
      {"subject", message.subject},
      {"recipients", join(recipients, ",")},
      {"sender", std::string(sender)},
  };

  ShellExecutorConfig config;
  config.command = expand_template(config_.command, vars, true);
  config.execution_timeout = timeout_;
  config.stdin_data = config_.headers ? render_mail(message, recipients, sender)
                                      : message.body;

  auto result = executor_.execute(config, CancellationToken::none());
  if (!result.succeeded()) {
    log::warn("Transport {} failed: {}", config_.name, result.describe_failure());
    for (const auto& line : tail_lines(result.output, 3)) {
      log::warn("  {}: {}", config_.name, line);
    }
    return fail(result.timed_out ? Error::Timeout : Error::DeliveryFailed);
  }
  return ok();
}

auto write_fallback(const std::filesystem::path& file,
                    const RenderedMessage& message,
                    const std::vector<std::string>& recipients)
    -> Result<void> {
  if (file.empty()) {
    return fail(Error::InvalidArgument);
  }

  std::FILE* f = std::fopen(file.c_str(), "a");
  if (!f) {
    log::error("Cannot open notification fallback file {}", file.string());
    return fail(Error::FileOpenFailed);
  }
  auto text = std::format("==== {} ====\nTo: {}\nSubject: {}\n\n{}\n",
                          format_timestamp(), join(recipients, ", "),
                          message.subject, message.body);
  auto written = std::fwrite(text.data(), 1, text.size(), f);
  auto closed = std::fclose(f);
  if (written != text.size() || closed != 0) {
    log::error("Failed to write notification fallback file {}", file.string());
    return fail(Error::FileOpenFailed);
  }
  return ok();
}

auto Notifier::notify(const RunReport& report, const RunContext& ctx)
    -> Result<void> {
  if (report.verdict == Verdict::Success && !ctx.notify.notify_on_success) {
    log::info("Run succeeded; success notifications are disabled");
    return ok();
  }

  auto message = render_report(report);
  const auto& recipients = ctx.notify.recipients;

  if (recipients.empty()) {
    log::warn("No notification recipients configured");
  } else {
    for (const auto& transport : transports_) {
      if (auto r = transport->send(message, recipients, ctx.notify.sender); r) {
        log::info("Notification '{}' sent to {} via {}", message.subject,
                  join(recipients, ", "), transport->name());
        return ok();
      }
    }
    log::warn("All {} notification transport(s) failed", transports_.size());
  }

  if (auto r = write_fallback(ctx.notify.fallback_file, message, recipients);
      !r) {
    return fail(Error::DeliveryFailed);
  }
  log::warn("Notification saved to {}", ctx.notify.fallback_file);
  return ok();
}

auto make_notifier(const NotifyConfig& config, IExecutor& executor)
    -> std::unique_ptr<Notifier> {
  std::vector<std::unique_ptr<ITransport>> transports;
  for (const auto& transport : config.transports) {
    transports.push_back(std::make_unique<ShellTransport>(
        transport, executor, std::chrono::seconds(config.timeout_sec)));
  }
  return std::make_unique<Notifier>(std::move(transports));
}

}  // namespace pgbackup

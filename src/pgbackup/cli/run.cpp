#include "pgbackup/backup/readiness_probe.hpp"
#include "pgbackup/backup/run_context.hpp"
#include "pgbackup/backup/task_runner.hpp"
#include "pgbackup/cli/commands.hpp"
#include "pgbackup/config/config.hpp"
#include "pgbackup/executor/executor.hpp"
#include "pgbackup/notify/notifier.hpp"
#include "pgbackup/orchestrator/orchestrator.hpp"
#include "pgbackup/retention/retention_sweeper.hpp"
#include "pgbackup/storage/run_history.hpp"
#include "pgbackup/upload/upload_stage.hpp"
#include "pgbackup/util/log.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <format>
#include <memory>
#include <optional>
#include <print>
#include <thread>

namespace pgbackup::cli {

namespace {

std::atomic<int> g_signal_received{0};

void signal_handler(int sig) {
  g_signal_received.store(sig, std::memory_order_release);
}

// Turns SIGINT/SIGTERM and the run deadline into a cancellation of the
// current run. Polls instead of cancelling from the signal handler.
class RunWatchdog {
public:
  RunWatchdog(CancellationSource source, std::chrono::seconds run_timeout)
      : thread_([source, run_timeout](std::stop_token stop) mutable {
          auto deadline = std::chrono::steady_clock::now() + run_timeout;
          while (!stop.stop_requested()) {
            if (auto sig = g_signal_received.load(std::memory_order_acquire)) {
              log::warn("Received signal {}, cancelling the run", sig);
              source.cancel();
              return;
            }
            if (run_timeout.count() > 0 &&
                std::chrono::steady_clock::now() >= deadline) {
              log::error("Run exceeded its {} s deadline, cancelling",
                         run_timeout.count());
              source.cancel();
              return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
          }
        }) {
  }

private:
  std::jthread thread_;
};

auto fail_config(std::string_view message) -> int {
  std::println(stderr, "Error: {}", message);
  log::error("Configuration error: {}", message);
  log::info("run completed with exit status {}", kConfigErrorExitCode);
  return kConfigErrorExitCode;
}

}  // namespace

auto cmd_run(const RunOptions& opts) -> int {
  auto loaded = ConfigLoader::load(opts.config_file);
  if (!loaded) {
    return fail_config(std::format("cannot load configuration: {}",
                                   loaded.error().message()));
  }
  auto config = std::move(*loaded);

  log::set_level(opts.log_level.empty() ? std::string_view{config.logging.level}
                                        : std::string_view{opts.log_level});
  if (!config.logging.file.empty() && !log::open_file(config.logging.file)) {
    log::warn("Cannot open log file {}; logging to the console only",
              config.logging.file);
  }

  if (auto problems = validate_config(config); !problems.empty()) {
    for (const auto& problem : problems) {
      log::error("Invalid configuration: {}", problem);
    }
    return fail_config(std::format("{} configuration problem(s); run "
                                   "'pgbackup validate' for details",
                                   problems.size()));
  }

  auto ctx = make_run_context(config, std::chrono::system_clock::now());

  auto executor = create_shell_executor();
  ShellReadinessProbe probe{*executor};
  TaskRunner runner{*executor};
  UploadStage uploader{*executor};
  auto notifier = make_notifier(config.notify, *executor);
  RetentionSweeper sweeper;

  Orchestrator orchestrator{probe, runner, uploader, *notifier, sweeper};

  std::optional<RunHistory> history;
  if (!config.storage.history_db.empty()) {
    history.emplace(config.storage.history_db);
    if (auto r = history->open(); r) {
      orchestrator.set_history(&*history);
    } else {
      log::warn("Run history disabled: {}", r.error().message());
    }
  }
  if (!config.storage.report_file.empty()) {
    orchestrator.set_report_file(config.storage.report_file);
  }

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  CancellationSource cancel;
  RunReport report;
  {
    RunWatchdog watchdog{cancel, ctx.run_timeout};
    report = orchestrator.run(ctx, cancel.token());
  }

  auto status = exit_code(report.verdict);
  log::info("run completed with exit status {}", status);
  return status;
}

}  // namespace pgbackup::cli

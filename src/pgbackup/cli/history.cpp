#include "pgbackup/cli/commands.hpp"
#include "pgbackup/config/config.hpp"
#include "pgbackup/storage/run_history.hpp"
#include "pgbackup/util/util.hpp"

#include <chrono>
#include <print>

namespace pgbackup::cli {

namespace {

auto show_run(RunHistory& db, const std::string& run_id) -> int {
  auto report = db.get_report_json(run_id);
  if (!report) {
    std::println(stderr, "Error: run {} not found", run_id);
    return 1;
  }
  std::println("{}", *report);

  auto artifacts = db.list_artifacts(run_id);
  if (!artifacts) {
    std::println(stderr, "Error: {}", artifacts.error().message());
    return 1;
  }
  if (!artifacts->empty()) {
    std::println("\n{:<10} {:<10} {:<9} {}", "KIND", "SIZE", "UPLOADED", "PATH");
  }
  for (const auto& a : *artifacts) {
    std::println("{:<10} {:<10} {:<9} {}", to_string_view(a.kind),
                 format_bytes(static_cast<std::uintmax_t>(a.size_bytes)),
                 a.uploaded ? "yes" : "no", a.path);
  }
  return 0;
}

}  // namespace

auto cmd_history(const HistoryOptions& opts) -> int {
  auto config = ConfigLoader::load(opts.config_file);
  if (!config) {
    std::println(stderr, "Error: cannot load configuration: {}",
                 config.error().message());
    return kConfigErrorExitCode;
  }
  if (config->storage.history_db.empty()) {
    std::println(stderr, "Error: storage.history_db is not configured");
    return kConfigErrorExitCode;
  }

  RunHistory db(config->storage.history_db);
  if (auto r = db.open(); !r) {
    std::println(stderr, "Error: Failed to open run history: {}",
                 r.error().message());
    return 1;
  }

  if (!opts.run_id.empty()) {
    return show_run(db, opts.run_id);
  }

  auto runs = db.list_runs(opts.limit);
  if (!runs) {
    std::println(stderr, "Error: {}", runs.error().message());
    return 1;
  }
  if (runs->empty()) {
    std::println("No runs recorded.");
    return 0;
  }

  std::println("{:<36} {:<17} {:<18} {:<4} {:<9} {:<10} {}", "RUN_ID",
               "TIMESTAMP", "VERDICT", "EXIT", "ARTIFACTS", "SIZE",
               "DURATION");
  for (const auto& run : *runs) {
    auto seconds = static_cast<double>(run.finished_at - run.started_at) / 1000.0;
    std::println("{:<36} {:<17} {:<18} {:<4} {:<9} {:<10} {:.1f}s", run.run_id,
                 run.timestamp, to_string_view(run.verdict), run.exit_code,
                 run.artifact_count,
                 format_bytes(static_cast<std::uintmax_t>(run.total_bytes)),
                 seconds);
    if (!run.failure_reason.empty()) {
      std::println("  {}", run.failure_reason);
    }
  }
  return 0;
}

}  // namespace pgbackup::cli

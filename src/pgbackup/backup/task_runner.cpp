#include "pgbackup/backup/task_runner.hpp"

#include "pgbackup/core/error.hpp"
#include "pgbackup/util/command_template.hpp"
#include "pgbackup/util/log.hpp"
#include "pgbackup/util/util.hpp"

#include <chrono>
#include <exception>
#include <format>
#include <system_error>

namespace pgbackup {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kDefaultWalPattern = "pg_wal_{timestamp}.tar.gz";
constexpr std::string_view kStagingSuffix = ".partial";

// Paths a single task may create. Everything listed here is removed when
// the task fails so no partial artifact is mistaken for a complete one.
struct TaskPaths {
  fs::path output;
  fs::path wal;
  fs::path staging;
  // Tablespace archives already moved out of staging.
  std::vector<fs::path> extras;
};

auto remove_partial(const TaskPaths& paths) -> void {
  std::error_code ec;
  std::vector<fs::path> created{paths.output, paths.wal};
  created.insert(created.end(), paths.extras.begin(), paths.extras.end());
  for (const auto& p : created) {
    if (!p.empty() && fs::remove(p, ec)) {
      log::warn("Removed partial artifact {}", p.string());
    }
  }
  if (!paths.staging.empty()) {
    fs::remove_all(paths.staging, ec);
  }
}

auto regular_size(const fs::path& p) -> std::uintmax_t {
  std::error_code ec;
  if (!fs::is_regular_file(p, ec)) {
    return 0;
  }
  auto size = fs::file_size(p, ec);
  return ec ? 0 : size;
}

auto is_tar_archive(const fs::path& p) -> bool {
  auto name = p.filename().string();
  return name.ends_with(".tar") || name.ends_with(".tar.gz");
}

// Moves pg_basebackup's tar-mode archives from the staging directory to
// their final names. Tablespace archives are appended to `paths.extras`.
// Anything else left in staging (backup_manifest) is dropped with it.
auto collect_physical(TaskPaths& paths) -> Result<void> {
  std::error_code ec;

  auto base = paths.staging / kBaseArchiveName;
  if (fs::exists(base, ec)) {
    fs::rename(base, paths.output, ec);
    if (ec) {
      log::error("Failed to move {} to {}: {}", base.string(),
                 paths.output.string(), ec.message());
      return fail(ec);
    }
  }

  auto wal = paths.staging / kWalArchiveName;
  if (fs::exists(wal, ec)) {
    fs::rename(wal, paths.wal, ec);
    if (ec) {
      log::error("Failed to move {} to {}: {}", wal.string(),
                 paths.wal.string(), ec.message());
      return fail(ec);
    }
  }

  if (!fs::is_directory(paths.staging, ec)) {
    return ok();
  }

  // Remaining archives are tablespaces (<oid>.tar.gz).
  auto stem = paths.output.filename().string();
  if (stem.ends_with(".tar.gz")) {
    stem.resize(stem.size() - 7);
  }
  for (const auto& entry : fs::directory_iterator(paths.staging, ec)) {
    if (!entry.is_regular_file(ec)) {
      continue;
    }
    if (!is_tar_archive(entry.path())) {
      log::debug("Discarding {} from staging", entry.path().filename().string());
      continue;
    }
    auto target = paths.output.parent_path() /
                  std::format("{}_{}", stem, entry.path().filename().string());
    fs::rename(entry.path(), target, ec);
    if (ec) {
      log::error("Failed to move {} to {}: {}", entry.path().string(),
                 target.string(), ec.message());
      return fail(ec);
    }
    paths.extras.push_back(target);
  }
  return ok();
}

auto run_task(IExecutor& executor, const TaskSpec& spec, const RunContext& ctx,
              const CancellationToken& cancel, TaskOutcome& outcome) -> void {
  auto vars = ctx.template_vars();

  TaskPaths paths;
  paths.output = ctx.output_dir / expand_template(spec.output, vars, false);
  if (spec.kind == TaskKind::Physical) {
    auto wal_pattern =
        spec.wal_output.empty() ? kDefaultWalPattern : spec.wal_output;
    paths.wal = ctx.output_dir / expand_template(wal_pattern, vars, false);
    paths.staging = paths.output;
    paths.staging += kStagingSuffix;
  }

  std::error_code ec;
  fs::create_directories(ctx.output_dir, ec);
  if (ec) {
    outcome.error = std::format("cannot create output directory {}: {}",
                                ctx.output_dir.string(), ec.message());
    return;
  }

  // Artifacts are append-only: never overwrite what an earlier run produced.
  for (const auto& p : {paths.output, paths.wal}) {
    if (!p.empty() && fs::exists(p, ec)) {
      outcome.error =
          std::format("refusing to overwrite existing file {}", p.string());
      return;
    }
  }

  if (!paths.staging.empty()) {
    fs::remove_all(paths.staging, ec);
    fs::create_directory(paths.staging, ec);
    if (ec) {
      outcome.error = std::format("cannot create staging directory {}: {}",
                                  paths.staging.string(), ec.message());
      return;
    }
  }

  vars["output"] = paths.output.string();
  vars["wal_output"] = paths.wal.string();
  vars["staging_dir"] = paths.staging.string();

  ShellExecutorConfig config;
  config.command = expand_template(spec.command, vars, true);
  config.working_dir = ctx.output_dir.string();
  config.execution_timeout = spec.execution_timeout;
  config.env = ctx.producer_env();

  log::info("Starting {} backup: {}", spec.name, paths.output.string());
  log::debug("{}: {}", spec.name, config.command);

  auto result = executor.execute(config, cancel);
  outcome.exit_code = result.exit_code;
  outcome.diagnostics = tail_lines(result.output, kDiagnosticTailLines);

  if (!result.succeeded()) {
    outcome.error = std::format("producer failed: {}", result.describe_failure());
    remove_partial(paths);
    return;
  }

  if (spec.kind == TaskKind::Physical) {
    if (auto collected = collect_physical(paths); !collected) {
      outcome.error = std::format("cannot collect base backup archives: {}",
                                  collected.error().message());
      remove_partial(paths);
      return;
    }
    fs::remove_all(paths.staging, ec);
  }

  // A producer that exits 0 without writing anything is a failure.
  auto size = regular_size(paths.output);
  if (size == 0) {
    outcome.error = std::format(
        "producer reported success but {} is missing or empty",
        paths.output.string());
    remove_partial(paths);
    return;
  }

  auto main_kind = spec.kind == TaskKind::Physical ? ArtifactKind::Physical
                                                   : ArtifactKind::Logical;
  outcome.artifacts.push_back(Artifact{paths.output, main_kind, size});

  for (const auto& extra : paths.extras) {
    outcome.artifacts.push_back(
        Artifact{extra, ArtifactKind::Physical, regular_size(extra)});
  }

  if (!paths.wal.empty() && fs::exists(paths.wal, ec)) {
    auto wal_size = regular_size(paths.wal);
    if (wal_size == 0) {
      outcome.artifacts.clear();
      outcome.error = std::format("write-ahead-log archive {} is empty",
                                  paths.wal.string());
      remove_partial(paths);
      return;
    }
    outcome.artifacts.push_back(
        Artifact{paths.wal, ArtifactKind::WriteAheadLog, wal_size});
  }

  for (const auto& artifact : outcome.artifacts) {
    outcome.size_bytes += artifact.size_bytes;
  }
  outcome.status = OutcomeStatus::Succeeded;
}

}  // namespace

auto TaskRunner::execute(const TaskSpec& spec, const RunContext& ctx,
                         const CancellationToken& cancel) -> TaskOutcome {
  TaskOutcome outcome;
  outcome.task_name = spec.name;
  outcome.kind = spec.kind;

  auto start = std::chrono::steady_clock::now();
  try {
    run_task(executor_, spec, ctx, cancel, outcome);
  } catch (const std::exception& e) {
    outcome.status = OutcomeStatus::Failed;
    outcome.artifacts.clear();
    outcome.error = std::format("internal error: {}", e.what());
  }
  outcome.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);

  if (outcome.succeeded()) {
    log::info("{} backup completed successfully: {} ({}, {} ms)", spec.name,
              outcome.artifacts.front().path.string(),
              format_bytes(outcome.size_bytes), outcome.duration.count());
  } else {
    log::error("{} backup FAILED: {}", spec.name, outcome.error);
    for (const auto& line : outcome.diagnostics) {
      log::error("  {}: {}", spec.name, line);
    }
  }
  return outcome;
}

}  // namespace pgbackup

#include "pgbackup/retention/retention_sweeper.hpp"
#include "pgbackup/util/command_template.hpp"
#include "pgbackup/util/log.hpp"

#include "test_utils.hpp"

#include <benchmark/benchmark.h>

#include <format>

using namespace pgbackup;

// A month of nightly runs: one dump plus base and WAL archives per night,
// half of them past the retention window.
static void populate(const test::TempDir& dir, int nights) {
  for (int i = 0; i < nights; ++i) {
    auto stamp = std::format("2024-01-{:02}-020000", i % 28 + 1);
    for (auto name : {std::format("db{}_{}.dump", i, stamp),
                      std::format("pg_base_backup{}_{}.tar.gz", i, stamp),
                      std::format("pg_wal{}_{}.tar.gz", i, stamp)}) {
      auto path = dir / name;
      test::write_file(path, "x");
      if (i % 2 == 0) {
        test::set_age(path, std::chrono::hours(24 * 30));
      }
    }
  }
  test::write_file(dir / "notes.txt", "keep");
}

static void BM_RetentionExpired(benchmark::State& state) {
  log::set_level(log::Level::Error);
  test::TempDir dir;
  populate(dir, static_cast<int>(state.range(0)));
  RetentionSweeper sweeper;

  for (auto _ : state) {
    auto expired = sweeper.expired(dir.path(), 7);
    if (!expired) {
      state.SkipWithError("Failed to scan backup directory");
      return;
    }
    benchmark::DoNotOptimize(expired);
  }

  state.SetItemsProcessed(state.range(0) * 3 * state.iterations());
}

static void BM_RetentionIsArtifactName(benchmark::State& state) {
  RetentionSweeper sweeper;
  std::vector<std::string> names = {
      "production_db_2024-01-01-020000.dump",
      "pg_base_backup_2024-01-01-020000.tar.gz",
      "pg_wal_2024-01-01-020000.tar.gz",
      "pg_backup.log",
      ".pgbackup.lock",
      "base.tar",
  };

  for (auto _ : state) {
    for (const auto& name : names) {
      auto matched = sweeper.is_artifact_name(name);
      benchmark::DoNotOptimize(matched);
    }
  }

  state.SetItemsProcessed(names.size() * state.iterations());
}

static void BM_ExpandUploadCommand(benchmark::State& state) {
  TemplateVars vars = {
      {"file", "/var/backups/postgresql/pg_base_backup_2024-01-01-020000.tar.gz"},
      {"remote", "gdrive_backups:"},
  };

  for (auto _ : state) {
    auto command = expand_template("rclone copy {file} {remote}", vars, true);
    benchmark::DoNotOptimize(command);
  }
}

BENCHMARK(BM_RetentionExpired)->Arg(30)->Arg(365);
BENCHMARK(BM_RetentionIsArtifactName);
BENCHMARK(BM_ExpandUploadCommand);

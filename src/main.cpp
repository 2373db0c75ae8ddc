#include "pgbackup/cli/commands.hpp"

#include <charconv>
#include <cstdlib>
#include <print>
#include <string>
#include <string_view>

namespace {

void print_usage(const char* prog) {
  std::println("pgbackup - PostgreSQL backup orchestration");
  std::println("Usage: {} [COMMAND] [OPTIONS]", prog);
  std::println("");
  std::println("Commands:");
  std::println("  run                   Run one backup (default)");
  std::println("  validate              Check the configuration and exit");
  std::println("  history               List recorded runs");
  std::println("");
  std::println("Options:");
  std::println("  -c, --config <file>   Config file (YAML). Default: "
               "$PGBACKUP_CONFIG, then /etc/pgbackup/pgbackup.yaml");
  std::println("  --log-level <level>   trace, debug, info, warn or error");
  std::println("  -p, --print           validate: print the effective config");
  std::println("  -n, --limit <n>       history: number of runs (default: 20)");
  std::println("  --show <run_id>       history: print one run's report");
  std::println("  -v, --version         Show version and exit");
  std::println("  -h, --help            Show this help message");
  std::println("");
  std::println("Exit status of 'run':");
  std::println("  0   backups created (and uploaded when enabled)");
  std::println("  1   database not ready or another run holds the lock");
  std::println("  2   a backup task failed or the run was cancelled");
  std::println("  3   backups created but an upload failed");
  std::println("  64  invalid command line");
  std::println("  78  configuration could not be loaded or is invalid");
}

void print_version() {
  std::println("pgbackup v0.1.0");
}

enum class Command {
  Run,
  Validate,
  History,
};

struct Options {
  Command command{Command::Run};
  std::string config_file;
  std::string log_level;
  bool print{false};
  std::size_t limit{20};
  std::string show_run;
};

auto require_value(int& i, int argc, char* argv[], std::string_view flag)
    -> std::string_view {
  if (++i >= argc) {
    std::println(stderr, "Error: {} requires an argument", flag);
    std::exit(pgbackup::cli::kUsageExitCode);
  }
  return argv[i];
}

auto parse_args(int argc, char* argv[]) -> Options {
  Options opts;
  int i = 1;

  if (i < argc) {
    std::string_view first = argv[i];
    if (first == "run") {
      ++i;
    } else if (first == "validate") {
      opts.command = Command::Validate;
      ++i;
    } else if (first == "history") {
      opts.command = Command::History;
      ++i;
    }
  }

  for (; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "-v" || arg == "--version") {
      print_version();
      std::exit(0);
    } else if (arg == "-c" || arg == "--config") {
      opts.config_file = require_value(i, argc, argv, arg);
    } else if (arg == "--log-level") {
      opts.log_level = require_value(i, argc, argv, arg);
    } else if (arg == "-p" || arg == "--print") {
      opts.print = true;
    } else if (arg == "-n" || arg == "--limit") {
      auto value = require_value(i, argc, argv, arg);
      auto [ptr, ec] =
          std::from_chars(value.data(), value.data() + value.size(), opts.limit);
      if (ec != std::errc{} || ptr != value.data() + value.size()) {
        std::println(stderr, "Error: invalid limit '{}'", value);
        std::exit(pgbackup::cli::kUsageExitCode);
      }
    } else if (arg == "--show") {
      opts.show_run = require_value(i, argc, argv, arg);
    } else {
      std::println(stderr, "Unknown option: {}", arg);
      print_usage(argv[0]);
      std::exit(pgbackup::cli::kUsageExitCode);
    }
  }

  return opts;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto opts = parse_args(argc, argv);

  switch (opts.command) {
    case Command::Validate:
      return pgbackup::cli::cmd_validate({opts.config_file, opts.print});
    case Command::History:
      return pgbackup::cli::cmd_history(
          {opts.config_file, opts.limit, opts.show_run});
    case Command::Run:
      break;
  }
  return pgbackup::cli::cmd_run({opts.config_file, opts.log_level});
}

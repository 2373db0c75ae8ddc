#include "pgbackup/backup/report.hpp"
#include "pgbackup/cli/commands.hpp"
#include "pgbackup/config/config.hpp"

#include <print>

namespace pgbackup::cli {

auto cmd_validate(const ValidateOptions& opts) -> int {
  auto result = ConfigLoader::load(opts.config_file);
  if (!result) {
    std::println(stderr, "Error: cannot load configuration: {}",
                 result.error().message());
    return kConfigErrorExitCode;
  }
  const auto& config = *result;

  auto problems = validate_config(config);
  for (const auto& problem : problems) {
    std::println("✗ {}", problem);
  }
  if (!problems.empty()) {
    std::println("\n{} problem(s) found", problems.size());
    return kConfigErrorExitCode;
  }

  std::println("✓ {} on {}:{} as {}", config.target.database,
               config.target.host, config.target.port, config.target.user);
  for (const auto& task : config.tasks) {
    std::println("✓ task {} ({}{})", task.name, to_string_view(task.kind),
                 task.fatal ? "" : ", non-fatal");
  }
  std::println("✓ backups in {}, kept {} days", config.backup.output_dir,
               config.backup.retention_days);
  if (config.upload.enabled) {
    std::println("✓ upload to {}", config.upload.remote);
  } else {
    std::println("- upload disabled");
  }

  if (opts.print) {
    std::println("\n{}", ConfigLoader::to_string(config));
  }
  return 0;
}

}  // namespace pgbackup::cli

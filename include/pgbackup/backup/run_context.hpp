#pragma once

#include "pgbackup/config/system_config.hpp"
#include "pgbackup/util/command_template.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace pgbackup {

// Immutable configuration of one invocation. Built once before the run
// starts and only read afterwards.
struct RunContext {
  std::string run_id;
  std::string timestamp;
  std::chrono::system_clock::time_point started_at{};

  TargetConfig target;
  std::filesystem::path output_dir;
  std::filesystem::path lock_file;
  int retention_days{7};
  std::chrono::seconds run_timeout{0};

  std::vector<TaskSpec> tasks;
  PreflightConfig preflight;
  UploadConfig upload;
  NotifyConfig notify;

  // Placeholder values shared by every command and file name template.
  [[nodiscard]] auto template_vars() const -> TemplateVars;

  // Environment for external producers (PGPASSFILE when configured).
  [[nodiscard]] auto producer_env() const -> std::map<std::string, std::string>;
};

[[nodiscard]] auto make_run_context(const SystemConfig& config,
                                    std::chrono::system_clock::time_point now)
    -> RunContext;

}  // namespace pgbackup

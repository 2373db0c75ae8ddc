#include "pgbackup/backup/run_context.hpp"

#include "pgbackup/util/util.hpp"

namespace pgbackup {

auto RunContext::template_vars() const -> TemplateVars {
  return {
      {"host", target.host},
      {"port", std::to_string(target.port)},
      {"database", target.database},
      {"user", target.user},
      {"timestamp", timestamp},
      {"output_dir", output_dir.string()},
      {"remote", upload.remote},
      {"sender", notify.sender},
  };
}

auto RunContext::producer_env() const -> std::map<std::string, std::string> {
  std::map<std::string, std::string> env;
  if (!target.passfile.empty()) {
    env["PGPASSFILE"] = target.passfile;
  }
  return env;
}

auto make_run_context(const SystemConfig& config,
                      std::chrono::system_clock::time_point now) -> RunContext {
  RunContext ctx;
  ctx.run_id = generate_uuid();
  ctx.timestamp = make_timestamp_token(now);
  ctx.started_at = now;
  ctx.target = config.target;
  ctx.output_dir = config.backup.output_dir;
  ctx.lock_file = config.backup.lock_file.empty()
                      ? ctx.output_dir / ".pgbackup.lock"
                      : std::filesystem::path{config.backup.lock_file};
  ctx.retention_days = config.backup.retention_days;
  ctx.run_timeout = std::chrono::seconds(config.backup.run_timeout_sec);
  ctx.tasks = config.tasks;
  ctx.preflight = config.preflight;
  ctx.upload = config.upload;
  ctx.notify = config.notify;
  return ctx;
}

}  // namespace pgbackup

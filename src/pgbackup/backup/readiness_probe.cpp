#include "pgbackup/backup/readiness_probe.hpp"

#include "pgbackup/util/command_template.hpp"
#include "pgbackup/util/log.hpp"
#include "pgbackup/util/util.hpp"

namespace pgbackup {

auto ShellReadinessProbe::probe(const RunContext& ctx,
                                const CancellationToken& cancel)
    -> Result<void> {
  ShellExecutorConfig config;
  config.command =
      expand_template(ctx.preflight.command, ctx.template_vars(), true);
  config.execution_timeout = std::chrono::seconds(ctx.preflight.timeout_sec);
  config.env = ctx.producer_env();

  log::info("Checking that {}:{}/{} is reachable", ctx.target.host,
            ctx.target.port, ctx.target.database);
  auto result = executor_.execute(config, cancel);
  if (result.succeeded()) {
    return ok();
  }

  log::error("Readiness probe failed: {}", result.describe_failure());
  for (const auto& line : tail_lines(result.output, 5)) {
    log::error("  probe: {}", line);
  }
  if (result.cancelled) {
    return fail(Error::Cancelled);
  }
  if (result.timed_out) {
    return fail(Error::Timeout);
  }
  return fail(Error::TargetUnreachable);
}

}  // namespace pgbackup

#include "pgbackup/upload/upload_stage.hpp"

#include "pgbackup/util/command_template.hpp"
#include "pgbackup/util/log.hpp"
#include "pgbackup/util/util.hpp"

#include <algorithm>
#include <atomic>
#include <format>
#include <mutex>
#include <thread>

namespace pgbackup {

namespace {

// Sleeps for `delay` unless the run is cancelled first.
auto backoff(std::chrono::milliseconds delay, const CancellationToken& cancel)
    -> bool {
  auto deadline = std::chrono::steady_clock::now() + delay;
  while (std::chrono::steady_clock::now() < deadline) {
    if (cancel.is_cancelled()) {
      return false;
    }
    std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(
        std::chrono::milliseconds(50),
        deadline - std::chrono::steady_clock::now()));
  }
  return !cancel.is_cancelled();
}

// Outcomes land in their input slot so the result keeps input order no
// matter which worker finishes first.
class OutcomeCollector {
public:
  explicit OutcomeCollector(std::size_t n) : outcomes_(n) {
  }

  auto put(std::size_t idx, UploadOutcome outcome) -> void {
    std::lock_guard lock(mutex_);
    outcomes_[idx] = std::move(outcome);
  }

  [[nodiscard]] auto take() -> std::vector<UploadOutcome> {
    std::lock_guard lock(mutex_);
    return std::move(outcomes_);
  }

private:
  std::mutex mutex_;
  std::vector<UploadOutcome> outcomes_;
};

}  // namespace

auto UploadStage::upload_one(const Artifact& artifact, const RunContext& ctx,
                             const RetryPolicy& policy,
                             const CancellationToken& cancel) -> UploadOutcome {
  UploadOutcome outcome;
  outcome.artifact = artifact;

  auto vars = ctx.template_vars();
  vars["file"] = artifact.path.string();

  ShellExecutorConfig config;
  config.command = expand_template(ctx.upload.command, vars, true);
  config.execution_timeout = std::chrono::seconds(ctx.upload.timeout_sec);

  int retries = 0;
  while (true) {
    ++outcome.attempts;
    log::info("Uploading {} to {} (attempt {})", artifact.path.string(),
              ctx.upload.remote, outcome.attempts);

    auto result = executor_.execute(config, cancel);
    if (result.succeeded()) {
      outcome.status = OutcomeStatus::Succeeded;
      outcome.error.clear();
      log::info("Upload of {} succeeded", artifact.path.filename().string());
      return outcome;
    }

    outcome.error = result.describe_failure();
    auto last = tail_lines(result.output, 1);
    if (!last.empty()) {
      outcome.error += std::format(": {}", last.back());
    }
    log::warn("Upload of {} failed: {}", artifact.path.filename().string(),
              outcome.error);

    if (result.cancelled || !policy.should_retry(retries)) {
      break;
    }
    ++retries;
    if (!backoff(policy.delay_before_retry(retries), cancel)) {
      outcome.error += " (cancelled before retry)";
      break;
    }
  }

  log::error("Upload of {} FAILED after {} attempt(s)",
             artifact.path.filename().string(), outcome.attempts);
  return outcome;
}

auto UploadStage::upload_all(const std::vector<Artifact>& artifacts,
                             const RunContext& ctx,
                             const CancellationToken& cancel)
    -> std::vector<UploadOutcome> {
  if (artifacts.empty()) {
    return {};
  }

  RetryPolicy policy{ctx.upload.max_retries,
                     std::chrono::milliseconds(ctx.upload.backoff_ms)};
  auto workers = std::clamp<std::size_t>(
      static_cast<std::size_t>(std::max(1, ctx.upload.max_parallel)), 1,
      std::min<std::size_t>(artifacts.size(), MAX_PARALLEL_UPLOADS));

  log::info("Uploading {} artifact(s) to {} with {} worker(s)",
            artifacts.size(), ctx.upload.remote, workers);

  OutcomeCollector collector{artifacts.size()};
  std::atomic<std::size_t> next{0};

  auto worker = [&] {
    while (true) {
      auto idx = next.fetch_add(1, std::memory_order_relaxed);
      if (idx >= artifacts.size()) {
        return;
      }
      collector.put(idx, upload_one(artifacts[idx], ctx, policy, cancel));
    }
  };

  {
    std::vector<std::jthread> threads;
    threads.reserve(workers - 1);
    for (std::size_t i = 1; i < workers; ++i) {
      threads.emplace_back(worker);
    }
    worker();
  }

  return collector.take();
}

}  // namespace pgbackup

#pragma once

#include "pgbackup/config/task_spec.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pgbackup {

enum class ArtifactKind : std::uint8_t {
  Logical,
  Physical,
  WriteAheadLog,
};

enum class OutcomeStatus : std::uint8_t {
  Succeeded,
  Failed,
};

enum class Verdict : std::uint8_t {
  Success,
  BackupFailure,
  UploadFailure,
  PreflightFailure,
};

enum class RunState : std::uint8_t {
  Preflight,
  RunningTasks,
  Uploading,
  Notifying,
  Sweeping,
  Done,
  Aborted,
};

[[nodiscard]] constexpr auto to_string_view(ArtifactKind kind) noexcept
    -> std::string_view {
  switch (kind) {
    case ArtifactKind::Logical: return "logical";
    case ArtifactKind::Physical: return "physical";
    case ArtifactKind::WriteAheadLog: return "wal";
  }
  std::unreachable();
}

[[nodiscard]] constexpr auto to_string_view(OutcomeStatus status) noexcept
    -> std::string_view {
  switch (status) {
    case OutcomeStatus::Succeeded: return "succeeded";
    case OutcomeStatus::Failed: return "failed";
  }
  std::unreachable();
}

[[nodiscard]] constexpr auto to_string_view(Verdict verdict) noexcept
    -> std::string_view {
  switch (verdict) {
    case Verdict::Success: return "success";
    case Verdict::BackupFailure: return "backup_failure";
    case Verdict::UploadFailure: return "upload_failure";
    case Verdict::PreflightFailure: return "preflight_failure";
  }
  std::unreachable();
}

[[nodiscard]] constexpr auto to_string_view(RunState state) noexcept
    -> std::string_view {
  switch (state) {
    case RunState::Preflight: return "preflight";
    case RunState::RunningTasks: return "running_tasks";
    case RunState::Uploading: return "uploading";
    case RunState::Notifying: return "notifying";
    case RunState::Sweeping: return "sweeping";
    case RunState::Done: return "done";
    case RunState::Aborted: return "aborted";
  }
  std::unreachable();
}

template <>
[[nodiscard]] inline auto parse<ArtifactKind>(std::string_view s) noexcept
    -> ArtifactKind {
  if (s == "physical") return ArtifactKind::Physical;
  if (s == "wal") return ArtifactKind::WriteAheadLog;
  return ArtifactKind::Logical;
}

template <>
[[nodiscard]] inline auto parse<Verdict>(std::string_view s) noexcept
    -> Verdict {
  if (s == "backup_failure") return Verdict::BackupFailure;
  if (s == "upload_failure") return Verdict::UploadFailure;
  if (s == "preflight_failure") return Verdict::PreflightFailure;
  return Verdict::Success;
}

// Process exit status for each verdict. These values are part of the CLI
// contract and must not change.
[[nodiscard]] constexpr auto exit_code(Verdict verdict) noexcept -> int {
  switch (verdict) {
    case Verdict::Success: return 0;
    case Verdict::PreflightFailure: return 1;
    case Verdict::BackupFailure: return 2;
    case Verdict::UploadFailure: return 3;
  }
  std::unreachable();
}

// No run was possible because the configuration could not be loaded.
inline constexpr int kConfigErrorExitCode = 78;

struct Artifact {
  std::filesystem::path path;
  ArtifactKind kind{ArtifactKind::Logical};
  std::uintmax_t size_bytes{0};
};

struct TaskOutcome {
  std::string task_name;
  TaskKind kind{TaskKind::Logical};
  OutcomeStatus status{OutcomeStatus::Failed};
  // Empty unless the task succeeded.
  std::vector<Artifact> artifacts;
  std::uintmax_t size_bytes{0};
  std::chrono::milliseconds duration{0};
  int exit_code{0};
  // Last lines of the producer's output, at most kDiagnosticTailLines.
  std::vector<std::string> diagnostics;
  std::string error;

  [[nodiscard]] auto succeeded() const noexcept -> bool {
    return status == OutcomeStatus::Succeeded;
  }
};

struct UploadOutcome {
  Artifact artifact;
  OutcomeStatus status{OutcomeStatus::Failed};
  int attempts{0};
  std::string error;

  [[nodiscard]] auto succeeded() const noexcept -> bool {
    return status == OutcomeStatus::Succeeded;
  }
};

struct SweepResult {
  std::size_t deleted{0};
  std::size_t failed{0};
};

struct RunReport {
  std::string run_id;
  std::string timestamp;
  std::string database;
  std::string host;
  std::chrono::system_clock::time_point started_at{};
  std::chrono::system_clock::time_point finished_at{};

  std::vector<TaskOutcome> tasks;
  std::vector<UploadOutcome> uploads;
  Verdict verdict{Verdict::Success};
  std::string failure_reason;

  std::vector<std::string> log_tail;
  // Every state the run entered, in order.
  std::vector<RunState> states;
  std::optional<SweepResult> sweep;
  bool notified{false};

  [[nodiscard]] auto artifacts() const -> std::vector<Artifact> {
    std::vector<Artifact> out;
    for (const auto& task : tasks) {
      out.insert(out.end(), task.artifacts.begin(), task.artifacts.end());
    }
    return out;
  }
};

}  // namespace pgbackup

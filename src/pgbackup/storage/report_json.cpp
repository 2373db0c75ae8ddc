#include "pgbackup/storage/report_json.hpp"

#include "pgbackup/util/log.hpp"
#include "pgbackup/util/util.hpp"

#include <fstream>

namespace pgbackup {

namespace {

auto to_millis(std::chrono::system_clock::time_point tp) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

template <typename Enum>
auto name_of(Enum value) -> std::string {
  return std::string(to_string_view(value));
}

auto artifact_json(const Artifact& artifact) -> nlohmann::json {
  return {
      {"path", artifact.path.string()},
      {"kind", name_of(artifact.kind)},
      {"size_bytes", artifact.size_bytes},
  };
}

}  // namespace

auto to_json(const RunReport& report) -> nlohmann::json {
  nlohmann::json j;
  j["run_id"] = report.run_id;
  j["timestamp"] = report.timestamp;
  j["database"] = report.database;
  j["host"] = report.host;
  j["started_at"] = to_millis(report.started_at);
  j["finished_at"] = to_millis(report.finished_at);
  j["verdict"] = name_of(report.verdict);
  j["exit_code"] = exit_code(report.verdict);
  j["failure_reason"] = report.failure_reason;
  j["notified"] = report.notified;

  auto& tasks = j["tasks"] = nlohmann::json::array();
  for (const auto& task : report.tasks) {
    nlohmann::json t;
    t["name"] = task.task_name;
    t["kind"] = name_of(task.kind);
    t["status"] = name_of(task.status);
    t["size_bytes"] = task.size_bytes;
    t["duration_ms"] = task.duration.count();
    t["exit_code"] = task.exit_code;
    t["error"] = task.error;
    t["diagnostics"] = task.diagnostics;
    t["artifacts"] = nlohmann::json::array();
    for (const auto& artifact : task.artifacts) {
      t["artifacts"].push_back(artifact_json(artifact));
    }
    tasks.push_back(std::move(t));
  }

  auto& uploads = j["uploads"] = nlohmann::json::array();
  for (const auto& upload : report.uploads) {
    uploads.push_back({
        {"artifact", artifact_json(upload.artifact)},
        {"status", name_of(upload.status)},
        {"attempts", upload.attempts},
        {"error", upload.error},
    });
  }

  auto& states = j["states"] = nlohmann::json::array();
  for (auto state : report.states) {
    states.push_back(name_of(state));
  }

  if (report.sweep) {
    j["sweep"] = {{"deleted", report.sweep->deleted},
                  {"failed", report.sweep->failed}};
  } else {
    j["sweep"] = nullptr;
  }
  j["log_tail"] = report.log_tail;
  return j;
}

auto dump_report(const RunReport& report, int indent) -> Result<std::string> {
  try {
    return to_json(report).dump(indent, ' ', false,
                                nlohmann::json::error_handler_t::replace);
  } catch (const nlohmann::json::exception& e) {
    log::error("Failed to serialize report of run {}: {}", report.run_id,
               e.what());
    return fail(Error::ParseError);
  }
}

auto write_report_file(const std::filesystem::path& path,
                       const RunReport& report) -> Result<void> {
  auto json = dump_report(report, 2);
  if (!json) {
    return std::unexpected(json.error());
  }

  auto tmp = path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out.is_open()) {
      log::error("Cannot write report file {}", tmp.string());
      return fail(Error::FileOpenFailed);
    }
    out << *json << '\n';
    if (!out.good()) {
      log::error("Failed writing report file {}", tmp.string());
      return fail(Error::FileOpenFailed);
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    log::error("Cannot move {} into place: {}", tmp.string(), ec.message());
    std::filesystem::remove(tmp, ec);
    return fail(Error::FileOpenFailed);
  }
  return ok();
}

}  // namespace pgbackup

#include "pgbackup/storage/run_history.hpp"

#include "pgbackup/storage/report_json.hpp"
#include "pgbackup/util/log.hpp"

#include <sqlite3.h>

#include <set>

namespace pgbackup {

namespace {

auto to_timestamp(std::chrono::system_clock::time_point tp) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

auto col_text(sqlite3_stmt* stmt, int col) -> std::string {
  auto* p = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
  return p ? p : "";
}

auto bind_text(sqlite3_stmt* stmt, int idx, std::string_view value) -> void {
  sqlite3_bind_text(stmt, idx, value.data(), static_cast<int>(value.size()),
                    SQLITE_TRANSIENT);
}

}  // namespace

auto RunHistory::DbDeleter::operator()(sqlite3* db) const -> void {
  if (db)
    sqlite3_close(db);
}

RunHistory::Statement::~Statement() {
  reset();
}

auto RunHistory::Statement::reset() -> void {
  if (stmt_) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
  }
}

auto RunHistory::prepare(const char* sql) -> Result<sqlite3_stmt*> {
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_.get(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
    log::error("Failed to prepare statement: {}", sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return stmt;
}

RunHistory::RunHistory(std::string_view db_path) : db_path_(db_path) {
}

RunHistory::~RunHistory() {
  close();
}

auto RunHistory::open() -> Result<void> {
  if (db_) {
    return ok();
  }

  sqlite3* raw_db = nullptr;
  int rc = sqlite3_open(db_path_.c_str(), &raw_db);
  if (rc != SQLITE_OK) {
    log::error("Failed to open run history: {}", sqlite3_errmsg(raw_db));
    if (raw_db) {
      sqlite3_close(raw_db);
    }
    return fail(Error::DatabaseOpenFailed);
  }
  db_.reset(raw_db);

  if (auto r = execute("PRAGMA busy_timeout=5000;"); !r) {
    log::warn("Failed to set busy timeout: {}", r.error().message());
  }
  if (auto r = execute("PRAGMA foreign_keys=ON;"); !r) {
    log::warn("Failed to enable foreign keys: {}", r.error().message());
  }

  if (auto r = create_tables(); !r) {
    close();
    return r;
  }

  log::debug("Run history opened: {}", db_path_);
  return ok();
}

auto RunHistory::close() -> void {
  db_.reset();
}

auto RunHistory::create_tables() -> Result<void> {
  const char* sql = R"(
    CREATE TABLE IF NOT EXISTS runs (
      id TEXT PRIMARY KEY,
      timestamp TEXT NOT NULL,
      database_name TEXT NOT NULL,
      verdict TEXT NOT NULL,
      exit_code INTEGER NOT NULL,
      failure_reason TEXT DEFAULT '',
      started_at INTEGER,
      finished_at INTEGER,
      report TEXT NOT NULL
    );

    CREATE TABLE IF NOT EXISTS artifacts (
      id INTEGER PRIMARY KEY AUTOINCREMENT,
      run_id TEXT NOT NULL,
      path TEXT NOT NULL,
      kind TEXT NOT NULL,
      size_bytes INTEGER DEFAULT 0,
      uploaded INTEGER DEFAULT 0,
      FOREIGN KEY (run_id) REFERENCES runs(id) ON DELETE CASCADE
    );

    CREATE INDEX IF NOT EXISTS idx_runs_started ON runs(started_at);
    CREATE INDEX IF NOT EXISTS idx_artifacts_run ON artifacts(run_id);
  )";

  return execute(sql);
}

auto RunHistory::execute(std::string_view sql) -> Result<void> {
  char* err_msg = nullptr;
  std::string sql_str{sql};
  int rc = sqlite3_exec(db_.get(), sql_str.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    log::error("SQL error: {}", err_msg ? err_msg : "unknown");
    sqlite3_free(err_msg);
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

auto RunHistory::record_run(const RunReport& report) -> Result<void> {
  if (!db_) {
    return fail(Error::DatabaseError);
  }
  if (auto r = execute("BEGIN IMMEDIATE;"); !r) {
    return r;
  }

  auto write = [&]() -> Result<void> {
    constexpr auto run_sql = R"(
      INSERT INTO runs (id, timestamp, database_name, verdict, exit_code,
                        failure_reason, started_at, finished_at, report)
      VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);
    )";
    auto prepared = prepare(run_sql);
    if (!prepared)
      return std::unexpected(prepared.error());
    Statement stmt(*prepared);

    auto report_json = dump_report(report);
    if (!report_json)
      return std::unexpected(report_json.error());
    bind_text(stmt.get(), 1, report.run_id);
    bind_text(stmt.get(), 2, report.timestamp);
    bind_text(stmt.get(), 3, report.database);
    bind_text(stmt.get(), 4, to_string_view(report.verdict));
    sqlite3_bind_int(stmt.get(), 5, exit_code(report.verdict));
    bind_text(stmt.get(), 6, report.failure_reason);
    sqlite3_bind_int64(stmt.get(), 7, to_timestamp(report.started_at));
    sqlite3_bind_int64(stmt.get(), 8, to_timestamp(report.finished_at));
    bind_text(stmt.get(), 9, *report_json);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
      log::error("Failed to record run {}: {}", report.run_id,
                 sqlite3_errmsg(db_.get()));
      return fail(Error::DatabaseQueryFailed);
    }

    std::set<std::string> uploaded;
    for (const auto& upload : report.uploads) {
      if (upload.succeeded()) {
        uploaded.insert(upload.artifact.path.string());
      }
    }

    constexpr auto artifact_sql = R"(
      INSERT INTO artifacts (run_id, path, kind, size_bytes, uploaded)
      VALUES (?, ?, ?, ?, ?);
    )";
    for (const auto& artifact : report.artifacts()) {
      auto p = prepare(artifact_sql);
      if (!p)
        return std::unexpected(p.error());
      Statement astmt(*p);
      auto path = artifact.path.string();
      bind_text(astmt.get(), 1, report.run_id);
      bind_text(astmt.get(), 2, path);
      bind_text(astmt.get(), 3, to_string_view(artifact.kind));
      sqlite3_bind_int64(astmt.get(), 4,
                         static_cast<sqlite3_int64>(artifact.size_bytes));
      sqlite3_bind_int(astmt.get(), 5, uploaded.contains(path) ? 1 : 0);
      if (sqlite3_step(astmt.get()) != SQLITE_DONE) {
        return fail(Error::DatabaseQueryFailed);
      }
    }
    return ok();
  };

  if (auto r = write(); !r) {
    if (auto rb = execute("ROLLBACK;"); !rb) {
      log::warn("Rollback failed: {}", rb.error().message());
    }
    return r;
  }
  return execute("COMMIT;");
}

auto RunHistory::list_runs(std::size_t limit)
    -> Result<std::vector<RunHistoryEntry>> {
  if (!db_) {
    return fail(Error::DatabaseError);
  }
  constexpr auto sql = R"(
    SELECT r.id, r.timestamp, r.database_name, r.verdict, r.exit_code,
           r.failure_reason, r.started_at, r.finished_at,
           COUNT(a.id), COALESCE(SUM(a.size_bytes), 0)
    FROM runs r LEFT JOIN artifacts a ON a.run_id = r.id
    GROUP BY r.id
    ORDER BY r.started_at DESC, r.rowid DESC
    LIMIT ?;
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);
  sqlite3_bind_int64(stmt.get(), 1, static_cast<sqlite3_int64>(limit));

  std::vector<RunHistoryEntry> entries;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    RunHistoryEntry e;
    e.run_id = col_text(stmt.get(), 0);
    e.timestamp = col_text(stmt.get(), 1);
    e.database = col_text(stmt.get(), 2);
    e.verdict = parse<Verdict>(col_text(stmt.get(), 3));
    e.exit_code = sqlite3_column_int(stmt.get(), 4);
    e.failure_reason = col_text(stmt.get(), 5);
    e.started_at = sqlite3_column_int64(stmt.get(), 6);
    e.finished_at = sqlite3_column_int64(stmt.get(), 7);
    e.artifact_count = sqlite3_column_int64(stmt.get(), 8);
    e.total_bytes = sqlite3_column_int64(stmt.get(), 9);
    entries.push_back(std::move(e));
  }
  return entries;
}

auto RunHistory::get_report_json(std::string_view run_id)
    -> Result<std::string> {
  if (!db_) {
    return fail(Error::DatabaseError);
  }
  auto result = prepare("SELECT report FROM runs WHERE id = ?;");
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);
  bind_text(stmt.get(), 1, run_id);

  if (sqlite3_step(stmt.get()) != SQLITE_ROW)
    return fail(Error::NotFound);
  return col_text(stmt.get(), 0);
}

auto RunHistory::list_artifacts(std::string_view run_id)
    -> Result<std::vector<StoredArtifact>> {
  if (!db_) {
    return fail(Error::DatabaseError);
  }
  auto result = prepare(
      "SELECT path, kind, size_bytes, uploaded FROM artifacts "
      "WHERE run_id = ? ORDER BY id;");
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);
  bind_text(stmt.get(), 1, run_id);

  std::vector<StoredArtifact> artifacts;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    StoredArtifact a;
    a.path = col_text(stmt.get(), 0);
    a.kind = parse<ArtifactKind>(col_text(stmt.get(), 1));
    a.size_bytes = sqlite3_column_int64(stmt.get(), 2);
    a.uploaded = sqlite3_column_int(stmt.get(), 3) != 0;
    artifacts.push_back(std::move(a));
  }
  return artifacts;
}

}  // namespace pgbackup

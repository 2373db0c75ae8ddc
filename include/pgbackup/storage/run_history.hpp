#pragma once

#include "pgbackup/backup/report.hpp"
#include "pgbackup/core/error.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace pgbackup {

// SQLite ledger of finished runs: one row per run plus its artifacts, with
// the full report kept as JSON.
class RunHistory {
public:
  explicit RunHistory(std::string_view db_path);
  ~RunHistory();

  RunHistory(const RunHistory&) = delete;
  RunHistory& operator=(const RunHistory&) = delete;

  [[nodiscard]] auto open() -> Result<void>;
  auto close() -> void;
  [[nodiscard]] auto is_open() const noexcept -> bool {
    return db_ != nullptr;
  }

  [[nodiscard]] auto record_run(const RunReport& report) -> Result<void>;

  struct RunHistoryEntry {
    std::string run_id;
    std::string timestamp;
    std::string database;
    Verdict verdict{Verdict::Success};
    int exit_code{0};
    std::string failure_reason;
    std::int64_t started_at{0};
    std::int64_t finished_at{0};
    std::int64_t artifact_count{0};
    std::int64_t total_bytes{0};
  };
  // Most recent first.
  [[nodiscard]] auto list_runs(std::size_t limit = 20)
      -> Result<std::vector<RunHistoryEntry>>;

  [[nodiscard]] auto get_report_json(std::string_view run_id)
      -> Result<std::string>;

  struct StoredArtifact {
    std::string path;
    ArtifactKind kind{ArtifactKind::Logical};
    std::int64_t size_bytes{0};
    bool uploaded{false};
  };
  [[nodiscard]] auto list_artifacts(std::string_view run_id)
      -> Result<std::vector<StoredArtifact>>;

private:
  [[nodiscard]] auto create_tables() -> Result<void>;
  [[nodiscard]] auto execute(std::string_view sql) -> Result<void>;
  [[nodiscard]] auto prepare(const char* sql) -> Result<sqlite3_stmt*>;

  struct DbDeleter {
    void operator()(sqlite3* db) const;
  };

  class Statement {
  public:
    explicit Statement(sqlite3_stmt* stmt = nullptr) noexcept : stmt_(stmt) {
    }
    ~Statement();
    Statement(Statement&& other) noexcept
        : stmt_(std::exchange(other.stmt_, nullptr)) {
    }
    Statement& operator=(Statement&& other) noexcept {
      if (this != &other) {
        reset();
        stmt_ = std::exchange(other.stmt_, nullptr);
      }
      return *this;
    }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    [[nodiscard]] auto get() const noexcept -> sqlite3_stmt* {
      return stmt_;
    }
    auto reset() -> void;

  private:
    sqlite3_stmt* stmt_ = nullptr;
  };

  std::string db_path_;
  std::unique_ptr<sqlite3, DbDeleter> db_{nullptr};
};

}  // namespace pgbackup

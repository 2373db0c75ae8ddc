#pragma once

#include "pgbackup/config/task_spec.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace pgbackup {

struct TargetConfig {
  std::string host{"localhost"};
  std::uint16_t port{5432};
  std::string database{"production_db"};
  std::string user{"backup_user"};
  // Credentials reference: a libpq passfile handed to every producer as
  // PGPASSFILE. Empty leaves the environment alone.
  std::string passfile;
};

struct BackupConfig {
  std::string output_dir{"/var/backups/postgresql"};
  int retention_days{7};
  // Defaults to <output_dir>/.pgbackup.lock
  std::string lock_file;
  // Whole-run deadline; 0 disables it.
  int run_timeout_sec{0};
};

struct PreflightConfig {
  std::string command{"pg_isready -h {host} -p {port} -U {user} -d {database}"};
  int timeout_sec{10};
};

struct UploadConfig {
  bool enabled{true};
  std::string remote{"gdrive_backups:"};
  std::string command{"rclone copy {file} {remote}"};
  int timeout_sec{1800};
  int max_retries{2};
  int backoff_ms{1000};
  int max_parallel{3};
};

struct TransportConfig {
  std::string name;
  std::string command;
  // Whether the message on stdin carries RFC 822 headers (sendmail -t).
  bool headers{false};
};

[[nodiscard]] inline auto default_transports() -> std::vector<TransportConfig> {
  return {
      {"sendmail", "/usr/sbin/sendmail -t -f {sender}", true},
      {"mail", "mail -s {subject} {recipients}", false},
  };
}

struct NotifyConfig {
  std::vector<std::string> recipients{"dba-alerts@yourcompany.com"};
  std::string sender{"pgbackup"};
  std::vector<TransportConfig> transports{default_transports()};
  int timeout_sec{30};
  std::string fallback_file{"/var/log/pg_backup_undelivered.log"};
  int log_tail_lines{15};
  bool notify_on_success{true};
};

struct LoggingConfig {
  std::string level{"info"};
  std::string file{"/var/log/pg_backup.log"};
};

struct StorageConfig {
  std::string history_db;
  std::string report_file;
};

struct SystemConfig {
  TargetConfig target;
  BackupConfig backup;
  PreflightConfig preflight;
  std::vector<TaskSpec> tasks{default_pipeline()};
  UploadConfig upload;
  NotifyConfig notify;
  LoggingConfig logging;
  StorageConfig storage;
};

}  // namespace pgbackup

#include "pgbackup/config/config.hpp"

#include "pgbackup/config/yaml_utils.hpp"
#include "pgbackup/util/log.hpp"
#include "pgbackup/util/util.hpp"

#include <yaml-cpp/yaml.h>

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <set>
#include <sstream>

namespace YAML {

template <>
struct convert<pgbackup::TargetConfig> {
  static bool decode(const Node& node, pgbackup::TargetConfig& t) {
    if (!node.IsMap()) {
      return false;
    }
    pgbackup::TargetConfig d;
    t.host = pgbackup::yaml_get_or<std::string>(node, "host", d.host);
    t.port = pgbackup::yaml_get_or<std::uint16_t>(node, "port", d.port);
    t.database = pgbackup::yaml_get_or<std::string>(node, "database", d.database);
    t.user = pgbackup::yaml_get_or<std::string>(node, "user", d.user);
    t.passfile = pgbackup::yaml_get_or<std::string>(node, "passfile", "");
    return true;
  }
};

template <>
struct convert<pgbackup::BackupConfig> {
  static bool decode(const Node& node, pgbackup::BackupConfig& b) {
    if (!node.IsMap()) {
      return false;
    }
    pgbackup::BackupConfig d;
    b.output_dir = pgbackup::yaml_get_or<std::string>(node, "output_dir", d.output_dir);
    b.retention_days = pgbackup::yaml_get_or(node, "retention_days", d.retention_days);
    b.lock_file = pgbackup::yaml_get_or<std::string>(node, "lock_file", "");
    b.run_timeout_sec = pgbackup::yaml_get_or(node, "run_timeout_sec", 0);
    return true;
  }
};

template <>
struct convert<pgbackup::PreflightConfig> {
  static bool decode(const Node& node, pgbackup::PreflightConfig& p) {
    if (!node.IsMap()) {
      return false;
    }
    pgbackup::PreflightConfig d;
    p.command = pgbackup::yaml_get_or<std::string>(node, "command", d.command);
    p.timeout_sec = pgbackup::yaml_get_or(node, "timeout_sec", d.timeout_sec);
    return true;
  }
};

template <>
struct convert<pgbackup::TaskSpec> {
  static bool decode(const Node& node, pgbackup::TaskSpec& t) {
    if (!node.IsMap()) {
      return false;
    }
    auto kind_name = pgbackup::yaml_get_or<std::string>(node, "kind", "logical");
    if (kind_name != "logical" && kind_name != "physical") {
      throw ParserException(node["kind"].Mark(),
                            std::format("unknown task kind '{}'", kind_name));
    }
    auto kind = pgbackup::parse<pgbackup::TaskKind>(kind_name);

    // Missing fields fall back to the built-in task of the same kind.
    pgbackup::TaskSpec d;
    for (auto& builtin : pgbackup::default_pipeline()) {
      if (builtin.kind == kind) {
        d = std::move(builtin);
        break;
      }
    }

    t.kind = kind;
    t.name = pgbackup::yaml_get_or<std::string>(node, "name", d.name);
    t.command = pgbackup::yaml_get_or<std::string>(node, "command", d.command);
    t.output = pgbackup::yaml_get_or<std::string>(node, "output", d.output);
    t.wal_output =
        pgbackup::yaml_get_or<std::string>(node, "wal_output", d.wal_output);
    t.fatal = pgbackup::yaml_get_or(node, "fatal", d.fatal);
    t.execution_timeout = std::chrono::seconds(pgbackup::yaml_get_or(
        node, "timeout_sec",
        static_cast<int>(d.execution_timeout.count())));
    return true;
  }
};

template <>
struct convert<pgbackup::UploadConfig> {
  static bool decode(const Node& node, pgbackup::UploadConfig& u) {
    if (!node.IsMap()) {
      return false;
    }
    pgbackup::UploadConfig d;
    u.enabled = pgbackup::yaml_get_or(node, "enabled", d.enabled);
    u.remote = pgbackup::yaml_get_or<std::string>(node, "remote", d.remote);
    u.command = pgbackup::yaml_get_or<std::string>(node, "command", d.command);
    u.timeout_sec = pgbackup::yaml_get_or(node, "timeout_sec", d.timeout_sec);
    u.max_retries = pgbackup::yaml_get_or(node, "max_retries", d.max_retries);
    u.backoff_ms = pgbackup::yaml_get_or(node, "backoff_ms", d.backoff_ms);
    u.max_parallel = pgbackup::yaml_get_or(node, "max_parallel", d.max_parallel);
    return true;
  }
};

template <>
struct convert<pgbackup::TransportConfig> {
  static bool decode(const Node& node, pgbackup::TransportConfig& t) {
    if (!node.IsMap()) {
      return false;
    }
    t.name = pgbackup::yaml_get_or<std::string>(node, "name", "");
    t.command = pgbackup::yaml_get_or<std::string>(node, "command", "");
    t.headers = pgbackup::yaml_get_or(node, "headers", false);
    return true;
  }
};

template <>
struct convert<pgbackup::NotifyConfig> {
  static bool decode(const Node& node, pgbackup::NotifyConfig& n) {
    if (!node.IsMap()) {
      return false;
    }
    pgbackup::NotifyConfig d;
    n.recipients = pgbackup::yaml_get_list(node, "recipients", d.recipients);
    n.sender = pgbackup::yaml_get_or<std::string>(node, "sender", d.sender);
    if (auto transports = node["transports"]; transports && transports.IsSequence()) {
      n.transports = transports.as<std::vector<pgbackup::TransportConfig>>();
    }
    n.timeout_sec = pgbackup::yaml_get_or(node, "timeout_sec", d.timeout_sec);
    n.fallback_file =
        pgbackup::yaml_get_or<std::string>(node, "fallback_file", d.fallback_file);
    n.log_tail_lines = pgbackup::yaml_get_or(node, "log_tail_lines", d.log_tail_lines);
    n.notify_on_success =
        pgbackup::yaml_get_or(node, "notify_on_success", d.notify_on_success);
    return true;
  }
};

template <>
struct convert<pgbackup::LoggingConfig> {
  static bool decode(const Node& node, pgbackup::LoggingConfig& l) {
    if (!node.IsMap()) {
      return false;
    }
    pgbackup::LoggingConfig d;
    l.level = pgbackup::yaml_get_or<std::string>(node, "level", d.level);
    l.file = pgbackup::yaml_get_or<std::string>(node, "file", d.file);
    return true;
  }
};

template <>
struct convert<pgbackup::StorageConfig> {
  static bool decode(const Node& node, pgbackup::StorageConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.history_db = pgbackup::yaml_get_or<std::string>(node, "history_db", "");
    s.report_file = pgbackup::yaml_get_or<std::string>(node, "report_file", "");
    return true;
  }
};

template <>
struct convert<pgbackup::SystemConfig> {
  static bool decode(const Node& node, pgbackup::SystemConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto target = node["target"]) {
      c.target = target.as<pgbackup::TargetConfig>();
    }
    if (auto backup = node["backup"]) {
      c.backup = backup.as<pgbackup::BackupConfig>();
    }
    if (auto preflight = node["preflight"]) {
      c.preflight = preflight.as<pgbackup::PreflightConfig>();
    }
    if (auto tasks = node["tasks"]; tasks && tasks.IsSequence()) {
      c.tasks = tasks.as<std::vector<pgbackup::TaskSpec>>();
    }
    if (auto upload = node["upload"]) {
      c.upload = upload.as<pgbackup::UploadConfig>();
    }
    if (auto notify = node["notify"]) {
      c.notify = notify.as<pgbackup::NotifyConfig>();
    }
    if (auto logging = node["logging"]) {
      c.logging = logging.as<pgbackup::LoggingConfig>();
    }
    if (auto storage = node["storage"]) {
      c.storage = storage.as<pgbackup::StorageConfig>();
    }
    return true;
  }
};

}  // namespace YAML

namespace pgbackup {

namespace {

auto getenv_view(const char* name) -> std::string_view {
  const char* value = std::getenv(name);
  return value ? std::string_view{value} : std::string_view{};
}

void to_yaml(YAML::Emitter& out, const TaskSpec& t) {
  out << YAML::BeginMap;
  yaml_emit(out, "name", t.name);
  yaml_emit(out, "kind", std::string(to_string_view(t.kind)));
  yaml_emit(out, "command", t.command);
  yaml_emit(out, "output", t.output);
  yaml_emit_if_not_empty(out, "wal_output", t.wal_output);
  yaml_emit(out, "fatal", t.fatal);
  yaml_emit(out, "timeout_sec", t.execution_timeout.count());
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const TransportConfig& t) {
  out << YAML::BeginMap;
  yaml_emit(out, "name", t.name);
  yaml_emit(out, "command", t.command);
  if (t.headers) {
    yaml_emit(out, "headers", t.headers);
  }
  out << YAML::EndMap;
}

}  // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<SystemConfig> {
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      log::error("Failed to parse YAML: empty or invalid content");
      return fail(Error::ParseError);
    }
    SystemConfig config = root.as<SystemConfig>();
    return ok(std::move(config));
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto ConfigLoader::load(std::string_view explicit_path)
    -> Result<SystemConfig> {
  std::string path{explicit_path};
  if (path.empty()) {
    path = getenv_view("PGBACKUP_CONFIG");
  }
  if (path.empty() && std::filesystem::exists(kDefaultConfigPath)) {
    path = kDefaultConfigPath;
  }

  SystemConfig config;
  if (!path.empty()) {
    auto loaded = load_from_file(path);
    if (!loaded) {
      return std::unexpected(loaded.error());
    }
    config = std::move(*loaded);
  } else {
    log::debug("No config file, using built-in defaults");
  }

  apply_environment(config);
  return ok(std::move(config));
}

auto ConfigLoader::apply_environment(SystemConfig& config) -> void {
  if (auto v = getenv_view("PGBACKUP_HOST"); !v.empty()) {
    config.target.host = v;
  }
  if (auto v = getenv_view("PGBACKUP_PORT"); !v.empty()) {
    std::uint16_t port = 0;
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), port);
    if (ec == std::errc{} && ptr == v.data() + v.size()) {
      config.target.port = port;
    } else {
      log::warn("Ignoring invalid PGBACKUP_PORT '{}'", v);
    }
  }
  if (auto v = getenv_view("PGBACKUP_DATABASE"); !v.empty()) {
    config.target.database = v;
  }
  if (auto v = getenv_view("PGBACKUP_USER"); !v.empty()) {
    config.target.user = v;
  }
  if (auto v = getenv_view("PGBACKUP_PASSFILE"); !v.empty()) {
    config.target.passfile = v;
  }
  if (auto v = getenv_view("PGBACKUP_OUTPUT_DIR"); !v.empty()) {
    config.backup.output_dir = v;
  }
  if (auto v = getenv_view("PGBACKUP_REMOTE"); !v.empty()) {
    config.upload.remote = v;
  }
  if (auto v = getenv_view("PGBACKUP_RECIPIENTS"); !v.empty()) {
    config.notify.recipients = split_list(v);
  }
  if (auto v = getenv_view("PGBACKUP_LOG_LEVEL"); !v.empty()) {
    config.logging.level = v;
  }
}

auto ConfigLoader::to_string(const SystemConfig& c) -> std::string {
  YAML::Emitter out;
  out << YAML::BeginMap;

  out << YAML::Key << "target" << YAML::Value << YAML::BeginMap;
  yaml_emit(out, "host", c.target.host);
  yaml_emit(out, "port", c.target.port);
  yaml_emit(out, "database", c.target.database);
  yaml_emit(out, "user", c.target.user);
  yaml_emit_if_not_empty(out, "passfile", c.target.passfile);
  out << YAML::EndMap;

  out << YAML::Key << "backup" << YAML::Value << YAML::BeginMap;
  yaml_emit(out, "output_dir", c.backup.output_dir);
  yaml_emit(out, "retention_days", c.backup.retention_days);
  yaml_emit_if_not_empty(out, "lock_file", c.backup.lock_file);
  if (c.backup.run_timeout_sec != 0) {
    yaml_emit(out, "run_timeout_sec", c.backup.run_timeout_sec);
  }
  out << YAML::EndMap;

  out << YAML::Key << "preflight" << YAML::Value << YAML::BeginMap;
  yaml_emit(out, "command", c.preflight.command);
  yaml_emit(out, "timeout_sec", c.preflight.timeout_sec);
  out << YAML::EndMap;

  out << YAML::Key << "tasks" << YAML::Value << YAML::BeginSeq;
  for (const auto& task : c.tasks) {
    to_yaml(out, task);
  }
  out << YAML::EndSeq;

  out << YAML::Key << "upload" << YAML::Value << YAML::BeginMap;
  yaml_emit(out, "enabled", c.upload.enabled);
  yaml_emit(out, "remote", c.upload.remote);
  yaml_emit(out, "command", c.upload.command);
  yaml_emit(out, "timeout_sec", c.upload.timeout_sec);
  yaml_emit(out, "max_retries", c.upload.max_retries);
  yaml_emit(out, "backoff_ms", c.upload.backoff_ms);
  yaml_emit(out, "max_parallel", c.upload.max_parallel);
  out << YAML::EndMap;

  out << YAML::Key << "notify" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "recipients" << YAML::Value << c.notify.recipients;
  yaml_emit(out, "sender", c.notify.sender);
  out << YAML::Key << "transports" << YAML::Value << YAML::BeginSeq;
  for (const auto& transport : c.notify.transports) {
    to_yaml(out, transport);
  }
  out << YAML::EndSeq;
  yaml_emit(out, "timeout_sec", c.notify.timeout_sec);
  yaml_emit_if_not_empty(out, "fallback_file", c.notify.fallback_file);
  yaml_emit(out, "log_tail_lines", c.notify.log_tail_lines);
  yaml_emit(out, "notify_on_success", c.notify.notify_on_success);
  out << YAML::EndMap;

  out << YAML::Key << "logging" << YAML::Value << YAML::BeginMap;
  yaml_emit(out, "level", c.logging.level);
  yaml_emit_if_not_empty(out, "file", c.logging.file);
  out << YAML::EndMap;

  if (!c.storage.history_db.empty() || !c.storage.report_file.empty()) {
    out << YAML::Key << "storage" << YAML::Value << YAML::BeginMap;
    yaml_emit_if_not_empty(out, "history_db", c.storage.history_db);
    yaml_emit_if_not_empty(out, "report_file", c.storage.report_file);
    out << YAML::EndMap;
  }

  out << YAML::EndMap;
  return out.c_str();
}

auto validate_config(const SystemConfig& c) -> std::vector<std::string> {
  std::vector<std::string> problems;

  if (c.target.database.empty()) {
    problems.emplace_back("target.database must not be empty");
  }
  if (c.target.port == 0) {
    problems.emplace_back("target.port must be between 1 and 65535");
  }
  if (c.backup.output_dir.empty()) {
    problems.emplace_back("backup.output_dir must not be empty");
  }
  if (c.backup.retention_days < 1) {
    problems.push_back(std::format("backup.retention_days must be >= 1 (got {})",
                                   c.backup.retention_days));
  }
  if (c.backup.run_timeout_sec < 0) {
    problems.emplace_back("backup.run_timeout_sec must not be negative");
  }
  if (c.preflight.timeout_sec < 1) {
    problems.emplace_back("preflight.timeout_sec must be >= 1");
  }
  if (c.tasks.empty()) {
    problems.emplace_back("at least one task is required");
  }

  std::set<std::string, std::less<>> names;
  for (const auto& task : c.tasks) {
    if (task.name.empty()) {
      problems.emplace_back("task name must not be empty");
    } else if (!names.insert(task.name).second) {
      problems.push_back(std::format("duplicate task name '{}'", task.name));
    }
    if (task.command.empty()) {
      problems.push_back(std::format("task '{}' has no command", task.name));
    }
    if (task.output.empty()) {
      problems.push_back(std::format("task '{}' has no output pattern", task.name));
    } else if (task.output.find('/') != std::string::npos) {
      problems.push_back(std::format(
          "task '{}' output must be a file name, not a path", task.name));
    }
    if (task.execution_timeout.count() < 1) {
      problems.push_back(std::format("task '{}' timeout must be >= 1", task.name));
    }
  }

  if (c.upload.enabled) {
    if (c.upload.command.empty()) {
      problems.emplace_back("upload.command must not be empty");
    }
    if (c.upload.max_retries < 0) {
      problems.emplace_back("upload.max_retries must not be negative");
    }
    if (c.upload.max_parallel < 1) {
      problems.emplace_back("upload.max_parallel must be >= 1");
    }
  }

  for (const auto& transport : c.notify.transports) {
    if (transport.command.empty()) {
      problems.push_back(std::format("transport '{}' has no command", transport.name));
    }
  }
  if (c.notify.log_tail_lines < 0) {
    problems.emplace_back("notify.log_tail_lines must not be negative");
  }

  return problems;
}

}  // namespace pgbackup

#pragma once

#include "pgbackup/config/system_config.hpp"
#include "pgbackup/core/error.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace pgbackup {

using Config = SystemConfig;

inline constexpr std::string_view kDefaultConfigPath =
    "/etc/pgbackup/pgbackup.yaml";

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<SystemConfig>;

  // Resolves the configuration the way the CLI does: explicit path, then
  // $PGBACKUP_CONFIG, then kDefaultConfigPath if present, then built-in
  // defaults. Environment overrides are applied last.
  [[nodiscard]] static auto load(std::string_view explicit_path)
      -> Result<SystemConfig>;

  // PGBACKUP_* variables override the corresponding fields.
  static auto apply_environment(SystemConfig& config) -> void;

  [[nodiscard]] static auto to_string(const SystemConfig& config)
      -> std::string;
};

// Returns one message per problem; empty means the configuration is usable.
[[nodiscard]] auto validate_config(const SystemConfig& config)
    -> std::vector<std::string>;

}  // namespace pgbackup

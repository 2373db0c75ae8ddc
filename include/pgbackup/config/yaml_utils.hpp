#pragma once

#include "pgbackup/util/util.hpp"

#include <yaml-cpp/yaml.h>

#include <string>
#include <string_view>
#include <vector>

namespace pgbackup {

template <typename T>
concept YamlParsable = requires(const YAML::Node& n) { { n.as<T>() }; };

template <YamlParsable T>
[[nodiscard]] auto yaml_get_or(const YAML::Node& node, std::string_view key,
                               T default_val) -> T {
  auto field = node[std::string(key)];
  if (!field || (!field.IsScalar() && !field.IsSequence() && !field.IsMap())) {
    return default_val;
  }
  return field.as<T>();
}

// Accepts either a sequence or a comma-separated scalar.
[[nodiscard]] inline auto yaml_get_list(const YAML::Node& node,
                                        std::string_view key,
                                        std::vector<std::string> default_val)
    -> std::vector<std::string> {
  auto field = node[std::string(key)];
  if (!field) {
    return default_val;
  }
  std::vector<std::string> out;
  if (field.IsSequence()) {
    for (const auto& item : field) {
      out.push_back(item.as<std::string>());
    }
    return out;
  }
  if (field.IsScalar()) {
    return split_list(field.as<std::string>());
  }
  return default_val;
}

inline void yaml_emit(YAML::Emitter& out, std::string_view key,
                      const auto& value) {
  out << YAML::Key << std::string(key) << YAML::Value << value;
}

inline void yaml_emit_if_not_empty(YAML::Emitter& out, std::string_view key,
                                   std::string_view value) {
  if (!value.empty()) {
    out << YAML::Key << std::string(key) << YAML::Value << std::string(value);
  }
}

}  // namespace pgbackup

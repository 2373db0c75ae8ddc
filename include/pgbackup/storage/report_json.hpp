#pragma once

#include "pgbackup/backup/report.hpp"
#include "pgbackup/core/error.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

namespace pgbackup {

[[nodiscard]] auto to_json(const RunReport& report) -> nlohmann::json;

// Serialized report. Producer output is not guaranteed to be UTF-8; invalid
// bytes are replaced with U+FFFD.
[[nodiscard]] auto dump_report(const RunReport& report, int indent = -1)
    -> Result<std::string>;

// Replaces `path` atomically (write to a temporary file, then rename).
[[nodiscard]] auto write_report_file(const std::filesystem::path& path,
                                     const RunReport& report) -> Result<void>;

}  // namespace pgbackup

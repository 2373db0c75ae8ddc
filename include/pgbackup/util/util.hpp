#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <format>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace pgbackup {

inline auto generate_uuid() -> std::string {
  thread_local std::random_device rd;
  thread_local std::mt19937_64 gen(rd());
  thread_local std::uniform_int_distribution<std::uint64_t> dis;

  std::uint64_t a = dis(gen);
  std::uint64_t b = dis(gen);

  return std::format(
      "{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
      static_cast<std::uint32_t>(a >> 32), static_cast<std::uint16_t>(a >> 16),
      static_cast<std::uint16_t>(a), static_cast<std::uint16_t>(b >> 48),
      b & 0xFFFFFFFFFFFFULL);
}

inline auto format_timestamp(std::chrono::system_clock::time_point tp)
    -> std::string {
  auto time = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&time, &tm);
  return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}Z",
                     tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                     tm.tm_min, tm.tm_sec);
}

inline auto format_timestamp() -> std::string {
  return format_timestamp(std::chrono::system_clock::now());
}

// Local-time token used in artifact names, e.g. "2024-01-01-020000".
inline auto make_timestamp_token(std::chrono::system_clock::time_point tp)
    -> std::string {
  auto time = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  localtime_r(&time, &tm);
  return std::format("{:04d}-{:02d}-{:02d}-{:02d}{:02d}{:02d}",
                     tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                     tm.tm_min, tm.tm_sec);
}

[[nodiscard]] inline auto trim(std::string_view s) -> std::string_view {
  constexpr std::string_view ws = " \t\r\n";
  auto begin = s.find_first_not_of(ws);
  if (begin == std::string_view::npos) {
    return {};
  }
  auto end = s.find_last_not_of(ws);
  return s.substr(begin, end - begin + 1);
}

[[nodiscard]] inline auto split_list(std::string_view s, char sep = ',')
    -> std::vector<std::string> {
  std::vector<std::string> parts;
  while (!s.empty()) {
    auto pos = s.find(sep);
    auto item = trim(s.substr(0, pos));
    if (!item.empty()) {
      parts.emplace_back(item);
    }
    if (pos == std::string_view::npos) {
      break;
    }
    s.remove_prefix(pos + 1);
  }
  return parts;
}

[[nodiscard]] inline auto join(const std::vector<std::string>& items,
                               std::string_view sep) -> std::string {
  std::string out;
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i > 0) {
      out += sep;
    }
    out += items[i];
  }
  return out;
}

// Last `n` non-empty lines of `text`, oldest first.
[[nodiscard]] inline auto tail_lines(std::string_view text, std::size_t n)
    -> std::vector<std::string> {
  std::vector<std::string> lines;
  if (n == 0) {
    return lines;
  }
  auto end = text.size();
  while (end > 0 && lines.size() < n) {
    auto start = text.rfind('\n', end - 1);
    auto begin = start == std::string_view::npos ? 0 : start + 1;
    auto line = text.substr(begin, end - begin);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    if (!trim(line).empty()) {
      lines.emplace_back(line);
    }
    if (start == std::string_view::npos) {
      break;
    }
    end = start;
  }
  return {lines.rbegin(), lines.rend()};
}

[[nodiscard]] inline auto format_bytes(std::uintmax_t bytes) -> std::string {
  constexpr const char* units[] = {"B", "KB", "MB", "GB", "TB"};
  auto value = static_cast<double>(bytes);
  std::size_t unit = 0;
  while (value >= 1024.0 && unit + 1 < std::size(units)) {
    value /= 1024.0;
    ++unit;
  }
  if (unit == 0) {
    return std::format("{} B", bytes);
  }
  return std::format("{:.1f} {}", value, units[unit]);
}

}  // namespace pgbackup

#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <deque>
#include <format>
#include <mutex>
#include <print>
#include <string>
#include <string_view>
#include <vector>

namespace pgbackup::log {

enum class Level : std::uint8_t {
  Trace,
  Debug,
  Info,
  Warn,
  Error
};

[[nodiscard]] constexpr auto level_name(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view names[] = {"trace", "debug", "info", "warn",
                                        "error"};
  return names[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto level_color(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view colors[] = {
      "\033[90m",  // trace: gray
      "\033[36m",  // debug: cyan
      "\033[32m",  // info: green
      "\033[33m",  // warn: yellow
      "\033[31m"   // error: red
  };
  return colors[static_cast<std::uint8_t>(level)];
}

// Synchronous logger: colored lines on stderr, plain lines appended to an
// optional log file, and the most recent plain lines kept in memory.
class Logger {
public:
  static constexpr std::size_t TAIL_CAPACITY = 64;

  Logger() = default;
  ~Logger() {
    close_file();
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  auto set_level(Level level) noexcept -> void {
    std::lock_guard lock(mutex_);
    level_ = level;
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    std::lock_guard lock(mutex_);
    return level_;
  }

  // The file is opened in append mode and never truncated or rotated.
  auto open_file(const std::string& path) -> bool {
    std::lock_guard lock(mutex_);
    if (file_) {
      std::fclose(file_);
      file_ = nullptr;
    }
    if (path.empty()) {
      return true;
    }
    file_ = std::fopen(path.c_str(), "a");
    return file_ != nullptr;
  }

  auto close_file() -> void {
    std::lock_guard lock(mutex_);
    if (file_) {
      std::fclose(file_);
      file_ = nullptr;
    }
  }

  auto set_console(bool enabled) noexcept -> void {
    std::lock_guard lock(mutex_);
    console_ = enabled;
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args&&... args)
      -> void {
    std::lock_guard lock(mutex_);
    if (level < level_)
      return;

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::floor<std::chrono::seconds>(now);
    auto message = std::format(fmt, std::forward<Args>(args)...);

    auto plain = std::format("[{:%Y-%m-%d %H:%M:%S}] [{}] {}", time,
                             level_name(level), message);
    if (console_) {
      std::print(stderr, "[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] {}\n", time,
                 level_color(level), level_name(level), "\033[0m", message);
    }
    if (file_) {
      std::print(file_, "{}\n", plain);
      std::fflush(file_);
    }

    tail_.push_back(std::move(plain));
    if (tail_.size() > TAIL_CAPACITY) {
      tail_.pop_front();
    }
  }

  [[nodiscard]] auto tail(std::size_t lines) const -> std::vector<std::string> {
    std::lock_guard lock(mutex_);
    auto n = std::min(lines, tail_.size());
    return {tail_.end() - static_cast<std::ptrdiff_t>(n), tail_.end()};
  }

  auto clear_tail() -> void {
    std::lock_guard lock(mutex_);
    tail_.clear();
  }

private:
  mutable std::mutex mutex_;
  Level level_{Level::Info};
  bool console_{true};
  std::FILE* file_{nullptr};
  std::deque<std::string> tail_;
};

// Global logger instance
inline Logger& logger() {
  static Logger instance;
  return instance;
}

// Public API
inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  Level level = Level::Info;
  if (name == "trace")
    level = Level::Trace;
  else if (name == "debug")
    level = Level::Debug;
  else if (name == "warn")
    level = Level::Warn;
  else if (name == "error")
    level = Level::Error;
  logger().set_level(level);
}

inline auto open_file(const std::string& path) -> bool {
  return logger().open_file(path);
}

[[nodiscard]] inline auto tail(std::size_t lines) -> std::vector<std::string> {
  return logger().tail(lines);
}

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

}  // namespace pgbackup::log

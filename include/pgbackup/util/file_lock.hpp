#pragma once

#include "pgbackup/core/error.hpp"

#include <filesystem>
#include <utility>

namespace pgbackup {

// Exclusive advisory lock (flock) held for the lifetime of the object.
// The lock file itself is left in place; only the lock is released.
class FileLock {
public:
  [[nodiscard]] static auto acquire(const std::filesystem::path& path)
      -> Result<FileLock>;

  FileLock(FileLock&& other) noexcept
      : fd_(std::exchange(other.fd_, -1)), path_(std::move(other.path_)) {
  }
  FileLock& operator=(FileLock&& other) noexcept {
    if (this != &other) {
      release();
      fd_ = std::exchange(other.fd_, -1);
      path_ = std::move(other.path_);
    }
    return *this;
  }
  FileLock(const FileLock&) = delete;
  FileLock& operator=(const FileLock&) = delete;

  ~FileLock() {
    release();
  }

  auto release() noexcept -> void;

  [[nodiscard]] auto held() const noexcept -> bool {
    return fd_ >= 0;
  }
  [[nodiscard]] auto path() const noexcept -> const std::filesystem::path& {
    return path_;
  }

private:
  FileLock(int fd, std::filesystem::path path) noexcept
      : fd_(fd), path_(std::move(path)) {
  }

  int fd_ = -1;
  std::filesystem::path path_;
};

}  // namespace pgbackup

#include "pgbackup/util/file_lock.hpp"

#include "pgbackup/util/log.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <string>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace pgbackup {

auto FileLock::acquire(const std::filesystem::path& path) -> Result<FileLock> {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      log::error("Cannot create directory for lock file {}: {}", path.string(),
                 ec.message());
      return fail(ec);
    }
  }

  int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) {
    log::error("Cannot open lock file {}: {}", path.string(), strerror(errno));
    return fail(Error::FileOpenFailed);
  }

  if (::flock(fd, LOCK_EX | LOCK_NB) < 0) {
    auto err = errno;
    ::close(fd);
    if (err == EWOULDBLOCK) {
      log::warn("Lock {} is held by another run", path.string());
      return fail(Error::LockHeld);
    }
    log::error("Cannot lock {}: {}", path.string(), strerror(err));
    return fail(Error::FileOpenFailed);
  }

  // Record the holder for operators; the content is informational only.
  auto pid = std::format("{}\n", ::getpid());
  if (::ftruncate(fd, 0) == 0) {
    if (::write(fd, pid.data(), pid.size()) < 0) {
      log::debug("Cannot record pid in {}: {}", path.string(), strerror(errno));
    }
  }

  return FileLock{fd, path};
}

auto FileLock::release() noexcept -> void {
  if (fd_ >= 0) {
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
  }
}

}  // namespace pgbackup

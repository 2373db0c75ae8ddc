#include "pgbackup/executor/executor.hpp"
#include "pgbackup/util/log.hpp"

#include <sys/wait.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <format>
#include <string_view>
#include <thread>
#include <tuple>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>

extern char** environ;

namespace pgbackup {

namespace {

inline constexpr std::size_t MAX_OUTPUT_TAIL = 64 * 1024;
inline constexpr std::size_t READ_BUFFER_SIZE = 4096;
inline constexpr auto POLL_SLICE = std::chrono::milliseconds(100);
inline constexpr auto TERMINATE_GRACE = std::chrono::seconds(2);

auto create_pipe() -> std::pair<int, int> {
  int fds[2];
  if (pipe2(fds, O_CLOEXEC | O_NONBLOCK) < 0) {
    return {-1, -1};
  }
  return {fds[0], fds[1]};
}

auto close_fd(int& fd) -> void {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

// Built before fork(): the child may only call async-signal-safe functions.
auto build_environment(const std::map<std::string, std::string>& overrides)
    -> std::vector<std::string> {
  std::vector<std::string> env;
  for (char** e = environ; e && *e; ++e) {
    std::string_view entry{*e};
    auto eq = entry.find('=');
    auto name = entry.substr(0, eq);
    if (!overrides.contains(std::string(name))) {
      env.emplace_back(entry);
    }
  }
  for (const auto& [name, value] : overrides) {
    env.push_back(std::format("{}={}", name, value));
  }
  return env;
}

auto fork_and_exec(const std::string& cmd, const std::string& working_dir,
                   char* const* envp, int stdin_fd, int stdout_write_fd)
    -> pid_t {
  pid_t pid = fork();
  if (pid < 0) {
    return -1;
  }

  if (pid == 0) {
    setpgid(0, 0);

    dup2(stdin_fd, STDIN_FILENO);
    dup2(stdout_write_fd, STDOUT_FILENO);
    dup2(stdout_write_fd, STDERR_FILENO);

    if (!working_dir.empty()) {
      if (chdir(working_dir.c_str()) < 0) {
        _exit(127);
      }
    }

    execle("/bin/sh", "sh", "-c", cmd.c_str(), nullptr, envp);
    _exit(127);
  }

  setpgid(pid, pid);
  return pid;
}

auto get_exit_code(int status) -> int {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

auto append_bounded(std::string& output, const char* data, std::size_t n)
    -> void {
  output.append(data, n);
  if (output.size() > MAX_OUTPUT_TAIL) {
    output.erase(0, output.size() - MAX_OUTPUT_TAIL);
  }
}

// SIGTERM to the whole process group, SIGKILL if it outlives the grace period.
auto terminate_group(pid_t pid) -> int {
  kill(-pid, SIGTERM);

  int status = 0;
  auto deadline = std::chrono::steady_clock::now() + TERMINATE_GRACE;
  while (std::chrono::steady_clock::now() < deadline) {
    pid_t r = waitpid(pid, &status, WNOHANG);
    if (r == pid) {
      kill(-pid, SIGKILL);
      return get_exit_code(status);
    }
    if (r < 0 && errno != EINTR) {
      return -1;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }

  kill(-pid, SIGKILL);
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      return -1;
    }
  }
  return get_exit_code(status);
}

class ShellExecutor : public IExecutor {
public:
  ShellExecutor() {
    // A child that exits before reading its stdin must not kill us.
    std::signal(SIGPIPE, SIG_IGN);
  }

  auto execute(const ShellExecutorConfig& config,
               const CancellationToken& cancel) -> ExecutorResult override {
    ExecutorResult result;

    if (cancel.is_cancelled()) {
      result.exit_code = -1;
      result.cancelled = true;
      result.error = "cancelled before start";
      return result;
    }

    auto [read_fd, write_fd] = create_pipe();
    if (read_fd < 0) {
      result.exit_code = -1;
      result.error = std::format("failed to create pipe: {}", strerror(errno));
      return result;
    }

    int stdin_read = -1;
    int stdin_write = -1;
    if (config.stdin_data.empty()) {
      stdin_read = open("/dev/null", O_RDONLY | O_CLOEXEC);
    } else {
      std::tie(stdin_read, stdin_write) = create_pipe();
    }
    if (stdin_read < 0) {
      close_fd(read_fd);
      close_fd(write_fd);
      result.exit_code = -1;
      result.error = std::format("failed to set up stdin: {}", strerror(errno));
      return result;
    }
    // The child end of the stdin pipe must block on read.
    fcntl(stdin_read, F_SETFL, fcntl(stdin_read, F_GETFL) & ~O_NONBLOCK);

    auto env = build_environment(config.env);
    std::vector<char*> envp;
    envp.reserve(env.size() + 1);
    for (auto& entry : env) {
      envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    auto start = std::chrono::steady_clock::now();
    pid_t pid = fork_and_exec(config.command, config.working_dir, envp.data(),
                              stdin_read, write_fd);
    close_fd(write_fd);
    close_fd(stdin_read);
    if (pid < 0) {
      close_fd(read_fd);
      close_fd(stdin_write);
      result.exit_code = -1;
      result.error = std::format("failed to fork: {}", strerror(errno));
      return result;
    }
    log::debug("spawned pid {}: {}", pid, config.command);

    auto deadline = start + config.execution_timeout;
    std::size_t written = 0;
    std::array<char, READ_BUFFER_SIZE> buffer;
    bool stop = false;

    while (read_fd >= 0 && !stop) {
      if (cancel.is_cancelled()) {
        result.cancelled = true;
        break;
      }
      auto now = std::chrono::steady_clock::now();
      if (now >= deadline) {
        result.timed_out = true;
        break;
      }
      auto slice = std::min<std::chrono::steady_clock::duration>(
          POLL_SLICE, deadline - now);

      std::array<pollfd, 2> fds{};
      nfds_t nfds = 0;
      fds[nfds++] = pollfd{read_fd, POLLIN, 0};
      if (stdin_write >= 0) {
        fds[nfds++] = pollfd{stdin_write, POLLOUT, 0};
      }

      int ready = poll(
          fds.data(), nfds,
          static_cast<int>(
              std::chrono::duration_cast<std::chrono::milliseconds>(slice)
                  .count()) + 1);
      if (ready < 0) {
        if (errno == EINTR) {
          continue;
        }
        result.error = std::format("poll failed: {}", strerror(errno));
        break;
      }

      if (stdin_write >= 0 && fds[1].revents != 0) {
        if (fds[1].revents & (POLLERR | POLLHUP)) {
          close_fd(stdin_write);
        } else {
          auto remaining = config.stdin_data.size() - written;
          ssize_t n = write(stdin_write, config.stdin_data.data() + written,
                            remaining);
          if (n > 0) {
            written += static_cast<std::size_t>(n);
          } else if (n < 0 && errno != EAGAIN && errno != EINTR) {
            close_fd(stdin_write);
          }
          if (written == config.stdin_data.size()) {
            close_fd(stdin_write);
          }
        }
      }

      if (fds[0].revents != 0) {
        while (true) {
          ssize_t n = read(read_fd, buffer.data(), buffer.size());
          if (n > 0) {
            append_bounded(result.output, buffer.data(),
                           static_cast<std::size_t>(n));
            continue;
          }
          if (n == 0) {
            stop = true;
          } else if (errno != EAGAIN && errno != EWOULDBLOCK &&
                     errno != EINTR) {
            stop = true;
          }
          break;
        }
      }
    }
    close_fd(read_fd);
    close_fd(stdin_write);

    if (!result.timed_out && !result.cancelled && result.error.empty()) {
      // Output closed; the process may still be running.
      int status = 0;
      while (true) {
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) {
          result.exit_code = get_exit_code(status);
          return result;
        }
        if (r < 0 && errno != EINTR) {
          result.exit_code = -1;
          result.error = std::format("waitpid failed: {}", strerror(errno));
          return result;
        }
        if (cancel.is_cancelled()) {
          result.cancelled = true;
          break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
          result.timed_out = true;
          break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
      }
    }

    if (result.timed_out) {
      log::warn("pid {} exceeded {}s timeout, terminating", pid,
                config.execution_timeout.count());
    } else if (result.cancelled) {
      log::warn("pid {} cancelled, terminating", pid);
    }
    int code = terminate_group(pid);
    result.exit_code = code == 0 ? -1 : code;
    return result;
  }
};

}  // namespace

auto ExecutorResult::describe_failure() const -> std::string {
  if (cancelled) {
    return "cancelled";
  }
  if (timed_out) {
    return "timed out";
  }
  if (!error.empty()) {
    return error;
  }
  if (exit_code == 127) {
    return "exit code 127 (command not found)";
  }
  return std::format("exit code {}", exit_code);
}

auto create_shell_executor() -> std::unique_ptr<IExecutor> {
  return std::make_unique<ShellExecutor>();
}

}  // namespace pgbackup

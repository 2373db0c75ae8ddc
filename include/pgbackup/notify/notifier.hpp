#pragma once

#include "pgbackup/backup/report.hpp"
#include "pgbackup/backup/run_context.hpp"
#include "pgbackup/core/error.hpp"
#include "pgbackup/executor/executor.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace pgbackup {

struct RenderedMessage {
  std::string subject;
  std::string body;
};

// Deterministic subject and body for a report: the same report always
// renders to the same text.
[[nodiscard]] auto render_report(const RunReport& report) -> RenderedMessage;

// RFC 822 message (headers, blank line, body) as sendmail -t expects it.
[[nodiscard]] auto render_mail(const RenderedMessage& message,
                               const std::vector<std::string>& recipients,
                               std::string_view sender) -> std::string;

class ITransport {
public:
  virtual ~ITransport() = default;

  [[nodiscard]] virtual auto name() const -> std::string_view = 0;
  [[nodiscard]] virtual auto send(const RenderedMessage& message,
                                  const std::vector<std::string>& recipients,
                                  std::string_view sender) -> Result<void> = 0;
};

// Hands the message to a local mail command on stdin.
class ShellTransport : public ITransport {
public:
  ShellTransport(TransportConfig config, IExecutor& executor,
                 std::chrono::seconds timeout)
      : config_{std::move(config)}, executor_{executor}, timeout_{timeout} {
  }

  [[nodiscard]] auto name() const -> std::string_view override {
    return config_.name;
  }
  [[nodiscard]] auto send(const RenderedMessage& message,
                          const std::vector<std::string>& recipients,
                          std::string_view sender) -> Result<void> override;

private:
  TransportConfig config_;
  IExecutor& executor_;
  std::chrono::seconds timeout_;
};

// Appends a message to a local file so its content survives when no
// transport works.
[[nodiscard]] auto write_fallback(const std::filesystem::path& file,
                                  const RenderedMessage& message,
                                  const std::vector<std::string>& recipients)
    -> Result<void>;

class INotifier {
public:
  virtual ~INotifier() = default;

  [[nodiscard]] virtual auto notify(const RunReport& report,
                                    const RunContext& ctx) -> Result<void> = 0;
};

// Tries each transport in order and stops at the first one that accepts the
// message; if none does, the message goes to the fallback file.
class Notifier : public INotifier {
public:
  explicit Notifier(std::vector<std::unique_ptr<ITransport>> transports)
      : transports_{std::move(transports)} {
  }

  [[nodiscard]] auto notify(const RunReport& report, const RunContext& ctx)
      -> Result<void> override;

  [[nodiscard]] auto transport_count() const noexcept -> std::size_t {
    return transports_.size();
  }

private:
  std::vector<std::unique_ptr<ITransport>> transports_;
};

[[nodiscard]] auto make_notifier(const NotifyConfig& config,
                                 IExecutor& executor)
    -> std::unique_ptr<Notifier>;

}  // namespace pgbackup

#pragma once

#include <algorithm>
#include <chrono>

namespace pgbackup {

// Bounded retries with exponential backoff: the n-th retry waits
// base_delay * 2^(n-1).
class RetryPolicy {
public:
  explicit RetryPolicy(int max_retries = 2,
                       std::chrono::milliseconds base_delay =
                           std::chrono::milliseconds(1000))
      : max_retries_{std::max(0, max_retries)}, base_delay_{base_delay} {
  }

  [[nodiscard]] auto should_retry(int attempted_retries) const noexcept
      -> bool {
    return attempted_retries < max_retries_;
  }

  // `retry` is 1 for the first retry.
  [[nodiscard]] auto delay_before_retry(int retry) const noexcept
      -> std::chrono::milliseconds {
    if (retry <= 0) {
      return std::chrono::milliseconds(0);
    }
    return base_delay_ * (1LL << std::min(retry - 1, 16));
  }

  [[nodiscard]] auto max_retries() const noexcept -> int {
    return max_retries_;
  }

private:
  int max_retries_;
  std::chrono::milliseconds base_delay_;
};

}  // namespace pgbackup

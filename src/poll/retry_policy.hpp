#pragma once

#include "endpoints/strategy_table.hpp"
#include "transport/device_session.hpp"
#include "transport/device_transport.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace modemstat::core::logging {
class Logger;
}

namespace modemstat::poll {

// Stable default: one extra attempt per endpoint per cycle.
constexpr std::uint32_t kDefaultRetryLimit = 1U;

// Only transient transport failures are worth repeating inside one cycle. An
// HTTP status answer means the device responded and will answer the same way.
bool IsRetryableFetchStatus(transport::FetchStatus status);

// Computes remaining retries under a fixed budget.
std::uint32_t ComputeRetriesRemaining(std::uint32_t retry_limit, std::uint32_t retries_used);

// Wall-clock budget shared by every request of one poll cycle.
class PollDeadline {
public:
  using Clock = std::chrono::steady_clock;

  PollDeadline(Clock::time_point start, std::chrono::milliseconds budget)
      : deadline_(start + budget) {}

  std::chrono::milliseconds Remaining() const;

  bool Expired() const {
    return Remaining() <= std::chrono::milliseconds::zero();
  }

  // `requested`, clipped to what is left of the cycle.
  std::chrono::milliseconds Clip(std::chrono::milliseconds requested) const;

  Clock::time_point deadline() const {
    return deadline_;
  }

private:
  Clock::time_point deadline_;
};

struct FetchAttemptResult {
  transport::FetchResult result;
  std::uint32_t attempts = 0;
  // Set when the session rejected the request outright (caller misuse).
  std::string error;
  bool stopped_early = false;
};

// Runs the first attempt plus up to `retry_limit` retries for one endpoint.
// Retries stop when the status is not retryable, the deadline is exhausted or
// `cancel` is raised.
FetchAttemptResult ExecuteFetchAttempts(transport::DeviceSession& session,
                                        const endpoints::EndpointDescriptor& endpoint,
                                        std::chrono::milliseconds per_attempt_timeout,
                                        std::uint32_t retry_limit, const PollDeadline& deadline,
                                        const std::atomic<bool>* cancel,
                                        core::logging::Logger& logger);

} // namespace modemstat::poll

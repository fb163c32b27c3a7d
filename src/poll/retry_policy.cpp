#include "poll/retry_policy.hpp"

#include "core/logging/logger.hpp"
#include "transport/error_mapper.hpp"

#include <algorithm>

namespace modemstat::poll {

namespace {

bool Cancelled(const std::atomic<bool>* cancel) {
  return cancel != nullptr && cancel->load();
}

} // namespace

bool IsRetryableFetchStatus(transport::FetchStatus status) {
  return status == transport::FetchStatus::kConnectError ||
         status == transport::FetchStatus::kTimeout;
}

std::uint32_t ComputeRetriesRemaining(const std::uint32_t retry_limit,
                                      const std::uint32_t retries_used) {
  if (retries_used >= retry_limit) {
    return 0U;
  }
  return retry_limit - retries_used;
}

std::chrono::milliseconds PollDeadline::Remaining() const {
  const auto now = Clock::now();
  if (now >= deadline_) {
    return std::chrono::milliseconds::zero();
  }
  return std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - now);
}

std::chrono::milliseconds PollDeadline::Clip(std::chrono::milliseconds requested) const {
  return std::min(requested, Remaining());
}

FetchAttemptResult ExecuteFetchAttempts(transport::DeviceSession& session,
                                        const endpoints::EndpointDescriptor& endpoint,
                                        const std::chrono::milliseconds per_attempt_timeout,
                                        const std::uint32_t retry_limit,
                                        const PollDeadline& deadline,
                                        const std::atomic<bool>* cancel,
                                        core::logging::Logger& logger) {
  FetchAttemptResult attempt_result;
  std::uint32_t retries_used = 0;

  while (true) {
    const std::chrono::milliseconds timeout = deadline.Clip(per_attempt_timeout);
    if (timeout <= std::chrono::milliseconds::zero() || Cancelled(cancel)) {
      attempt_result.stopped_early = true;
      if (attempt_result.attempts == 0U) {
        attempt_result.result = transport::FetchResult{};
        attempt_result.result.status = transport::FetchStatus::kTimeout;
        attempt_result.result.detail =
            Cancelled(cancel) ? "cancelled before request" : "poll deadline exhausted";
      }
      return attempt_result;
    }

    ++attempt_result.attempts;
    if (!session.FetchEndpoint(endpoint, timeout, deadline.deadline(), attempt_result.result,
                               attempt_result.error)) {
      return attempt_result;
    }
    if (attempt_result.result.ok() || !IsRetryableFetchStatus(attempt_result.result.status)) {
      return attempt_result;
    }

    const auto mapped =
        transport::MapFetchFailure("fetch " + endpoint.path, attempt_result.result);
    if (ComputeRetriesRemaining(retry_limit, retries_used) == 0U) {
      return attempt_result;
    }
    ++retries_used;
    logger.Debug("retrying endpoint fetch",
                 {{"endpoint", endpoint.id},
                  {"attempt", std::to_string(attempt_result.attempts)},
                  {"retries_used", std::to_string(retries_used)},
                  {"retry_limit", std::to_string(retry_limit)},
                  {"error_code", transport::ToStableErrorCode(mapped.code)},
                  {"error", attempt_result.result.detail}});
  }
}

} // namespace modemstat::poll

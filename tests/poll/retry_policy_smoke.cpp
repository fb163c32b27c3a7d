#include "../common/assertions.hpp"
#include "../common/fake_transport.hpp"
#include "../common/modem_fixtures.hpp"
#include "core/logging/logger.hpp"
#include "endpoints/strategy_table.hpp"
#include "poll/retry_policy.hpp"
#include "transport/device_session.hpp"

#include <atomic>
#include <chrono>
#include <sstream>

int main() {
  using modemstat::core::logging::Logger;
  using modemstat::core::logging::LogLevel;
  using modemstat::poll::ComputeRetriesRemaining;
  using modemstat::poll::ExecuteFetchAttempts;
  using modemstat::poll::PollDeadline;
  using modemstat::tests::common::AssertContains;
  using modemstat::tests::common::FakeTransport;
  using modemstat::tests::common::Fail;
  using modemstat::tests::common::kTroubleshootPath;
  using modemstat::transport::DeviceSession;
  using modemstat::transport::FetchStatus;

  if (ComputeRetriesRemaining(1U, 0U) != 1U || ComputeRetriesRemaining(1U, 1U) != 0U ||
      ComputeRetriesRemaining(0U, 0U) != 0U || ComputeRetriesRemaining(3U, 7U) != 0U) {
    Fail("unexpected retry budget arithmetic");
  }
  if (!modemstat::poll::IsRetryableFetchStatus(FetchStatus::kTimeout) ||
      !modemstat::poll::IsRetryableFetchStatus(FetchStatus::kConnectError) ||
      modemstat::poll::IsRetryableFetchStatus(FetchStatus::kHttpStatusError)) {
    Fail("only transient transport failures are retryable");
  }

  {
    const PollDeadline spent(PollDeadline::Clock::now(), std::chrono::milliseconds(0));
    if (!spent.Expired() || spent.Clip(std::chrono::milliseconds(100)).count() != 0) {
      Fail("a zero budget is expired immediately");
    }
    const PollDeadline roomy(PollDeadline::Clock::now(), std::chrono::hours(1));
    if (roomy.Expired() || roomy.Clip(std::chrono::milliseconds(100)).count() != 100) {
      Fail("a large budget leaves the requested timeout unchanged");
    }
  }

  const auto* troubleshoot = modemstat::endpoints::DefaultStrategyTable().Find("troubleshoot");
  if (troubleshoot == nullptr) {
    Fail("missing troubleshoot endpoint");
  }
  const PollDeadline deadline(PollDeadline::Clock::now(), std::chrono::hours(1));
  constexpr std::chrono::milliseconds kTimeout{250};

  // A transient failure is retried within the budget and then succeeds.
  {
    std::ostringstream log;
    Logger logger(LogLevel::kDebug, log);
    FakeTransport transport;
    transport.RespondConnectError(kTroubleshootPath);
    transport.RespondOk(kTroubleshootPath, modemstat::tests::common::TroubleshootJson());
    DeviceSession session(transport);

    const auto attempt =
        ExecuteFetchAttempts(session, *troubleshoot, kTimeout, 1U, deadline, nullptr, logger);
    if (!attempt.result.ok() || attempt.attempts != 2U || attempt.stopped_early) {
      Fail("expected success on the second attempt");
    }
    AssertContains(log.str(), "msg=\"retrying endpoint fetch\"");
    AssertContains(log.str(), "error_code=\"DEVICE_CONNECT_FAILED\"");
  }

  // The retry budget is a hard cap.
  {
    Logger logger(LogLevel::kError);
    FakeTransport transport;
    transport.RespondTimeout(kTroubleshootPath);
    DeviceSession session(transport);

    auto attempt =
        ExecuteFetchAttempts(session, *troubleshoot, kTimeout, 0U, deadline, nullptr, logger);
    if (attempt.result.status != FetchStatus::kTimeout || attempt.attempts != 1U) {
      Fail("zero retries means exactly one attempt");
    }
    attempt = ExecuteFetchAttempts(session, *troubleshoot, kTimeout, 2U, deadline, nullptr, logger);
    if (attempt.attempts != 3U || transport.CallsTo(kTroubleshootPath) != 4U) {
      Fail("two retries means three attempts");
    }
  }

  // HTTP status answers are final.
  {
    Logger logger(LogLevel::kError);
    FakeTransport transport;
    transport.RespondStatus(kTroubleshootPath, 404);
    DeviceSession session(transport);
    const auto attempt =
        ExecuteFetchAttempts(session, *troubleshoot, kTimeout, 3U, deadline, nullptr, logger);
    if (attempt.attempts != 1U || attempt.result.http_status != 404) {
      Fail("HTTP status errors must not be retried");
    }
  }

  // Exhausted deadline and cancellation stop before any request.
  {
    Logger logger(LogLevel::kError);
    FakeTransport transport;
    transport.RespondOk(kTroubleshootPath, "{}");
    DeviceSession session(transport);

    const PollDeadline spent(PollDeadline::Clock::now(), std::chrono::milliseconds(0));
    auto attempt =
        ExecuteFetchAttempts(session, *troubleshoot, kTimeout, 1U, spent, nullptr, logger);
    if (attempt.attempts != 0U || !attempt.stopped_early ||
        attempt.result.status != FetchStatus::kTimeout) {
      Fail("spent deadline must stop before the first request");
    }
    AssertContains(attempt.result.detail, "poll deadline exhausted");

    const std::atomic<bool> cancel{true};
    attempt = ExecuteFetchAttempts(session, *troubleshoot, kTimeout, 1U, deadline, &cancel, logger);
    if (attempt.attempts != 0U || !attempt.stopped_early) {
      Fail("cancellation must stop before the first request");
    }
    AssertContains(attempt.result.detail, "cancelled before request");
    if (!transport.calls().empty() || transport.open_calls() != 0) {
      Fail("no device traffic expected");
    }
  }

  // The per-attempt timeout is clipped to the remaining cycle budget.
  {
    Logger logger(LogLevel::kError);
    FakeTransport transport;
    transport.RespondOk(kTroubleshootPath, "{}");
    DeviceSession session(transport);
    const PollDeadline tight(PollDeadline::Clock::now(), std::chrono::milliseconds(100));
    const auto attempt = ExecuteFetchAttempts(session, *troubleshoot, std::chrono::seconds(30), 0U,
                                              tight, nullptr, logger);
    if (!attempt.result.ok() || transport.calls().empty() ||
        transport.calls()[0].timeout > std::chrono::milliseconds(100)) {
      Fail("request timeout must not exceed the remaining budget");
    }
  }

  return 0;
}

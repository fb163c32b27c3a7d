#include "poll/poll_orchestrator.hpp"

#include "core/json_utils.hpp"
#include "core/logging/logger.hpp"
#include "core/time_utils.hpp"
#include "normalize/field_normalizer.hpp"
#include "parsers/json_payload_parser.hpp"
#include "poll/retry_policy.hpp"
#include "transport/device_session.hpp"
#include "transport/error_mapper.hpp"

#include <exception>
#include <sstream>
#include <utility>

namespace modemstat::poll {

namespace {

using Clock = std::chrono::steady_clock;
using snapshot::EndpointOutcomeKind;

std::chrono::milliseconds EndpointTimeout(const endpoints::EndpointDescriptor& endpoint,
                                          const PollOptions& options) {
  return endpoint.timeout.value_or(options.timeout);
}

std::chrono::milliseconds DeadlineBudget(const endpoints::StrategyTable& table,
                                         const PollOptions& options) {
  std::chrono::milliseconds budget{0};
  for (const auto& endpoint : table.endpoints()) {
    budget += EndpointTimeout(endpoint, options);
  }
  return budget;
}

EndpointOutcomeKind OutcomeFromFetch(transport::FetchStatus status) {
  switch (status) {
  case transport::FetchStatus::kOk:
    return EndpointOutcomeKind::kSuccess;
  case transport::FetchStatus::kConnectError:
    return EndpointOutcomeKind::kNetworkError;
  case transport::FetchStatus::kTimeout:
    return EndpointOutcomeKind::kTimeout;
  case transport::FetchStatus::kHttpStatusError:
    return EndpointOutcomeKind::kHttpStatusError;
  }
  return EndpointOutcomeKind::kNetworkError;
}

void RecordFailure(EndpointOutcome& outcome, EndpointOutcomeKind kind,
                   const transport::DeviceErrorMapping& mapped) {
  outcome.kind = kind;
  outcome.error_code = std::string(transport::ToStableErrorCode(mapped.code));
  outcome.detail = transport::FormatDeviceError(mapped);
}

void LogUnmappedCodes(const std::string& endpoint_id, const normalize::NormalizedFieldMap& fields,
                      core::logging::Logger& logger) {
  for (const auto& [key, value] : fields) {
    if (!value.unmapped_code) {
      continue;
    }
    logger.Debug("unmapped device code",
                 {{"endpoint", endpoint_id}, {"field", key}, {"raw", value.raw},
                  {"fallback", value.text}});
  }
}

// Fetches, parses and normalizes one endpoint. All failures end up in
// `outcome`; the returned result carries normalized fields only on success.
snapshot::EndpointResult PollEndpoint(const endpoints::EndpointDescriptor& endpoint,
                                      const PollOptions& options, const PollDeadline& deadline,
                                      transport::DeviceSession& session,
                                      core::logging::Logger& logger, EndpointOutcome& outcome) {
  snapshot::EndpointResult result;
  result.endpoint_id = endpoint.id;
  result.priority = endpoint.priority;
  result.claimed_fields = endpoint.fields;

  const FetchAttemptResult fetched =
      ExecuteFetchAttempts(session, endpoint, EndpointTimeout(endpoint, options),
                           options.max_retries, deadline, options.cancel, logger);
  outcome.attempts = fetched.attempts;
  outcome.http_status = fetched.result.http_status;

  const std::string operation = "fetch " + endpoint.path;
  if (!fetched.error.empty()) {
    RecordFailure(outcome, EndpointOutcomeKind::kNetworkError,
                  transport::MapDeviceError(operation, fetched.error));
    result.outcome = outcome.kind;
    return result;
  }
  if (!fetched.result.ok()) {
    RecordFailure(outcome, OutcomeFromFetch(fetched.result.status),
                  transport::MapFetchFailure(operation, fetched.result));
    result.outcome = outcome.kind;
    return result;
  }

  parsers::RawFieldMap raw;
  std::string parse_error;
  if (!parsers::ParsePayload(fetched.result.body, endpoint, raw, parse_error)) {
    RecordFailure(outcome, EndpointOutcomeKind::kParseError,
                  transport::MapDeviceError("parse " + endpoint.id, parse_error));
    result.outcome = outcome.kind;
    return result;
  }
  if (raw.empty()) {
    logger.Debug("endpoint payload carried no recognizable fields",
                 {{"endpoint", endpoint.id}, {"body_bytes",
                                               std::to_string(fetched.result.body.size())}});
    outcome.kind = EndpointOutcomeKind::kEmpty;
    result.outcome = outcome.kind;
    return result;
  }

  result.fields = normalize::NormalizeFieldMap(raw);
  LogUnmappedCodes(endpoint.id, result.fields, logger);
  outcome.field_count = result.fields.size();
  outcome.kind = result.fields.empty() ? EndpointOutcomeKind::kEmpty : EndpointOutcomeKind::kSuccess;
  result.outcome = outcome.kind;
  return result;
}

std::string OutcomesJson(const std::vector<EndpointOutcome>& outcomes) {
  std::ostringstream out;
  out << '[';
  for (std::size_t i = 0; i < outcomes.size(); ++i) {
    const EndpointOutcome& outcome = outcomes[i];
    core::JsonObjectBuilder builder;
    builder.AddString("endpoint", outcome.endpoint_id);
    builder.AddString("path", outcome.path);
    builder.AddString("outcome", snapshot::ToString(outcome.kind));
    builder.AddInteger("http_status", outcome.http_status);
    builder.AddUnsigned("attempts", outcome.attempts);
    builder.AddUnsigned("field_count", outcome.field_count);
    builder.AddUnsigned("elapsed_ms", outcome.elapsed_ms);
    if (!outcome.error_code.empty()) {
      builder.AddString("error_code", outcome.error_code);
      builder.AddString("detail", outcome.detail);
    }
    if (i != 0U) {
      out << ',';
    }
    out << builder.Build();
  }
  out << ']';
  return out.str();
}

} // namespace

const char* ToString(HealthVerdict verdict) {
  switch (verdict) {
  case HealthVerdict::kHealthy:
    return "healthy";
  case HealthVerdict::kDegraded:
    return "degraded";
  case HealthVerdict::kUnavailable:
    return "unavailable";
  }
  return "unavailable";
}

HealthVerdict ComputeHealth(const std::vector<EndpointOutcome>& outcomes,
                            std::size_t populated_fields) {
  if (populated_fields == 0U) {
    return HealthVerdict::kUnavailable;
  }
  for (const EndpointOutcome& outcome : outcomes) {
    if (outcome.kind != EndpointOutcomeKind::kSuccess) {
      return HealthVerdict::kDegraded;
    }
  }
  return HealthVerdict::kHealthy;
}

PollResult RunPollCycle(const PollOptions& options, const endpoints::StrategyTable& table,
                        transport::IDeviceTransport& transport, core::logging::Logger& logger) {
  const auto started = Clock::now();
  PollResult poll;
  poll.poll_id = options.poll_id;
  poll.device = options.device;
  logger.SetPollId(options.poll_id.empty() ? "-" : options.poll_id);
  if (!options.device.empty()) {
    logger.SetDevice(options.device);
  }

  const PollDeadline deadline(started, DeadlineBudget(table, options));
  std::vector<snapshot::EndpointResult> results;
  results.reserve(table.endpoints().size());

  {
    transport::DeviceSession session(transport);
    for (const endpoints::EndpointDescriptor& endpoint : table.endpoints()) {
      const auto endpoint_started = Clock::now();
      EndpointOutcome outcome;
      outcome.endpoint_id = endpoint.id;
      outcome.path = endpoint.path;

      snapshot::EndpointResult result;
      try {
        result = PollEndpoint(endpoint, options, deadline, session, logger, outcome);
      } catch (const std::exception& ex) {
        RecordFailure(outcome, EndpointOutcomeKind::kParseError,
                      transport::MapDeviceError("poll " + endpoint.id, ex.what()));
        result = snapshot::EndpointResult{};
        result.endpoint_id = endpoint.id;
        result.priority = endpoint.priority;
        result.claimed_fields = endpoint.fields;
        result.outcome = outcome.kind;
      }
      outcome.elapsed_ms = core::ElapsedMillis(endpoint_started, Clock::now());

      if (snapshot::IsFailure(outcome.kind)) {
        logger.Warn("endpoint failed",
                    {{"endpoint", outcome.endpoint_id},
                     {"outcome", snapshot::ToString(outcome.kind)},
                     {"attempts", std::to_string(outcome.attempts)},
                     {"error_code", outcome.error_code},
                     {"error", outcome.detail}});
      } else {
        logger.Debug("endpoint polled",
                     {{"endpoint", outcome.endpoint_id},
                      {"outcome", snapshot::ToString(outcome.kind)},
                      {"field_count", std::to_string(outcome.field_count)},
                      {"elapsed_ms", std::to_string(outcome.elapsed_ms)}});
      }

      poll.outcomes.push_back(std::move(outcome));
      results.push_back(std::move(result));
    }
  }

  poll.snapshot = snapshot::Aggregate(results, std::chrono::system_clock::now());
  poll.health = ComputeHealth(poll.outcomes, poll.snapshot.size());
  poll.elapsed_ms = core::ElapsedMillis(started, Clock::now());

  logger.Info("poll cycle finished",
              {{"health", ToString(poll.health)},
               {"field_count", std::to_string(poll.snapshot.size())},
               {"endpoints", std::to_string(poll.outcomes.size())},
               {"elapsed_ms", std::to_string(poll.elapsed_ms)}});
  return poll;
}

std::string ToJson(const PollResult& result) {
  core::JsonObjectBuilder builder;
  builder.AddString("poll_id", result.poll_id);
  builder.AddString("device", result.device);
  builder.AddString("health", ToString(result.health));
  builder.AddUnsigned("elapsed_ms", result.elapsed_ms);
  builder.AddRaw("endpoints", OutcomesJson(result.outcomes));
  builder.AddRaw("snapshot", snapshot::ToJson(result.snapshot));
  return builder.Build();
}

} // namespace modemstat::poll

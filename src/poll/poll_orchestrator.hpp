#pragma once

#include "endpoints/strategy_table.hpp"
#include "snapshot/aggregator.hpp"
#include "snapshot/metric_snapshot.hpp"
#include "transport/device_transport.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace modemstat::core::logging {
class Logger;
}

namespace modemstat::poll {

enum class HealthVerdict {
  kHealthy,
  kDegraded,
  kUnavailable,
};

const char* ToString(HealthVerdict verdict);

struct EndpointOutcome {
  std::string endpoint_id;
  std::string path;
  snapshot::EndpointOutcomeKind kind = snapshot::EndpointOutcomeKind::kSuccess;
  int http_status = 0;
  std::uint32_t attempts = 0;
  std::size_t field_count = 0;
  std::uint64_t elapsed_ms = 0;
  // Stable code from the transport error mapper; empty on success/empty.
  std::string error_code;
  std::string detail;
};

struct PollResult {
  std::string poll_id;
  std::string device;
  snapshot::MetricSnapshot snapshot;
  HealthVerdict health = HealthVerdict::kUnavailable;
  std::vector<EndpointOutcome> outcomes;
  std::uint64_t elapsed_ms = 0;
};

struct PollOptions {
  // Default per-endpoint timeout; a descriptor's own timeout overrides it.
  std::chrono::milliseconds timeout{5000};
  std::uint32_t max_retries = 1;
  // Checked between requests. Raising it ends the cycle early; endpoints not
  // yet attempted record a timeout.
  const std::atomic<bool>* cancel = nullptr;
  std::string poll_id;
  std::string device;
};

// `healthy` when every attempted endpoint delivered data, `unavailable` when
// nothing was populated, `degraded` otherwise.
HealthVerdict ComputeHealth(const std::vector<EndpointOutcome>& outcomes,
                            std::size_t populated_fields);

// Runs one cycle: every endpoint of `table` in priority order, each
// independently fault tolerant, then aggregation. Endpoint failures are
// recorded in the outcomes; nothing is thrown.
PollResult RunPollCycle(const PollOptions& options, const endpoints::StrategyTable& table,
                        transport::IDeviceTransport& transport, core::logging::Logger& logger);

std::string ToJson(const PollResult& result);

} // namespace modemstat::poll

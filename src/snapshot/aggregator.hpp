#pragma once

#include "normalize/field_normalizer.hpp"
#include "snapshot/metric_snapshot.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace modemstat::snapshot {

enum class EndpointOutcomeKind {
  kSuccess,
  kEmpty,
  kParseError,
  kNetworkError,
  kTimeout,
  kHttpStatusError,
};

const char* ToString(EndpointOutcomeKind kind);

// True for outcomes where the endpoint could not deliver its payload.
bool IsFailure(EndpointOutcomeKind kind);

// What one attempted endpoint contributed to a cycle.
struct EndpointResult {
  std::string endpoint_id;
  int priority = 0;
  // Fields the endpoint's descriptor claims it can supply.
  std::vector<std::string> claimed_fields;
  EndpointOutcomeKind outcome = EndpointOutcomeKind::kSuccess;
  normalize::NormalizedFieldMap fields;
};

// Merges endpoint results into one snapshot.
//
// Merge rule:
// - endpoints are visited by descending priority (input order breaks ties)
// - the first endpoint to supply a value for a key wins; later endpoints never
//   overwrite it, including with an unavailable marker over a marker
// - keys claimed by a failed endpoint and supplied by nobody land in
//   `failed_keys`; keys nobody supplied otherwise stay absent
MetricSnapshot Aggregate(const std::vector<EndpointResult>& results,
                         std::chrono::system_clock::time_point timestamp);

} // namespace modemstat::snapshot

#include "snapshot/aggregator.hpp"

#include <algorithm>

namespace modemstat::snapshot {

const char* ToString(EndpointOutcomeKind kind) {
  switch (kind) {
  case EndpointOutcomeKind::kSuccess:
    return "success";
  case EndpointOutcomeKind::kEmpty:
    return "empty";
  case EndpointOutcomeKind::kParseError:
    return "parse_error";
  case EndpointOutcomeKind::kNetworkError:
    return "network_error";
  case EndpointOutcomeKind::kTimeout:
    return "timeout";
  case EndpointOutcomeKind::kHttpStatusError:
    return "http_status_error";
  }
  return "network_error";
}

bool IsFailure(EndpointOutcomeKind kind) {
  return kind != EndpointOutcomeKind::kSuccess && kind != EndpointOutcomeKind::kEmpty;
}

MetricSnapshot Aggregate(const std::vector<EndpointResult>& results,
                         std::chrono::system_clock::time_point timestamp) {
  std::vector<const EndpointResult*> ordered;
  ordered.reserve(results.size());
  for (const EndpointResult& result : results) {
    ordered.push_back(&result);
  }
  std::stable_sort(ordered.begin(), ordered.end(),
                   [](const EndpointResult* lhs, const EndpointResult* rhs) {
                     return lhs->priority > rhs->priority;
                   });

  MetricSnapshot snapshot;
  snapshot.timestamp = timestamp;

  for (const EndpointResult* result : ordered) {
    if (result->outcome != EndpointOutcomeKind::kSuccess) {
      continue;
    }
    for (const auto& [key, value] : result->fields) {
      if (key == endpoints::keys::kLastUpdateTime) {
        continue;
      }
      snapshot.entries.emplace(key, SnapshotEntry{value, result->endpoint_id});
    }
  }

  for (const EndpointResult* result : ordered) {
    if (!IsFailure(result->outcome)) {
      continue;
    }
    for (const std::string& key : result->claimed_fields) {
      if (key == endpoints::keys::kLastUpdateTime || snapshot.Find(key) != nullptr) {
        continue;
      }
      snapshot.failed_keys.insert(key);
    }
  }

  return snapshot;
}

} // namespace modemstat::snapshot

#pragma once

#include "endpoints/metric_catalog.hpp"
#include "normalize/field_normalizer.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace modemstat::snapshot {

// Provenance value used for fields the snapshot itself supplies.
inline constexpr std::string_view kSnapshotSource = "snapshot";

struct SnapshotEntry {
  normalize::NormalizedValue value;
  // Id of the endpoint whose payload supplied this value.
  std::string source_endpoint;
};

// Unified result of one poll cycle.
//
// A key is in `entries` only when an endpoint actually supplied data for it.
// `failed_keys` lists keys that some failed endpoint could have supplied and
// no other endpoint did; callers surface those as unavailable rather than
// unsupported.
struct MetricSnapshot {
  std::chrono::system_clock::time_point timestamp{};
  std::map<std::string, SnapshotEntry, std::less<>> entries;
  std::set<std::string, std::less<>> failed_keys;

  const SnapshotEntry* Find(std::string_view key) const {
    const auto it = entries.find(key);
    return it == entries.end() ? nullptr : &it->second;
  }

  std::size_t size() const {
    return entries.size();
  }

  bool empty() const {
    return entries.empty();
  }
};

struct SnapshotDiff {
  std::vector<std::string> added;
  std::vector<std::string> removed;
  std::vector<std::string> changed;

  bool empty() const {
    return added.empty() && removed.empty() && changed.empty();
  }
};

// Key-level difference between two cycles. A value counts as changed when its
// display text, unit or availability differs; provenance changes alone do not.
SnapshotDiff DiffSnapshots(const MetricSnapshot& previous, const MetricSnapshot& current);

enum class Availability {
  kAvailable,
  kUnavailable,
  kAbsent,
};

const char* ToString(Availability availability);

struct MetricSurfaceRow {
  std::string key;
  std::string display_name;
  endpoints::MetricCategory category = endpoints::MetricCategory::kStatus;
  std::string value;
  std::string unit;
  Availability availability = Availability::kAbsent;
  std::string source_endpoint;
};

// One row per catalog field in catalog order. `last_update_time` is taken from
// the snapshot timestamp.
std::vector<MetricSurfaceRow> BuildMetricSurface(const MetricSnapshot& snapshot);

std::string ToJson(const MetricSnapshot& snapshot);
std::string ToJson(const SnapshotDiff& diff);

} // namespace modemstat::snapshot

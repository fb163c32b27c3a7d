#include "snapshot/metric_snapshot.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <sstream>

namespace modemstat::snapshot {

namespace {

bool SameValue(const normalize::NormalizedValue& lhs, const normalize::NormalizedValue& rhs) {
  return lhs.available == rhs.available && lhs.text == rhs.text && lhs.unit == rhs.unit;
}

std::string ToJsonArray(const std::vector<std::string>& values) {
  std::ostringstream out;
  out << '[';
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i != 0U) {
      out << ',';
    }
    out << core::QuoteJson(values[i]);
  }
  out << ']';
  return out.str();
}

std::string ValueJson(const normalize::NormalizedValue& value) {
  core::JsonObjectBuilder builder;
  builder.AddString("kind", endpoints::ToString(value.kind));
  builder.AddBool("available", value.available);
  builder.AddString("text", value.text);
  if (value.integer.has_value()) {
    builder.AddInteger("integer", *value.integer);
  }
  if (value.boolean.has_value()) {
    builder.AddBool("boolean", *value.boolean);
  }
  if (!value.unit.empty()) {
    builder.AddString("unit", value.unit);
  }
  builder.AddString("raw", value.raw);
  return builder.Build();
}

} // namespace

SnapshotDiff DiffSnapshots(const MetricSnapshot& previous, const MetricSnapshot& current) {
  SnapshotDiff diff;
  for (const auto& [key, entry] : current.entries) {
    const SnapshotEntry* before = previous.Find(key);
    if (before == nullptr) {
      diff.added.push_back(key);
    } else if (!SameValue(before->value, entry.value)) {
      diff.changed.push_back(key);
    }
  }
  for (const auto& [key, entry] : previous.entries) {
    (void)entry;
    if (current.Find(key) == nullptr) {
      diff.removed.push_back(key);
    }
  }
  return diff;
}

const char* ToString(Availability availability) {
  switch (availability) {
  case Availability::kAvailable:
    return "available";
  case Availability::kUnavailable:
    return "unavailable";
  case Availability::kAbsent:
    return "absent";
  }
  return "absent";
}

std::vector<MetricSurfaceRow> BuildMetricSurface(const MetricSnapshot& snapshot) {
  std::vector<MetricSurfaceRow> rows;
  rows.reserve(endpoints::MetricCatalog().size());
  for (const endpoints::MetricField& field : endpoints::MetricCatalog()) {
    MetricSurfaceRow row;
    row.key = std::string(field.key);
    row.display_name = std::string(field.display_name);
    row.category = field.category;

    if (field.key == endpoints::keys::kLastUpdateTime) {
      row.value = core::FormatUtcTimestamp(snapshot.timestamp);
      row.availability = Availability::kAvailable;
      row.source_endpoint = std::string(kSnapshotSource);
    } else if (const SnapshotEntry* entry = snapshot.Find(field.key); entry != nullptr) {
      row.value = entry->value.text;
      row.unit = entry->value.unit;
      row.availability =
          entry->value.available ? Availability::kAvailable : Availability::kUnavailable;
      row.source_endpoint = entry->source_endpoint;
    } else if (snapshot.failed_keys.count(field.key) != 0U) {
      row.availability = Availability::kUnavailable;
    }
    rows.push_back(std::move(row));
  }
  return rows;
}

std::string ToJson(const MetricSnapshot& snapshot) {
  core::JsonObjectBuilder values;
  for (const auto& [key, entry] : snapshot.entries) {
    core::JsonObjectBuilder item;
    item.AddRaw("value", ValueJson(entry.value));
    item.AddString("source", entry.source_endpoint);
    values.AddRaw(key, item.Build());
  }

  std::vector<std::string> failed(snapshot.failed_keys.begin(), snapshot.failed_keys.end());

  core::JsonObjectBuilder builder;
  builder.AddString("timestamp_utc", core::FormatUtcTimestamp(snapshot.timestamp));
  builder.AddUnsigned("field_count", snapshot.size());
  builder.AddRaw("fields", values.Build());
  builder.AddRaw("unavailable_due_to_failure", ToJsonArray(failed));
  return builder.Build();
}

std::string ToJson(const SnapshotDiff& diff) {
  core::JsonObjectBuilder builder;
  builder.AddRaw("added", ToJsonArray(diff.added));
  builder.AddRaw("removed", ToJsonArray(diff.removed));
  builder.AddRaw("changed", ToJsonArray(diff.changed));
  return builder.Build();
}

} // namespace modemstat::snapshot

#pragma once

#include "endpoints/metric_catalog.hpp"
#include "parsers/raw_field_map.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace modemstat::normalize {

inline constexpr std::string_view kUnavailableText = "unavailable";

// Canonical value of one metric after normalization.
//
// `available == false` is the explicit marker for "the device sent something
// but it could not be interpreted". It is distinct from a field that is absent
// from the snapshot entirely.
struct NormalizedValue {
  endpoints::ValueKind kind = endpoints::ValueKind::kText;
  bool available = true;
  std::string text;
  std::optional<std::int64_t> integer;
  std::optional<bool> boolean;
  std::string unit;
  std::string raw;
  // Set when a numeric code had no entry in the field's lookup table.
  bool unmapped_code = false;

  bool operator==(const NormalizedValue&) const = default;
};

using NormalizedFieldMap = std::map<std::string, NormalizedValue, std::less<>>;

struct ChannelCounts {
  std::int64_t downstream_30 = 0;
  std::int64_t upstream_30 = 0;
  std::int64_t downstream_31 = 0;
  std::int64_t upstream_31 = 0;
};

// Maps one raw value to its canonical form. Never throws; keys outside the
// catalog pass through as trimmed text.
NormalizedValue Normalize(std::string_view field_key, std::string_view raw_value);

// Convenience builders shared by the channel-count derivation and tests.
NormalizedValue MakeUnavailable(endpoints::ValueKind kind, std::string_view raw_value);
NormalizedValue MakeCount(std::int64_t count);

ChannelCounts TallyChannelRows(const std::vector<parsers::ChannelRow>& rows);

// Normalizes every field of one endpoint's raw map.
//
// Channel counts come from `raw.channel_rows` when the payload carried rows;
// otherwise directly reported per-version counts are normalized as integers
// and a direction total is produced only when both versions of that direction
// are present.
NormalizedFieldMap NormalizeFieldMap(const parsers::RawFieldMap& raw);

} // namespace modemstat::normalize

#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace modemstat::parsers {

enum class DocsisVersion {
  k30,
  k31,
};

enum class ChannelDirection {
  kDownstream,
  kUpstream,
};

// One channel row from a status table, tagged the way the device UI tags it.
struct ChannelRow {
  DocsisVersion version = DocsisVersion::k30;
  ChannelDirection direction = ChannelDirection::kDownstream;
};

// Raw values extracted from one endpoint response, keyed by metric key.
// Lives only for the duration of one poll cycle.
struct RawFieldMap {
  std::map<std::string, std::string, std::less<>> fields;
  std::vector<ChannelRow> channel_rows;

  bool empty() const {
    return fields.empty() && channel_rows.empty();
  }

  const std::string* Find(std::string_view key) const {
    const auto it = fields.find(key);
    if (it == fields.end()) {
      return nullptr;
    }
    return &it->second;
  }
};

inline const char* ToString(DocsisVersion version) {
  return version == DocsisVersion::k31 ? "3.1" : "3.0";
}

inline const char* ToString(ChannelDirection direction) {
  return direction == ChannelDirection::kUpstream ? "upstream" : "downstream";
}

} // namespace modemstat::parsers

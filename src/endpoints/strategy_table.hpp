#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace modemstat::endpoints {

enum class PayloadShape {
  kHtmlStatusTable,
  kJson,
};

const char* ToString(PayloadShape shape);
bool ParsePayloadShape(std::string_view raw, PayloadShape& shape);

// One candidate data source on the device. Immutable once a table is built.
//
// JSON endpoints describe where each metric lives in the payload:
// - `json_keys` for object payloads (metric key -> payload key)
// - `array_indices` for positional array payloads (metric key -> index)
// Both may be present; firmware revisions differ in which form they return.
struct EndpointDescriptor {
  std::string id;
  std::string path;
  PayloadShape shape = PayloadShape::kJson;
  int priority = 0;
  std::string method = "GET";
  std::string form_body;
  // Page that must be fetched earlier in the same cycle before this endpoint
  // returns complete data. Empty when no priming is needed.
  std::string prime_path;
  std::optional<std::chrono::milliseconds> timeout;
  std::map<std::string, std::string, std::less<>> json_keys;
  std::map<std::string, std::size_t, std::less<>> array_indices;
  // Derived from the shape and the mappings by BuildStrategyTable.
  std::vector<std::string> fields;

  bool CanSupply(std::string_view field_key) const;
};

// Ordered candidate list, highest priority first.
class StrategyTable {
public:
  StrategyTable() = default;

  const std::vector<EndpointDescriptor>& endpoints() const {
    return endpoints_;
  }

  bool empty() const {
    return endpoints_.empty();
  }

  const EndpointDescriptor* Find(std::string_view id) const;

  // Endpoints that could populate `field_key`, in priority order. An empty
  // result means the field is genuinely unsupported by this table.
  std::vector<const EndpointDescriptor*> EndpointsFor(std::string_view field_key) const;

private:
  friend bool BuildStrategyTable(std::vector<EndpointDescriptor> endpoints, StrategyTable& table,
                                 std::string& error);

  std::vector<EndpointDescriptor> endpoints_;
};

// Validates descriptors, derives each descriptor's field set and sorts by
// descending priority (declaration order breaks ties).
bool BuildStrategyTable(std::vector<EndpointDescriptor> endpoints, StrategyTable& table,
                        std::string& error);

// Builds the built-in table below into `table`.
bool BuildDefaultStrategyTable(StrategyTable& table, std::string& error);

// Built-in table for the ARRIS/Virgin Media status UI:
// 1) network_status JSON (primed by "/")
// 2) troubleshoot JSON
// 3) "/" HTML status table
// If the built-in descriptors are ever rejected the error is logged and the
// table is empty, so every poll reports `unavailable`.
const StrategyTable& DefaultStrategyTable();

// Parses a table document:
// {
//   "endpoints": [
//     {"id": "troubleshoot", "path": "/php/connection_troubleshoot_data.php",
//      "shape": "json", "priority": 20,
//      "json_keys": {"cable_modem_status": "js_cm_oper_value"}}
//   ]
// }
bool LoadStrategyTableFromText(std::string_view json_text, StrategyTable& table,
                               std::string& error);

bool LoadStrategyTableFromFile(const std::filesystem::path& path, StrategyTable& table,
                               std::string& error);

// Lookup order:
// 1) `MODEMSTAT_STRATEGY_TABLE` env var, if set
// 2) nearest `config/strategy_table.json` walking up from cwd
// Returns an empty path when neither exists; callers then use the built-in table.
std::filesystem::path ResolveDefaultStrategyTablePath();

// Canonical JSON form of a table; accepted back by LoadStrategyTableFromText.
std::string ToJson(const StrategyTable& table);

} // namespace modemstat::endpoints

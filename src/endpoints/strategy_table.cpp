#include "endpoints/strategy_table.hpp"

#include "core/json_dom.hpp"
#include "core/json_utils.hpp"
#include "core/logging/logger.hpp"
#include "endpoints/metric_catalog.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <set>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace modemstat::endpoints {

namespace {

using JsonValue = core::json::Value;

constexpr std::chrono::milliseconds kMaxEndpointTimeout{60'000};

// Fields the HTML status table can carry. Channel counts come from row tallies.
const std::vector<std::string_view>& HtmlStatusFields() {
  static const std::vector<std::string_view> kFields = {
      keys::kCableModemStatus,        keys::kPrimaryDownstreamChannel,
      keys::kDocsis30Downstream,      keys::kDocsis30Upstream,
      keys::kDocsis31Downstream,      keys::kDocsis31Upstream,
      keys::kTotalDownstreamChannels, keys::kTotalUpstreamChannels,
  };
  return kFields;
}

void AddUnique(std::vector<std::string>& fields, std::string_view key) {
  if (std::find(fields.begin(), fields.end(), key) == fields.end()) {
    fields.emplace_back(key);
  }
}

std::vector<std::string> DeriveFields(const EndpointDescriptor& descriptor) {
  std::vector<std::string> fields;
  if (descriptor.shape == PayloadShape::kHtmlStatusTable) {
    for (const std::string_view key : HtmlStatusFields()) {
      AddUnique(fields, key);
    }
    return fields;
  }

  for (const auto& [key, _] : descriptor.json_keys) {
    AddUnique(fields, key);
  }
  for (const auto& [key, _] : descriptor.array_indices) {
    AddUnique(fields, key);
  }

  // Totals are derived whenever a direction's per-version counts are mapped.
  const auto supplies = [&fields](std::string_view key) {
    return std::find(fields.begin(), fields.end(), key) != fields.end();
  };
  if (supplies(keys::kDocsis30Downstream) || supplies(keys::kDocsis31Downstream)) {
    AddUnique(fields, keys::kTotalDownstreamChannels);
  }
  if (supplies(keys::kDocsis30Upstream) || supplies(keys::kDocsis31Upstream)) {
    AddUnique(fields, keys::kTotalUpstreamChannels);
  }
  return fields;
}

bool ValidateMappedKey(const EndpointDescriptor& descriptor, std::string_view key,
                       std::string& error) {
  if (!IsKnownMetricKey(key)) {
    error = "endpoint '" + descriptor.id + "' maps unknown metric key '" + std::string(key) + "'";
    return false;
  }
  if (key == keys::kLastUpdateTime) {
    error = "endpoint '" + descriptor.id + "' cannot supply '" + std::string(key) +
            "'; it is stamped by the poll cycle";
    return false;
  }
  if (key == keys::kTotalDownstreamChannels || key == keys::kTotalUpstreamChannels) {
    error = "endpoint '" + descriptor.id + "' maps '" + std::string(key) +
            "'; totals are derived from per-version channel counts";
    return false;
  }
  return true;
}

bool ValidateDescriptor(const EndpointDescriptor& descriptor, std::string& error) {
  if (descriptor.id.empty()) {
    error = "endpoint id must not be empty";
    return false;
  }
  if (descriptor.path.empty() || descriptor.path.front() != '/') {
    error = "endpoint '" + descriptor.id + "' path must start with '/'";
    return false;
  }
  if (!descriptor.prime_path.empty() && descriptor.prime_path.front() != '/') {
    error = "endpoint '" + descriptor.id + "' prime_path must start with '/'";
    return false;
  }
  if (descriptor.method != "GET" && descriptor.method != "POST") {
    error = "endpoint '" + descriptor.id + "' method must be GET or POST";
    return false;
  }
  if (descriptor.method == "GET" && !descriptor.form_body.empty()) {
    error = "endpoint '" + descriptor.id + "' form_body requires method POST";
    return false;
  }
  if (descriptor.timeout.has_value() &&
      (descriptor.timeout->count() <= 0 || *descriptor.timeout > kMaxEndpointTimeout)) {
    error = "endpoint '" + descriptor.id + "' timeout_ms must be in [1, 60000]";
    return false;
  }

  if (descriptor.shape == PayloadShape::kHtmlStatusTable) {
    if (!descriptor.json_keys.empty() || !descriptor.array_indices.empty()) {
      error = "endpoint '" + descriptor.id + "' is an HTML status table and cannot map JSON keys";
      return false;
    }
    return true;
  }

  if (descriptor.json_keys.empty() && descriptor.array_indices.empty()) {
    error = "endpoint '" + descriptor.id + "' must map at least one metric";
    return false;
  }
  for (const auto& [key, payload_key] : descriptor.json_keys) {
    if (!ValidateMappedKey(descriptor, key, error)) {
      return false;
    }
    if (payload_key.empty()) {
      error = "endpoint '" + descriptor.id + "' maps '" + key + "' to an empty payload key";
      return false;
    }
  }
  for (const auto& [key, _] : descriptor.array_indices) {
    if (!ValidateMappedKey(descriptor, key, error)) {
      return false;
    }
  }
  return true;
}

bool ReadString(const JsonValue& object, std::string_view key, std::string& out,
                std::string_view where, std::string& error) {
  const JsonValue* field = object.Find(key);
  if (field == nullptr) {
    return true;
  }
  if (!field->IsString()) {
    error = std::string(where) + "." + std::string(key) + " must be a string";
    return false;
  }
  out = field->string_value;
  return true;
}

bool ReadInteger(const JsonValue& value, std::int64_t& out) {
  if (!value.IsNumber() || !std::isfinite(value.number_value)) {
    return false;
  }
  const double floored = std::floor(value.number_value);
  if (floored != value.number_value || std::fabs(floored) > 1e15) {
    return false;
  }
  out = static_cast<std::int64_t>(floored);
  return true;
}

bool ParseDescriptor(const JsonValue& node, std::size_t index, EndpointDescriptor& descriptor,
                     std::string& error) {
  const std::string where = "endpoints[" + std::to_string(index) + "]";
  if (!node.IsObject()) {
    error = where + " must be an object";
    return false;
  }

  if (!ReadString(node, "id", descriptor.id, where, error) ||
      !ReadString(node, "path", descriptor.path, where, error) ||
      !ReadString(node, "method", descriptor.method, where, error) ||
      !ReadString(node, "form_body", descriptor.form_body, where, error) ||
      !ReadString(node, "prime_path", descriptor.prime_path, where, error)) {
    return false;
  }

  std::string shape_text;
  if (!ReadString(node, "shape", shape_text, where, error)) {
    return false;
  }
  if (!ParsePayloadShape(shape_text, descriptor.shape)) {
    error = where + ".shape must be one of html_status_table|json";
    return false;
  }

  if (const JsonValue* priority = node.Find("priority"); priority != nullptr) {
    std::int64_t parsed = 0;
    if (!ReadInteger(*priority, parsed) || parsed < 0 || parsed > 1'000'000) {
      error = where + ".priority must be an integer in [0, 1000000]";
      return false;
    }
    descriptor.priority = static_cast<int>(parsed);
  }

  if (const JsonValue* timeout = node.Find("timeout_ms"); timeout != nullptr) {
    std::int64_t parsed = 0;
    if (!ReadInteger(*timeout, parsed)) {
      error = where + ".timeout_ms must be an integer";
      return false;
    }
    descriptor.timeout = std::chrono::milliseconds(parsed);
  }

  if (const JsonValue* json_keys = node.Find("json_keys"); json_keys != nullptr) {
    if (!json_keys->IsObject()) {
      error = where + ".json_keys must be an object";
      return false;
    }
    for (const auto& [metric, payload_key] : json_keys->object_value) {
      if (!payload_key.IsString()) {
        error = where + ".json_keys." + metric + " must be a string";
        return false;
      }
      descriptor.json_keys.emplace(metric, payload_key.string_value);
    }
  }

  if (const JsonValue* indices = node.Find("array_indices"); indices != nullptr) {
    if (!indices->IsObject()) {
      error = where + ".array_indices must be an object";
      return false;
    }
    for (const auto& [metric, position] : indices->object_value) {
      std::int64_t parsed = 0;
      if (!ReadInteger(position, parsed) || parsed < 0) {
        error = where + ".array_indices." + metric + " must be a non-negative integer";
        return false;
      }
      descriptor.array_indices.emplace(metric, static_cast<std::size_t>(parsed));
    }
  }

  return true;
}

EndpointDescriptor MakeNetworkStatusEndpoint() {
  EndpointDescriptor endpoint;
  endpoint.id = "network_status";
  endpoint.path = "/php/ajaxGet_device_networkstatus_data.php";
  endpoint.shape = PayloadShape::kJson;
  endpoint.priority = 30;
  endpoint.prime_path = "/";

  // Positional layout returned by the ARRIS TG/Hub firmware.
  endpoint.array_indices = {
      {std::string(keys::kPrimaryDownstreamChannel), 2},
      {std::string(keys::kIspProvider), 4},
      {std::string(keys::kNetworkAccess), 5},
      {std::string(keys::kMaxCpes), 6},
      {std::string(keys::kBaselinePrivacy), 7},
      {std::string(keys::kDocsisVersion), 8},
      {std::string(keys::kDocsisMode), 8},
      {std::string(keys::kConfigFile), 9},
      {std::string(keys::kPrimaryDownstreamSfid), 10},
      {std::string(keys::kPrimaryDownstreamMaxTrafficRate), 11},
      {std::string(keys::kPrimaryDownstreamMaxTrafficBurst), 12},
      {std::string(keys::kPrimaryDownstreamMinTrafficRate), 13},
      {std::string(keys::kPrimaryUpstreamSfid), 14},
      {std::string(keys::kPrimaryUpstreamMaxTrafficRate), 15},
      {std::string(keys::kPrimaryUpstreamMaxTrafficBurst), 16},
      {std::string(keys::kPrimaryUpstreamMinTrafficRate), 17},
      {std::string(keys::kPrimaryUpstreamMaxConcatenatedBurst), 18},
      {std::string(keys::kPrimaryUpstreamSchedulingType), 19},
      {std::string(keys::kDocsis30Upstream), 25},
      {std::string(keys::kDocsis30Downstream), 26},
      {std::string(keys::kDocsis31Downstream), 27},
      {std::string(keys::kDocsis31Upstream), 28},
  };

  // Object layout returned by newer firmware.
  endpoint.json_keys = {
      {std::string(keys::kPrimaryDownstreamChannel), "ds_channel_lock"},
      {std::string(keys::kIspProvider), "cust_id"},
      {std::string(keys::kNetworkAccess), "network_access"},
      {std::string(keys::kMaxCpes), "max_cpe"},
      {std::string(keys::kBaselinePrivacy), "baseline_privacy"},
      {std::string(keys::kDocsisVersion), "docsis_version"},
      {std::string(keys::kDocsisMode), "docsis_mode"},
      {std::string(keys::kConfigFile), "config_file"},
      {std::string(keys::kPrimaryDownstreamSfid), "ds_sfid"},
      {std::string(keys::kPrimaryDownstreamMaxTrafficRate), "ds_max_traffic_rate"},
      {std::string(keys::kPrimaryDownstreamMaxTrafficBurst), "ds_max_traffic_burst"},
      {std::string(keys::kPrimaryDownstreamMinTrafficRate), "ds_min_traffic_rate"},
      {std::string(keys::kPrimaryUpstreamSfid), "us_sfid"},
      {std::string(keys::kPrimaryUpstreamMaxTrafficRate), "us_max_traffic_rate"},
      {std::string(keys::kPrimaryUpstreamMaxTrafficBurst), "us_max_traffic_burst"},
      {std::string(keys::kPrimaryUpstreamMinTrafficRate), "us_min_traffic_rate"},
      {std::string(keys::kPrimaryUpstreamMaxConcatenatedBurst), "us_max_concatenated_burst"},
      {std::string(keys::kPrimaryUpstreamSchedulingType), "us_scheduling_type"},
      {std::string(keys::kDocsis30Upstream), "us_30_channels"},
      {std::string(keys::kDocsis30Downstream), "ds_30_channels"},
      {std::string(keys::kDocsis31Downstream), "ds_31_channels"},
      {std::string(keys::kDocsis31Upstream), "us_31_channels"},
  };
  return endpoint;
}

EndpointDescriptor MakeTroubleshootEndpoint() {
  EndpointDescriptor endpoint;
  endpoint.id = "troubleshoot";
  endpoint.path = "/php/connection_troubleshoot_data.php";
  endpoint.shape = PayloadShape::kJson;
  endpoint.priority = 20;
  endpoint.json_keys = {
      {std::string(keys::kCableModemStatus), "js_cm_oper_value"},
      {std::string(keys::kCableModemRegistration), "js_cm_reg_value"},
      {std::string(keys::kWanIpProvisionMode), "js_wan_ip_prov_mode"},
      {std::string(keys::kFailSafeMode), "js_fail_safe_mode"},
      {std::string(keys::kNoRfDetected), "js_NoRF_Detected"},
  };
  return endpoint;
}

EndpointDescriptor MakeStatusPageEndpoint() {
  EndpointDescriptor endpoint;
  endpoint.id = "status_page";
  endpoint.path = "/";
  endpoint.shape = PayloadShape::kHtmlStatusTable;
  endpoint.priority = 10;
  return endpoint;
}

} // namespace

const char* ToString(PayloadShape shape) {
  switch (shape) {
  case PayloadShape::kHtmlStatusTable:
    return "html_status_table";
  case PayloadShape::kJson:
    return "json";
  }
  return "json";
}

bool ParsePayloadShape(std::string_view raw, PayloadShape& shape) {
  if (raw == "html_status_table" || raw == "html") {
    shape = PayloadShape::kHtmlStatusTable;
    return true;
  }
  if (raw == "json") {
    shape = PayloadShape::kJson;
    return true;
  }
  return false;
}

bool EndpointDescriptor::CanSupply(std::string_view field_key) const {
  return std::find(fields.begin(), fields.end(), field_key) != fields.end();
}

const EndpointDescriptor* StrategyTable::Find(std::string_view id) const {
  for (const EndpointDescriptor& endpoint : endpoints_) {
    if (endpoint.id == id) {
      return &endpoint;
    }
  }
  return nullptr;
}

std::vector<const EndpointDescriptor*> StrategyTable::EndpointsFor(
    std::string_view field_key) const {
  std::vector<const EndpointDescriptor*> matches;
  for (const EndpointDescriptor& endpoint : endpoints_) {
    if (endpoint.CanSupply(field_key)) {
      matches.push_back(&endpoint);
    }
  }
  return matches;
}

bool BuildStrategyTable(std::vector<EndpointDescriptor> endpoints, StrategyTable& table,
                        std::string& error) {
  table = StrategyTable{};
  error.clear();

  if (endpoints.empty()) {
    error = "strategy table must include at least one endpoint";
    return false;
  }

  std::set<std::string, std::less<>> seen_ids;
  for (EndpointDescriptor& endpoint : endpoints) {
    if (!ValidateDescriptor(endpoint, error)) {
      return false;
    }
    if (!seen_ids.insert(endpoint.id).second) {
      error = "duplicate endpoint id: " + endpoint.id;
      return false;
    }
    endpoint.fields = DeriveFields(endpoint);
  }

  std::stable_sort(endpoints.begin(), endpoints.end(),
                   [](const EndpointDescriptor& lhs, const EndpointDescriptor& rhs) {
                     return lhs.priority > rhs.priority;
                   });
  table.endpoints_ = std::move(endpoints);
  return true;
}

bool BuildDefaultStrategyTable(StrategyTable& table, std::string& error) {
  return BuildStrategyTable(
      {MakeNetworkStatusEndpoint(), MakeTroubleshootEndpoint(), MakeStatusPageEndpoint()}, table,
      error);
}

const StrategyTable& DefaultStrategyTable() {
  static const StrategyTable kDefault = [] {
    StrategyTable table;
    std::string error;
    if (!BuildDefaultStrategyTable(table, error)) {
      core::logging::Logger logger(core::logging::LogLevel::kError);
      logger.Error("built-in strategy table rejected", {{"error", error}});
    }
    return table;
  }();
  return kDefault;
}

bool LoadStrategyTableFromText(std::string_view json_text, StrategyTable& table,
                               std::string& error) {
  table = StrategyTable{};
  error.clear();

  JsonValue root;
  if (!core::json::Parse(json_text, root, error)) {
    return false;
  }
  if (!root.IsObject()) {
    error = "strategy table must be a JSON object";
    return false;
  }
  const JsonValue* list = root.Find("endpoints");
  if (list == nullptr || !list->IsArray()) {
    error = "strategy table requires an 'endpoints' array";
    return false;
  }

  std::vector<EndpointDescriptor> endpoints;
  endpoints.reserve(list->array_value.size());
  for (std::size_t i = 0; i < list->array_value.size(); ++i) {
    EndpointDescriptor descriptor;
    if (!ParseDescriptor(list->array_value[i], i, descriptor, error)) {
      return false;
    }
    endpoints.push_back(std::move(descriptor));
  }
  return BuildStrategyTable(std::move(endpoints), table, error);
}

bool LoadStrategyTableFromFile(const fs::path& path, StrategyTable& table, std::string& error) {
  table = StrategyTable{};
  error.clear();

  if (path.empty()) {
    error = "strategy table path cannot be empty";
    return false;
  }

  std::ifstream input(path, std::ios::binary);
  if (!input) {
    error = "failed to open strategy table file: " + path.string();
    return false;
  }

  const std::string text((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
  if (text.empty()) {
    error = "strategy table file is empty: " + path.string();
    return false;
  }
  if (!LoadStrategyTableFromText(text, table, error)) {
    error = "failed to load strategy table '" + path.string() + "': " + error;
    return false;
  }
  return true;
}

fs::path ResolveDefaultStrategyTablePath() {
  if (const char* env = std::getenv("MODEMSTAT_STRATEGY_TABLE"); env != nullptr && *env != '\0') {
    return fs::path(env);
  }

  const fs::path relative = fs::path("config") / "strategy_table.json";
  std::error_code ec;
  fs::path cursor = fs::current_path(ec);
  if (ec) {
    return {};
  }

  while (true) {
    const fs::path candidate = cursor / relative;
    if (fs::exists(candidate, ec) && !ec) {
      return candidate;
    }
    if (!cursor.has_parent_path() || cursor.parent_path() == cursor) {
      break;
    }
    cursor = cursor.parent_path();
  }
  return {};
}

std::string ToJson(const StrategyTable& table) {
  std::string endpoints_json = "[";
  bool first = true;
  for (const EndpointDescriptor& endpoint : table.endpoints()) {
    core::JsonObjectBuilder item;
    item.AddString("id", endpoint.id)
        .AddString("path", endpoint.path)
        .AddString("shape", ToString(endpoint.shape))
        .AddInteger("priority", endpoint.priority)
        .AddString("method", endpoint.method);
    if (!endpoint.form_body.empty()) {
      item.AddString("form_body", endpoint.form_body);
    }
    if (!endpoint.prime_path.empty()) {
      item.AddString("prime_path", endpoint.prime_path);
    }
    if (endpoint.timeout.has_value()) {
      item.AddInteger("timeout_ms", endpoint.timeout->count());
    }
    if (!endpoint.json_keys.empty()) {
      core::JsonObjectBuilder json_keys;
      for (const auto& [metric, payload_key] : endpoint.json_keys) {
        json_keys.AddString(metric, payload_key);
      }
      item.AddRaw("json_keys", json_keys.Build());
    }
    if (!endpoint.array_indices.empty()) {
      core::JsonObjectBuilder indices;
      for (const auto& [metric, position] : endpoint.array_indices) {
        indices.AddUnsigned(metric, position);
      }
      item.AddRaw("array_indices", indices.Build());
    }

    if (!first) {
      endpoints_json += ',';
    }
    first = false;
    endpoints_json += item.Build();
  }
  endpoints_json += ']';

  core::JsonObjectBuilder root;
  root.AddRaw("endpoints", endpoints_json);
  return root.Build();
}

} // namespace modemstat::endpoints

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace modemstat::endpoints {

enum class MetricCategory {
  kStatus,
  kConfiguration,
  kServiceFlow,
  kDiagnostic,
};

// `kText` covers both enum labels and free strings.
enum class ValueKind {
  kText,
  kInteger,
  kRate,
  kBoolean,
};

struct MetricField {
  std::string_view key;
  std::string_view display_name;
  MetricCategory category = MetricCategory::kStatus;
  ValueKind kind = ValueKind::kText;
};

// Stable metric keys. Host integrations bind entities to these strings, so they
// must never be renamed.
namespace keys {
inline constexpr std::string_view kCableModemStatus = "cable_modem_status";
inline constexpr std::string_view kPrimaryDownstreamChannel = "primary_downstream_channel";
inline constexpr std::string_view kDocsisVersion = "docsis_version";
inline constexpr std::string_view kCableModemRegistration = "cable_modem_registration";
inline constexpr std::string_view kWanIpProvisionMode = "wan_ip_provision_mode";
inline constexpr std::string_view kFailSafeMode = "fail_safe_mode";
inline constexpr std::string_view kNoRfDetected = "no_rf_detected";
inline constexpr std::string_view kDocsis30Downstream = "docsis_3_0_downstream";
inline constexpr std::string_view kDocsis30Upstream = "docsis_3_0_upstream";
inline constexpr std::string_view kDocsis31Downstream = "docsis_3_1_downstream";
inline constexpr std::string_view kDocsis31Upstream = "docsis_3_1_upstream";
inline constexpr std::string_view kTotalDownstreamChannels = "total_downstream_channels";
inline constexpr std::string_view kTotalUpstreamChannels = "total_upstream_channels";
inline constexpr std::string_view kLastUpdateTime = "last_update_time";
inline constexpr std::string_view kIspProvider = "isp_provider";
inline constexpr std::string_view kNetworkAccess = "network_access";
inline constexpr std::string_view kMaxCpes = "max_cpes";
inline constexpr std::string_view kBaselinePrivacy = "baseline_privacy";
inline constexpr std::string_view kDocsisMode = "docsis_mode";
inline constexpr std::string_view kConfigFile = "config_file";
inline constexpr std::string_view kPrimaryDownstreamSfid = "primary_downstream_sfid";
inline constexpr std::string_view kPrimaryDownstreamMaxTrafficRate =
    "primary_downstream_max_traffic_rate";
inline constexpr std::string_view kPrimaryDownstreamMaxTrafficBurst =
    "primary_downstream_max_traffic_burst";
inline constexpr std::string_view kPrimaryDownstreamMinTrafficRate =
    "primary_downstream_min_traffic_rate";
inline constexpr std::string_view kPrimaryUpstreamSfid = "primary_upstream_sfid";
inline constexpr std::string_view kPrimaryUpstreamMaxTrafficRate =
    "primary_upstream_max_traffic_rate";
inline constexpr std::string_view kPrimaryUpstreamMaxTrafficBurst =
    "primary_upstream_max_traffic_burst";
inline constexpr std::string_view kPrimaryUpstreamMinTrafficRate =
    "primary_upstream_min_traffic_rate";
inline constexpr std::string_view kPrimaryUpstreamMaxConcatenatedBurst =
    "primary_upstream_max_concatenated_burst";
inline constexpr std::string_view kPrimaryUpstreamSchedulingType =
    "primary_upstream_scheduling_type";
} // namespace keys

// Every metric the engine can expose, in display order.
const std::vector<MetricField>& MetricCatalog();

// Returns nullptr for keys outside the catalog.
const MetricField* FindMetricField(std::string_view key);

bool IsKnownMetricKey(std::string_view key);

// Channel-count keys are derived from row tallies rather than read directly.
bool IsChannelCountKey(std::string_view key);

const char* ToString(MetricCategory category);
const char* ToString(ValueKind kind);

} // namespace modemstat::endpoints

#include "endpoints/metric_catalog.hpp"

namespace modemstat::endpoints {

const std::vector<MetricField>& MetricCatalog() {
  using C = MetricCategory;
  using K = ValueKind;
  static const std::vector<MetricField> kCatalog = {
      {keys::kCableModemStatus, "Cable Modem Status", C::kStatus, K::kText},
      {keys::kPrimaryDownstreamChannel, "Primary Downstream Channel", C::kStatus, K::kBoolean},
      {keys::kDocsisVersion, "DOCSIS Version", C::kConfiguration, K::kText},
      {keys::kCableModemRegistration, "Cable Modem Registration", C::kStatus, K::kText},
      {keys::kWanIpProvisionMode, "WAN IP Provision Mode", C::kConfiguration, K::kText},
      {keys::kFailSafeMode, "Fail Safe Mode", C::kStatus, K::kBoolean},
      {keys::kNoRfDetected, "No RF Detected", C::kStatus, K::kBoolean},
      {keys::kDocsis30Downstream, "DOCSIS 3.0 Downstream Channels", C::kStatus, K::kInteger},
      {keys::kDocsis30Upstream, "DOCSIS 3.0 Upstream Channels", C::kStatus, K::kInteger},
      {keys::kDocsis31Downstream, "DOCSIS 3.1 Downstream Channels", C::kStatus, K::kInteger},
      {keys::kDocsis31Upstream, "DOCSIS 3.1 Upstream Channels", C::kStatus, K::kInteger},
      {keys::kTotalDownstreamChannels, "Total Downstream Channels", C::kStatus, K::kInteger},
      {keys::kTotalUpstreamChannels, "Total Upstream Channels", C::kStatus, K::kInteger},
      {keys::kLastUpdateTime, "Last Update Time", C::kDiagnostic, K::kText},
      {keys::kIspProvider, "ISP Provider", C::kConfiguration, K::kText},
      {keys::kNetworkAccess, "Network Access", C::kStatus, K::kText},
      {keys::kMaxCpes, "Maximum Number of CPEs", C::kConfiguration, K::kInteger},
      {keys::kBaselinePrivacy, "Baseline Privacy", C::kConfiguration, K::kBoolean},
      {keys::kDocsisMode, "DOCSIS Mode", C::kConfiguration, K::kText},
      {keys::kConfigFile, "Config File", C::kConfiguration, K::kText},
      {keys::kPrimaryDownstreamSfid, "Primary Downstream SFID", C::kServiceFlow, K::kInteger},
      {keys::kPrimaryDownstreamMaxTrafficRate, "Primary Downstream Max Traffic Rate",
       C::kServiceFlow, K::kRate},
      {keys::kPrimaryDownstreamMaxTrafficBurst, "Primary Downstream Max Traffic Burst",
       C::kServiceFlow, K::kRate},
      {keys::kPrimaryDownstreamMinTrafficRate, "Primary Downstream Min Traffic Rate",
       C::kServiceFlow, K::kRate},
      {keys::kPrimaryUpstreamSfid, "Primary Upstream SFID", C::kServiceFlow, K::kInteger},
      {keys::kPrimaryUpstreamMaxTrafficRate, "Primary Upstream Max Traffic Rate", C::kServiceFlow,
       K::kRate},
      {keys::kPrimaryUpstreamMaxTrafficBurst, "Primary Upstream Max Traffic Burst",
       C::kServiceFlow, K::kRate},
      {keys::kPrimaryUpstreamMinTrafficRate, "Primary Upstream Min Traffic Rate", C::kServiceFlow,
       K::kRate},
      {keys::kPrimaryUpstreamMaxConcatenatedBurst, "Primary Upstream Max Concatenated Burst",
       C::kServiceFlow, K::kRate},
      {keys::kPrimaryUpstreamSchedulingType, "Primary Upstream Scheduling Type", C::kServiceFlow,
       K::kText},
  };
  return kCatalog;
}

const MetricField* FindMetricField(std::string_view key) {
  for (const MetricField& field : MetricCatalog()) {
    if (field.key == key) {
      return &field;
    }
  }
  return nullptr;
}

bool IsKnownMetricKey(std::string_view key) {
  return FindMetricField(key) != nullptr;
}

bool IsChannelCountKey(std::string_view key) {
  return key == keys::kDocsis30Downstream || key == keys::kDocsis30Upstream ||
         key == keys::kDocsis31Downstream || key == keys::kDocsis31Upstream ||
         key == keys::kTotalDownstreamChannels || key == keys::kTotalUpstreamChannels;
}

const char* ToString(MetricCategory category) {
  switch (category) {
  case MetricCategory::kStatus:
    return "status";
  case MetricCategory::kConfiguration:
    return "configuration";
  case MetricCategory::kServiceFlow:
    return "service-flow";
  case MetricCategory::kDiagnostic:
    return "diagnostic";
  }
  return "status";
}

const char* ToString(ValueKind kind) {
  switch (kind) {
  case ValueKind::kText:
    return "text";
  case ValueKind::kInteger:
    return "integer";
  case ValueKind::kRate:
    return "rate";
  case ValueKind::kBoolean:
    return "boolean";
  }
  return "text";
}

} // namespace modemstat::endpoints

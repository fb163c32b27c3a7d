#include "normalize/lookup_tables.hpp"

#include <array>

namespace modemstat::normalize {

namespace {

constexpr std::array<CodeLabel, 8> kIspProviders = {{
    {6, "Virgin Media (VTR)"},
    {8, "Virgin Media"},
    {20, "Ziggo"},
    {41, "Virgin Media Ireland"},
    {44, "Telekom Austria"},
    {50, "Yallo"},
    {51, "Sunrise"},
    {118, "Virgin Media"},
}};

constexpr std::array<CodeLabel, 7> kRegistrationStates = {{
    {0, "Unregistered"},
    {1, "Other"},
    {2, "Registered"},
    {3, "Not Registered"},
    {4, "Registration Complete"},
    {5, "Access Denied"},
    {6, "Operational"},
}};

constexpr std::array<CodeLabel, 3> kWanIpProvisionModes = {{
    {0, "DHCP"},
    {1, "Static"},
    {2, "PPPoE"},
}};

constexpr std::array<CodeLabel, 5> kDocsisModes = {{
    {1, "DOCSIS 1.0"},
    {2, "DOCSIS 1.1"},
    {3, "DOCSIS 2.0"},
    {4, "DOCSIS 3.0"},
    {5, "DOCSIS 3.1"},
}};

constexpr std::array<CodeLabel, 2> kNetworkAccess = {{
    {0, "Denied"},
    {1, "Allowed"},
}};

constexpr std::array<CodeLabel, 6> kSchedulingTypes = {{
    {1, "Undefined"},
    {2, "Best Effort"},
    {3, "Non-Real-Time Polling Service"},
    {4, "Real-Time Polling Service"},
    {5, "Unsolicited Grant Service with Activity Detection"},
    {6, "Unsolicited Grant Service"},
}};

constexpr LookupTable kIspProviderTable("ISP", kIspProviders, FallbackStyle::kIspId);
constexpr LookupTable kRegistrationTable("Registration", kRegistrationStates,
                                         FallbackStyle::kCategoryId);
constexpr LookupTable kWanIpProvisionModeTable("WAN IP Provision Mode", kWanIpProvisionModes,
                                               FallbackStyle::kCategoryId);
constexpr LookupTable kDocsisModeTable("DOCSIS Mode", kDocsisModes, FallbackStyle::kCategoryId);
constexpr LookupTable kNetworkAccessTable("Network Access", kNetworkAccess,
                                          FallbackStyle::kCategoryId);
constexpr LookupTable kSchedulingTypeTable("Scheduling Type", kSchedulingTypes,
                                           FallbackStyle::kCategoryId);

} // namespace

std::optional<std::string_view> LookupTable::Find(std::int64_t code) const {
  for (const CodeLabel& entry : entries_) {
    if (entry.code == code) {
      return entry.label;
    }
  }
  return std::nullopt;
}

std::string LookupTable::Resolve(std::int64_t code) const {
  if (const auto label = Find(code); label.has_value()) {
    return std::string(*label);
  }
  return FallbackFor(code);
}

std::string LookupTable::FallbackFor(std::int64_t code) const {
  switch (fallback_) {
  case FallbackStyle::kIspId:
    return "Unknown " + std::string(category_) + " ID=" + std::to_string(code);
  case FallbackStyle::kCategoryId:
    break;
  }
  return "Unknown " + std::string(category_) + " (ID: " + std::to_string(code) + ")";
}

const LookupTable& IspProviderTable() {
  return kIspProviderTable;
}

const LookupTable& RegistrationTable() {
  return kRegistrationTable;
}

const LookupTable& WanIpProvisionModeTable() {
  return kWanIpProvisionModeTable;
}

const LookupTable& DocsisModeTable() {
  return kDocsisModeTable;
}

const LookupTable& NetworkAccessTable() {
  return kNetworkAccessTable;
}

const LookupTable& SchedulingTypeTable() {
  return kSchedulingTypeTable;
}

} // namespace modemstat::normalize

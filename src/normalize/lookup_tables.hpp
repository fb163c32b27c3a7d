#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace modemstat::normalize {

struct CodeLabel {
  std::int64_t code = 0;
  std::string_view label;
};

// How an unmatched code is rendered. Both forms carry the original code.
enum class FallbackStyle {
  kIspId,      // "Unknown ISP ID=999"
  kCategoryId, // "Unknown Registration (ID: 9)"
};

// Static, read-only code -> label mapping. Lookups never fail: an unmatched
// code resolves to a deterministic fallback string instead.
class LookupTable {
public:
  constexpr LookupTable(std::string_view category, std::span<const CodeLabel> entries,
                        FallbackStyle fallback)
      : category_(category), entries_(entries), fallback_(fallback) {}

  std::string_view category() const {
    return category_;
  }

  std::optional<std::string_view> Find(std::int64_t code) const;

  // Label for `code`, or the fallback text when the code is unmatched.
  std::string Resolve(std::int64_t code) const;

  std::string FallbackFor(std::int64_t code) const;

private:
  std::string_view category_;
  std::span<const CodeLabel> entries_;
  FallbackStyle fallback_;
};

// Customer/ISP id reported by the modem -> provider branding.
const LookupTable& IspProviderTable();

// js_cm_reg_value -> registration state.
const LookupTable& RegistrationTable();

// js_wan_ip_prov_mode -> WAN addressing mode.
const LookupTable& WanIpProvisionModeTable();

// DOCS-IF-MIB docsIfDocsisBaseCapability values.
const LookupTable& DocsisModeTable();

// Config-file NetworkAccess setting.
const LookupTable& NetworkAccessTable();

// DOCSIS upstream service-flow scheduling types.
const LookupTable& SchedulingTypeTable();

} // namespace modemstat::normalize

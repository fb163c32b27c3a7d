#include "endpoints/metric_catalog.hpp"
#include "normalize/field_normalizer.hpp"
#include "normalize/lookup_tables.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <utility>
#include <vector>

namespace keys = modemstat::endpoints::keys;
using modemstat::endpoints::ValueKind;
using modemstat::normalize::Normalize;
using modemstat::normalize::NormalizedValue;
using modemstat::parsers::ChannelDirection;
using modemstat::parsers::DocsisVersion;
using modemstat::parsers::RawFieldMap;

TEST_CASE("ISP codes resolve to provider branding", "[normalize]") {
  const NormalizedValue known = Normalize(keys::kIspProvider, "118");
  REQUIRE(known.available);
  REQUIRE(known.text == "Virgin Media");
  REQUIRE(known.integer == 118);
  REQUIRE_FALSE(known.unmapped_code);
  REQUIRE(known.raw == "118");

  REQUIRE(Normalize(keys::kIspProvider, " 20 ").text == "Ziggo");

  const NormalizedValue unknown = Normalize(keys::kIspProvider, "999");
  REQUIRE(unknown.available);
  REQUIRE(unknown.text == "Unknown ISP ID=999");
  REQUIRE(unknown.unmapped_code);
}

TEST_CASE("Category fallbacks carry the original code", "[normalize]") {
  REQUIRE(Normalize(keys::kCableModemRegistration, "6").text == "Operational");
  REQUIRE(Normalize(keys::kCableModemRegistration, "9").text == "Unknown Registration (ID: 9)");
  REQUIRE(Normalize(keys::kWanIpProvisionMode, "0").text == "DHCP");
  REQUIRE(Normalize(keys::kDocsisMode, "5").text == "DOCSIS 3.1");
  REQUIRE(Normalize(keys::kNetworkAccess, "1").text == "Allowed");
  REQUIRE(Normalize(keys::kPrimaryUpstreamSchedulingType, "2").text == "Best Effort");

  // Firmware that already sends a label keeps it.
  REQUIRE(Normalize(keys::kDocsisMode, "DOCSIS 3.0").text == "DOCSIS 3.0");

  const auto& table = modemstat::normalize::WanIpProvisionModeTable();
  REQUIRE(table.Resolve(7) == "Unknown WAN IP Provision Mode (ID: 7)");
  REQUIRE_FALSE(table.Find(7).has_value());
}

TEST_CASE("Operational status folds codes into Online and Offline", "[normalize]") {
  REQUIRE(Normalize(keys::kCableModemStatus, "12").text == "Online");
  REQUIRE(Normalize(keys::kCableModemStatus, "3").text == "Online");
  REQUIRE(Normalize(keys::kCableModemStatus, "2").text == "Offline");
  REQUIRE(Normalize(keys::kCableModemStatus, "Operational").text == "Operational");
}

TEST_CASE("Boolean fields map to their own labels", "[normalize]") {
  const NormalizedValue locked = Normalize(keys::kPrimaryDownstreamChannel, "locked");
  REQUIRE(locked.kind == ValueKind::kBoolean);
  REQUIRE(locked.boolean == true);
  REQUIRE(locked.text == "Locked");

  REQUIRE(Normalize(keys::kPrimaryDownstreamChannel, "Not  Locked").text == "Not Locked");
  REQUIRE(Normalize(keys::kFailSafeMode, "0").text == "Inactive");
  REQUIRE(Normalize(keys::kNoRfDetected, "No").text == "No");
  REQUIRE(Normalize(keys::kBaselinePrivacy, "1").text == "Enabled");

  const NormalizedValue odd = Normalize(keys::kFailSafeMode, "7");
  REQUIRE(odd.available);
  REQUIRE_FALSE(odd.boolean.has_value());
  REQUIRE(odd.unmapped_code);
  REQUIRE(odd.text == "Unknown Fail Safe Mode (ID: 7)");
}

TEST_CASE("Rates keep their reported unit", "[normalize]") {
  const NormalizedValue rate = Normalize(keys::kPrimaryDownstreamMaxTrafficRate, "1150000000 bps");
  REQUIRE(rate.kind == ValueKind::kRate);
  REQUIRE(rate.integer == 1150000000);
  REQUIRE(rate.unit == "bps");
  REQUIRE(rate.text == "1150000000 bps");

  const NormalizedValue fractional = Normalize(keys::kPrimaryUpstreamMaxTrafficRate, "1.50 Mbps");
  REQUIRE(fractional.text == "1.50 Mbps");
  REQUIRE_FALSE(fractional.integer.has_value());

  REQUIRE(Normalize(keys::kPrimaryUpstreamMaxTrafficRate, "2.0 Mbps").text == "2 Mbps");
  REQUIRE(Normalize(keys::kPrimaryDownstreamMaxTrafficBurst, "42600").text == "42600");
}

TEST_CASE("Uninterpretable values become explicit unavailable markers", "[normalize]") {
  for (const auto& [key, raw] : std::vector<std::pair<std::string_view, std::string>>{
           {keys::kPrimaryDownstreamMaxTrafficRate, "fast"},
           {keys::kPrimaryDownstreamMaxTrafficRate, "-5 bps"},
           {keys::kMaxCpes, "2.5"},
           {keys::kMaxCpes, "ten"},
           {keys::kDocsis30Downstream, "n/a"},
           {keys::kIspProvider, "   "},
       }) {
    const NormalizedValue value = Normalize(key, raw);
    INFO(std::string(key) << " <- '" << raw << "'");
    REQUIRE_FALSE(value.available);
    REQUIRE(value.text == modemstat::normalize::kUnavailableText);
    REQUIRE(value.raw == raw);
  }
}

TEST_CASE("Keys outside the catalog pass through trimmed", "[normalize]") {
  const NormalizedValue value = Normalize("vendor_extra", "  ARRIS TG3492 ");
  REQUIRE(value.available);
  REQUIRE(value.text == "ARRIS TG3492");
}

TEST_CASE("Normalizing canonical text again is stable", "[normalize]") {
  const std::vector<std::pair<std::string_view, std::string>> samples = {
      {keys::kIspProvider, "118"},
      {keys::kIspProvider, "999"},
      {keys::kCableModemStatus, "12"},
      {keys::kCableModemRegistration, "42"},
      {keys::kPrimaryDownstreamChannel, "1"},
      {keys::kFailSafeMode, "bogus"},
      {keys::kPrimaryDownstreamMaxTrafficRate, "1.0 Mbps"},
      {keys::kMaxCpes, "10"},
      {keys::kConfigFile, " vmdg.cfg "},
  };
  for (const auto& [key, raw] : samples) {
    const std::string once = Normalize(key, raw).text;
    INFO(std::string(key) << " <- '" << raw << "' -> '" << once << "'");
    REQUIRE(Normalize(key, once).text == once);
  }
}

TEST_CASE("Channel rows produce per-version counts and totals", "[normalize]") {
  RawFieldMap raw;
  raw.fields.emplace(std::string(keys::kCableModemStatus), "Operational");
  // Rows win over any directly reported count.
  raw.fields.emplace(std::string(keys::kDocsis30Downstream), "99");
  for (int i = 0; i < 3; ++i) {
    raw.channel_rows.push_back({DocsisVersion::k30, ChannelDirection::kDownstream});
  }
  raw.channel_rows.push_back({DocsisVersion::k31, ChannelDirection::kDownstream});
  raw.channel_rows.push_back({DocsisVersion::k31, ChannelDirection::kUpstream});

  const auto out = modemstat::normalize::NormalizeFieldMap(raw);
  REQUIRE(out.at(std::string(keys::kDocsis30Downstream)).integer == 3);
  REQUIRE(out.at(std::string(keys::kDocsis31Downstream)).integer == 1);
  REQUIRE(out.at(std::string(keys::kDocsis30Upstream)).integer == 0);
  REQUIRE(out.at(std::string(keys::kDocsis31Upstream)).integer == 1);
  REQUIRE(out.at(std::string(keys::kTotalDownstreamChannels)).text == "4");
  REQUIRE(out.at(std::string(keys::kTotalUpstreamChannels)).text == "1");
  REQUIRE(out.at(std::string(keys::kCableModemStatus)).text == "Operational");
}

TEST_CASE("Direct counts total only when both versions are reported", "[normalize]") {
  RawFieldMap raw;
  raw.fields.emplace(std::string(keys::kDocsis30Downstream), "31");
  raw.fields.emplace(std::string(keys::kDocsis31Downstream), "2");
  raw.fields.emplace(std::string(keys::kDocsis30Upstream), "4");

  auto out = modemstat::normalize::NormalizeFieldMap(raw);
  REQUIRE(out.at(std::string(keys::kTotalDownstreamChannels)).integer == 33);
  REQUIRE(out.find(keys::kTotalUpstreamChannels) == out.end());
  REQUIRE(out.at(std::string(keys::kDocsis30Upstream)).integer == 4);

  raw.fields.insert_or_assign(std::string(keys::kDocsis31Downstream), "??");
  out = modemstat::normalize::NormalizeFieldMap(raw);
  REQUIRE_FALSE(out.at(std::string(keys::kDocsis31Downstream)).available);
  REQUIRE_FALSE(out.at(std::string(keys::kTotalDownstreamChannels)).available);
}

TEST_CASE("Implausible direct counts are unavailable and never summed", "[normalize]") {
  RawFieldMap raw;
  raw.fields.emplace(std::string(keys::kDocsis30Downstream), "9223372036854775807");
  raw.fields.emplace(std::string(keys::kDocsis31Downstream), "1");
  raw.fields.emplace(std::string(keys::kDocsis30Upstream), "-4");
  raw.fields.emplace(std::string(keys::kDocsis31Upstream), "2");

  const auto out = modemstat::normalize::NormalizeFieldMap(raw);
  REQUIRE_FALSE(out.at(std::string(keys::kDocsis30Downstream)).available);
  REQUIRE(out.at(std::string(keys::kDocsis30Downstream)).raw == "9223372036854775807");
  REQUIRE(out.at(std::string(keys::kDocsis31Downstream)).integer == 1);
  REQUIRE_FALSE(out.at(std::string(keys::kTotalDownstreamChannels)).available);
  REQUIRE_FALSE(out.at(std::string(keys::kDocsis30Upstream)).available);
  REQUIRE_FALSE(out.at(std::string(keys::kTotalUpstreamChannels)).available);
}

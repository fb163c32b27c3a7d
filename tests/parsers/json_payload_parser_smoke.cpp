#include "../common/assertions.hpp"
#include "../common/modem_fixtures.hpp"
#include "endpoints/metric_catalog.hpp"
#include "endpoints/strategy_table.hpp"
#include "parsers/json_payload_parser.hpp"

#include <string>

namespace {

using modemstat::endpoints::EndpointDescriptor;
using modemstat::parsers::RawFieldMap;
using modemstat::tests::common::AssertContains;
using modemstat::tests::common::AssertTextEquals;
using modemstat::tests::common::Fail;

const EndpointDescriptor& Endpoint(const std::string& id) {
  const EndpointDescriptor* endpoint =
      modemstat::endpoints::DefaultStrategyTable().Find(id);
  if (endpoint == nullptr) {
    Fail("missing built-in endpoint: " + id);
  }
  return *endpoint;
}

RawFieldMap ParseOrFail(const std::string& body, const EndpointDescriptor& endpoint) {
  RawFieldMap map;
  std::string error;
  if (!modemstat::parsers::ParsePayload(body, endpoint, map, error)) {
    Fail("expected payload to parse: " + error);
  }
  return map;
}

void ExpectField(const RawFieldMap& map, std::string_view key, std::string_view expected) {
  const std::string* value = map.Find(key);
  if (value == nullptr) {
    Fail("missing field: " + std::string(key));
  }
  AssertTextEquals(*value, expected, std::string(key));
}

} // namespace

int main() {
  namespace keys = modemstat::endpoints::keys;
  using namespace modemstat::tests::common;

  // Troubleshoot object: mapped keys only, numbers keep literal text.
  {
    const RawFieldMap map = ParseOrFail(TroubleshootJson(), Endpoint("troubleshoot"));
    if (map.fields.size() != 5U) {
      Fail("troubleshoot payload should yield exactly the five mapped fields");
    }
    ExpectField(map, keys::kCableModemStatus, "12");
    ExpectField(map, keys::kCableModemRegistration, "6");
    ExpectField(map, keys::kNoRfDetected, "No");
    if (!map.channel_rows.empty()) {
      Fail("JSON payloads never carry channel rows");
    }
  }

  // Object-form network status.
  {
    const RawFieldMap map = ParseOrFail(NetworkStatusObjectJson("118"), Endpoint("network_status"));
    ExpectField(map, keys::kIspProvider, "118");
    ExpectField(map, keys::kPrimaryDownstreamChannel, "Locked");
    ExpectField(map, keys::kDocsis30Downstream, "31");
    ExpectField(map, keys::kDocsis31Upstream, "1");
    ExpectField(map, keys::kPrimaryDownstreamMaxTrafficRate, "1150000000 bps");
    // Index-based mappings must not read anything from an object payload.
    if (map.fields.size() != 22U) {
      Fail("object payload should fill every object-mapped metric once");
    }
  }

  // Positional array form from older firmware.
  {
    const RawFieldMap map = ParseOrFail(NetworkStatusArrayJson(), Endpoint("network_status"));
    ExpectField(map, keys::kIspProvider, "20");
    ExpectField(map, keys::kPrimaryDownstreamChannel, "Locked");
    ExpectField(map, keys::kDocsis30Upstream, "4");
    ExpectField(map, keys::kDocsis30Downstream, "24");
    ExpectField(map, keys::kDocsis31Upstream, "0");
    ExpectField(map, keys::kConfigFile, "ziggo.cfg");
  }

  // Short array: missing indices leave fields absent.
  {
    const RawFieldMap map = ParseOrFail(R"(["0", "0", "Locked"])", Endpoint("network_status"));
    ExpectField(map, keys::kPrimaryDownstreamChannel, "Locked");
    if (map.Find(keys::kIspProvider) != nullptr || map.fields.size() != 1U) {
      Fail("indices past the end of the array must stay absent");
    }
  }

  // Array of objects merges in order with first occurrence winning.
  {
    const RawFieldMap map = ParseOrFail(
        R"([{"js_cm_oper_value": "2"}, {"js_cm_oper_value": "12", "js_cm_reg_value": 6}])",
        Endpoint("troubleshoot"));
    ExpectField(map, keys::kCableModemStatus, "2");
    ExpectField(map, keys::kCableModemRegistration, "6");
  }

  // Null and nested values count as absent; booleans become text.
  {
    const RawFieldMap map = ParseOrFail(
        R"({"js_cm_oper_value": null, "js_cm_reg_value": {"v": 6}, "js_NoRF_Detected": false})",
        Endpoint("troubleshoot"));
    if (map.Find(keys::kCableModemStatus) != nullptr ||
        map.Find(keys::kCableModemRegistration) != nullptr) {
      Fail("null and nested values must be treated as absent");
    }
    ExpectField(map, keys::kNoRfDetected, "false");
  }

  // Blank body is an empty result, not an error.
  {
    const RawFieldMap map = ParseOrFail(" \r\n", Endpoint("troubleshoot"));
    if (!map.empty()) {
      Fail("blank body should yield an empty map");
    }
  }

  // A login page instead of JSON is a parse error naming the endpoint path.
  {
    RawFieldMap map;
    map.fields.emplace("stale", "value");
    std::string error;
    if (modemstat::parsers::ParsePayload("<html>login</html>", Endpoint("troubleshoot"), map,
                                         error)) {
      Fail("expected HTML body on a JSON endpoint to fail");
    }
    AssertContains(error, "invalid JSON from /php/connection_troubleshoot_data.php");
    if (!map.empty()) {
      Fail("failed parse must not leave stale fields behind");
    }
  }

  // HTML shape dispatches to the status table parser.
  {
    const RawFieldMap map = ParseOrFail(StatusPageHtml(2, 1), Endpoint("status_page"));
    ExpectField(map, keys::kCableModemStatus, "Operational");
    if (map.channel_rows.size() != 3U) {
      Fail("expected three channel rows from the status page");
    }
  }

  return 0;
}

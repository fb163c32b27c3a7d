#include "transport/device_probe.hpp"

#include "transport/device_session.hpp"
#include "transport/error_mapper.hpp"

#include <algorithm>
#include <cctype>

namespace modemstat::transport {

bool LooksLikeModemPage(const std::string& body) {
  std::string lowered = body;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered.find("cable modem") != std::string::npos ||
         lowered.find("docsis") != std::string::npos;
}

ProbeReport ProbeDevice(IDeviceTransport& transport, std::chrono::milliseconds timeout) {
  ProbeReport report;
  DeviceSession session(transport);

  FetchRequest request;
  request.path = "/";
  request.timeout = timeout;
  FetchResult result;
  std::string error;
  if (!session.Fetch(request, result, error)) {
    report.detail = error;
    return report;
  }

  report.http_status = result.http_status;
  if (!result.ok()) {
    report.detail = FormatDeviceError(MapFetchFailure("probe /", result));
    return report;
  }

  report.reachable = true;
  report.body_bytes = result.body.size();
  report.looks_like_modem = LooksLikeModemPage(result.body);
  if (!report.looks_like_modem) {
    report.detail = "landing page does not mention 'cable modem' or 'docsis'";
  }
  return report;
}

} // namespace modemstat::transport

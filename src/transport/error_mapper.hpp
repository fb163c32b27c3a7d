#pragma once

#include "transport/device_transport.hpp"

#include <string>
#include <string_view>

namespace modemstat::transport {

// Stable classification for device-facing failures.
//
// Raw transport strings come from the HTTP library and the modem firmware and
// vary between versions; logs and poll outcomes carry these codes instead.
enum class DeviceErrorCode {
  kConnectFailed,
  kTimeout,
  kHttpStatus,
  kPayloadParse,
  kUnknown,
};

std::string_view ToStableErrorCode(DeviceErrorCode code);

struct DeviceErrorMapping {
  DeviceErrorCode code = DeviceErrorCode::kUnknown;
  std::string actionable_message;
  std::string detail;
};

// Maps raw failure text to a stable code and human-actionable message.
// `operation` is a label like "fetch /" or "parse network_status".
DeviceErrorMapping MapDeviceError(std::string_view operation, std::string_view detail);

// Classification when the transport already knows the failure class.
DeviceErrorMapping MapFetchFailure(std::string_view operation, const FetchResult& result);

// Single-line contract text:
//   "<STABLE_CODE>: <actionable_message> detail: <raw_detail>"
// The detail suffix is omitted when raw detail is empty.
std::string FormatDeviceError(const DeviceErrorMapping& mapped);

} // namespace modemstat::transport

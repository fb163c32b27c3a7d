#include "transport/error_mapper.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <string>

namespace modemstat::transport {

namespace {

std::string ToLowerAscii(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string CollapseWhitespace(std::string_view text) {
  std::string normalized;
  normalized.reserve(text.size());
  bool previous_was_space = false;
  for (const char c : text) {
    if (std::isspace(static_cast<unsigned char>(c)) != 0) {
      previous_was_space = !normalized.empty();
      continue;
    }
    if (previous_was_space) {
      normalized.push_back(' ');
      previous_was_space = false;
    }
    normalized.push_back(c);
  }
  return normalized;
}

bool ContainsAny(std::string_view haystack, std::initializer_list<std::string_view> needles) {
  for (const std::string_view needle : needles) {
    if (!needle.empty() && haystack.find(needle) != std::string_view::npos) {
      return true;
    }
  }
  return false;
}

std::string BuildActionableMessage(const DeviceErrorCode code, std::string_view operation) {
  const std::string operation_label =
      operation.empty() ? "requested operation" : std::string(operation);

  switch (code) {
  case DeviceErrorCode::kConnectFailed:
    return "Could not reach the modem during " + operation_label +
           "; check the host address and that this machine is on the modem's network.";
  case DeviceErrorCode::kTimeout:
    return "Modem did not answer in time during " + operation_label +
           "; the device may be rebooting or overloaded, or the timeout is too short.";
  case DeviceErrorCode::kHttpStatus:
    return "Modem rejected the request during " + operation_label +
           "; this firmware may not serve the endpoint or may expect POST.";
  case DeviceErrorCode::kPayloadParse:
    return "Modem returned an unreadable payload during " + operation_label +
           "; firmware layout may have changed, review the strategy table.";
  case DeviceErrorCode::kUnknown:
    break;
  }
  return "Unexpected device failure during " + operation_label +
         "; rerun with --log-level debug for details.";
}

DeviceErrorCode ClassifyFromNormalizedDetail(const std::string& normalized_detail) {
  if (normalized_detail.empty()) {
    return DeviceErrorCode::kUnknown;
  }
  if (ContainsAny(normalized_detail, {"timeout", "timed out", "deadline", "cancelled"})) {
    return DeviceErrorCode::kTimeout;
  }
  if (ContainsAny(normalized_detail, {"invalid json", "parse error", "unexpected token",
                                      "unexpected end", "nesting too deep"})) {
    return DeviceErrorCode::kPayloadParse;
  }
  if (ContainsAny(normalized_detail, {"http status", "http "})) {
    return DeviceErrorCode::kHttpStatus;
  }
  if (ContainsAny(normalized_detail,
                  {"connection", "connect", "refused", "unreachable", "resolve", "no route",
                   "not open", "read error", "write error"})) {
    return DeviceErrorCode::kConnectFailed;
  }
  return DeviceErrorCode::kUnknown;
}

} // namespace

std::string_view ToStableErrorCode(const DeviceErrorCode code) {
  switch (code) {
  case DeviceErrorCode::kConnectFailed:
    return "DEVICE_CONNECT_FAILED";
  case DeviceErrorCode::kTimeout:
    return "DEVICE_TIMEOUT";
  case DeviceErrorCode::kHttpStatus:
    return "DEVICE_HTTP_STATUS";
  case DeviceErrorCode::kPayloadParse:
    return "PAYLOAD_PARSE_ERROR";
  case DeviceErrorCode::kUnknown:
    break;
  }
  return "DEVICE_UNKNOWN_ERROR";
}

DeviceErrorMapping MapDeviceError(std::string_view operation, std::string_view detail) {
  DeviceErrorMapping mapped;
  mapped.detail = CollapseWhitespace(detail);
  mapped.code = ClassifyFromNormalizedDetail(ToLowerAscii(mapped.detail));
  mapped.actionable_message = BuildActionableMessage(mapped.code, operation);
  return mapped;
}

DeviceErrorMapping MapFetchFailure(std::string_view operation, const FetchResult& result) {
  DeviceErrorMapping mapped;
  mapped.detail = CollapseWhitespace(result.detail);
  switch (result.status) {
  case FetchStatus::kConnectError:
    mapped.code = DeviceErrorCode::kConnectFailed;
    break;
  case FetchStatus::kTimeout:
    mapped.code = DeviceErrorCode::kTimeout;
    break;
  case FetchStatus::kHttpStatusError:
    mapped.code = DeviceErrorCode::kHttpStatus;
    if (mapped.detail.empty()) {
      mapped.detail = "HTTP " + std::to_string(result.http_status);
    }
    break;
  case FetchStatus::kOk:
    mapped.code = DeviceErrorCode::kUnknown;
    break;
  }
  mapped.actionable_message = BuildActionableMessage(mapped.code, operation);
  return mapped;
}

std::string FormatDeviceError(const DeviceErrorMapping& mapped) {
  std::string formatted =
      std::string(ToStableErrorCode(mapped.code)) + ": " + mapped.actionable_message;
  if (!mapped.detail.empty()) {
    formatted += " detail: " + mapped.detail;
  }
  return formatted;
}

} // namespace modemstat::transport

#pragma once

#include <chrono>
#include <string>

namespace modemstat::transport {

inline constexpr std::chrono::milliseconds kDefaultFetchTimeout{5000};
inline constexpr std::chrono::milliseconds kMaxFetchTimeout{60000};

enum class FetchStatus {
  kOk,
  kConnectError,
  kTimeout,
  kHttpStatusError,
};

inline const char* ToString(FetchStatus status) {
  switch (status) {
  case FetchStatus::kOk:
    return "ok";
  case FetchStatus::kConnectError:
    return "connect_error";
  case FetchStatus::kTimeout:
    return "timeout";
  case FetchStatus::kHttpStatusError:
    return "http_status_error";
  }
  return "connect_error";
}

struct FetchRequest {
  std::string method = "GET";
  std::string path = "/";
  // Sent as application/x-www-form-urlencoded when non-empty (POST only).
  std::string form_body;
  std::chrono::milliseconds timeout = kDefaultFetchTimeout;
};

struct FetchResult {
  FetchStatus status = FetchStatus::kConnectError;
  int http_status = 0;
  std::string body;
  // Transport-level description of a failure; empty on success.
  std::string detail;

  bool ok() const {
    return status == FetchStatus::kOk;
  }
};

// Device-facing transport contract used by the poll orchestrator.
//
// Contract goals:
// - keep session lifetime explicit (`Open/Close`) so one connection can be
//   reused across the requests of a poll cycle
// - one `Fetch` is exactly one request: no retries, no redirects to other hosts
// - `Fetch` returns false only for caller misuse (e.g. not opened); device
//   failures are reported through `FetchResult::status`
class IDeviceTransport {
public:
  virtual ~IDeviceTransport() = default;

  // Acquires connection resources for the configured host.
  virtual bool Open(std::string& error) = 0;

  // Releases connection resources. Idempotent.
  virtual void Close() = 0;

  virtual bool IsOpen() const = 0;

  virtual bool Fetch(const FetchRequest& request, FetchResult& result, std::string& error) = 0;
};

} // namespace modemstat::transport

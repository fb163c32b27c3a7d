#pragma once

namespace modemstat::core::errors {

// Process-exit contract for the `modemstat` host command.
//
// 0/1/2 keep their conventional meanings. The poll verdicts get their own
// codes so cron jobs and wrappers can tell a dead modem from a flaky one
// without parsing JSON:
// - 20 nothing could be populated (verdict `unavailable`)
// - 21 some data arrived but at least one endpoint failed (verdict `degraded`)
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigInvalid = 10,
  kDeviceUnavailable = 20,
  kDeviceDegraded = 21,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace modemstat::core::errors

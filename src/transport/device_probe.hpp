#pragma once

#include "transport/device_transport.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace modemstat::transport {

struct ProbeReport {
  bool reachable = false;
  // False for a reachable device whose landing page does not mention the
  // modem; that is a warning, not a failure.
  bool looks_like_modem = false;
  int http_status = 0;
  std::size_t body_bytes = 0;
  std::string detail;
};

// True when a landing page body reads like a cable-modem status page.
bool LooksLikeModemPage(const std::string& body);

// GETs `/` once through a fresh session on `transport`.
ProbeReport ProbeDevice(IDeviceTransport& transport, std::chrono::milliseconds timeout);

} // namespace modemstat::transport

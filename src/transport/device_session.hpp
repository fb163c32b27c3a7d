#pragma once

#include "endpoints/strategy_table.hpp"
#include "transport/device_transport.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <set>
#include <string>

namespace modemstat::transport {

// Scope guard for one poll cycle against one device.
//
// - the transport is opened lazily on the first request and closed when the
//   session goes out of scope, so every early return of a cycle (errors,
//   cancellation, deadline) releases the connection
// - some firmware only serves its data endpoints after the status page has been
//   visited in the same session; `FetchEndpoint` makes that dependency explicit
//   through the descriptor's prime path
// - successful GET bodies are cached per path for the lifetime of the session,
//   so the page fetched for priming is reused by the HTML endpoint
class DeviceSession {
public:
  explicit DeviceSession(IDeviceTransport& transport);
  ~DeviceSession();

  DeviceSession(const DeviceSession&) = delete;
  DeviceSession& operator=(const DeviceSession&) = delete;
  DeviceSession(DeviceSession&&) = delete;
  DeviceSession& operator=(DeviceSession&&) = delete;

  // Issues one request. Device failures land in `result`; false means misuse.
  bool Fetch(const FetchRequest& request, FetchResult& result, std::string& error);

  // Visits `endpoint.prime_path` until one visit succeeds in this session, then
  // fetches the endpoint. A failed priming visit does not fail the endpoint by
  // itself.
  //
  // Each request's timeout is clipped to what is left before `deadline`. When
  // nothing is left the endpoint request is not sent and `result` records a
  // timeout.
  bool FetchEndpoint(const endpoints::EndpointDescriptor& endpoint,
                     std::chrono::milliseconds timeout,
                     std::chrono::steady_clock::time_point deadline, FetchResult& result,
                     std::string& error);

  // Same, without a cycle deadline.
  bool FetchEndpoint(const endpoints::EndpointDescriptor& endpoint,
                     std::chrono::milliseconds timeout, FetchResult& result, std::string& error);

  // Releases the transport. Idempotent.
  void Close();

  bool open() const {
    return open_;
  }

  struct Snapshot {
    bool open = false;
    std::uint64_t open_calls = 0;
    std::uint64_t requests_sent = 0;
    std::uint64_t cache_hits = 0;
  };

  Snapshot DebugSnapshot() const;

private:
  bool EnsureOpen(FetchResult& result);

  IDeviceTransport& transport_;
  bool open_ = false;
  std::map<std::string, std::string> get_cache_;
  std::set<std::string> primed_paths_;
  std::uint64_t open_calls_ = 0;
  std::uint64_t requests_sent_ = 0;
  std::uint64_t cache_hits_ = 0;
};

} // namespace modemstat::transport

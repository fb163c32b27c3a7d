#include "transport/device_session.hpp"

#include <algorithm>

namespace modemstat::transport {

namespace {

std::chrono::milliseconds ClipToDeadline(const std::chrono::milliseconds requested,
                                         const std::chrono::steady_clock::time_point deadline) {
  if (deadline == std::chrono::steady_clock::time_point::max()) {
    return requested;
  }
  const auto now = std::chrono::steady_clock::now();
  if (now >= deadline) {
    return std::chrono::milliseconds::zero();
  }
  return std::min(requested,
                  std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
}

} // namespace

DeviceSession::DeviceSession(IDeviceTransport& transport) : transport_(transport) {}

DeviceSession::~DeviceSession() {
  // Destructors cannot surface errors; Close is best-effort and idempotent.
  Close();
}

bool DeviceSession::EnsureOpen(FetchResult& result) {
  if (open_) {
    return true;
  }
  ++open_calls_;
  std::string open_error;
  if (!transport_.Open(open_error)) {
    result = FetchResult{};
    result.status = FetchStatus::kConnectError;
    result.detail = open_error.empty() ? "transport open failed" : open_error;
    return false;
  }
  open_ = true;
  return true;
}

bool DeviceSession::Fetch(const FetchRequest& request, FetchResult& result, std::string& error) {
  error.clear();
  if (request.path.empty() || request.path.front() != '/') {
    error = "request path must start with '/': '" + request.path + "'";
    return false;
  }

  const bool cacheable = request.method == "GET";
  if (cacheable) {
    const auto cached = get_cache_.find(request.path);
    if (cached != get_cache_.end()) {
      ++cache_hits_;
      result = FetchResult{};
      result.status = FetchStatus::kOk;
      result.http_status = 200;
      result.body = cached->second;
      return true;
    }
  }

  if (!EnsureOpen(result)) {
    return true;
  }

  ++requests_sent_;
  if (!transport_.Fetch(request, result, error)) {
    return false;
  }
  if (cacheable && result.ok()) {
    get_cache_.insert_or_assign(request.path, result.body);
  }
  return true;
}

bool DeviceSession::FetchEndpoint(const endpoints::EndpointDescriptor& endpoint,
                                  const std::chrono::milliseconds timeout,
                                  const std::chrono::steady_clock::time_point deadline,
                                  FetchResult& result, std::string& error) {
  if (!endpoint.prime_path.empty() && primed_paths_.count(endpoint.prime_path) == 0U) {
    const std::chrono::milliseconds prime_timeout = ClipToDeadline(timeout, deadline);
    if (prime_timeout > std::chrono::milliseconds::zero()) {
      FetchRequest prime;
      prime.path = endpoint.prime_path;
      prime.timeout = prime_timeout;
      FetchResult prime_result;
      if (!Fetch(prime, prime_result, error)) {
        return false;
      }
      if (prime_result.ok()) {
        primed_paths_.insert(endpoint.prime_path);
      }
    }
  }

  const std::chrono::milliseconds request_timeout = ClipToDeadline(timeout, deadline);
  if (request_timeout <= std::chrono::milliseconds::zero()) {
    error.clear();
    result = FetchResult{};
    result.status = FetchStatus::kTimeout;
    result.detail = "poll deadline exhausted";
    return true;
  }

  FetchRequest request;
  request.method = endpoint.method;
  request.path = endpoint.path;
  request.form_body = endpoint.form_body;
  request.timeout = request_timeout;
  return Fetch(request, result, error);
}

bool DeviceSession::FetchEndpoint(const endpoints::EndpointDescriptor& endpoint,
                                  const std::chrono::milliseconds timeout, FetchResult& result,
                                  std::string& error) {
  return FetchEndpoint(endpoint, timeout, std::chrono::steady_clock::time_point::max(), result,
                       error);
}

void DeviceSession::Close() {
  if (!open_) {
    return;
  }
  transport_.Close();
  open_ = false;
}

DeviceSession::Snapshot DeviceSession::DebugSnapshot() const {
  return Snapshot{
      .open = open_,
      .open_calls = open_calls_,
      .requests_sent = requests_sent_,
      .cache_hits = cache_hits_,
  };
}

} // namespace modemstat::transport

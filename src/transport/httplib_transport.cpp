#include "transport/httplib_transport.hpp"

#include <httplib.h>

#include <chrono>
#include <ctime>
#include <utility>

namespace modemstat::transport {

namespace {

using Clock = std::chrono::steady_clock;

// Socket errors that arrive within this slack of the deadline are timeouts.
constexpr std::chrono::milliseconds kDeadlineSlack{50};

std::pair<time_t, long> ToTimeoutPair(std::chrono::milliseconds ms) {
  const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(ms);
  const auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(ms - seconds);
  return {static_cast<time_t>(seconds.count()), static_cast<long>(microseconds.count())};
}

bool LooksLikeTimeout(const std::string& error_text, std::chrono::milliseconds elapsed,
                      std::chrono::milliseconds timeout) {
  if (error_text.find("imeout") != std::string::npos) {
    return true;
  }
  return elapsed + kDeadlineSlack >= timeout;
}

} // namespace

HttplibTransport::HttplibTransport(std::string host, std::uint16_t port)
    : host_(std::move(host)), port_(port) {}

HttplibTransport::~HttplibTransport() {
  Close();
}

bool HttplibTransport::Open(std::string& error) {
  error.clear();
  if (client_ != nullptr) {
    return true;
  }
  if (host_.empty()) {
    error = "device host is empty";
    return false;
  }
  client_ = std::make_unique<httplib::Client>(host_, port_);
  client_->set_keep_alive(true);
  client_->set_follow_location(false);
  return true;
}

void HttplibTransport::Close() {
  if (client_ == nullptr) {
    return;
  }
  client_->stop();
  client_.reset();
}

bool HttplibTransport::IsOpen() const {
  return client_ != nullptr;
}

bool HttplibTransport::Fetch(const FetchRequest& request, FetchResult& result,
                             std::string& error) {
  error.clear();
  result = FetchResult{};
  if (client_ == nullptr) {
    error = "transport is not open";
    return false;
  }
  if (request.method != "GET" && request.method != "POST") {
    error = "unsupported HTTP method '" + request.method + "'";
    return false;
  }

  const std::chrono::milliseconds timeout =
      request.timeout > kMaxFetchTimeout ? kMaxFetchTimeout : request.timeout;
  const auto [sec, usec] = ToTimeoutPair(timeout);
  client_->set_connection_timeout(sec, usec);
  client_->set_read_timeout(sec, usec);
  client_->set_write_timeout(sec, usec);
  // The socket timeouts above restart on every successful read or write; this
  // one caps the whole exchange, so a device trickling bytes still times out.
  client_->set_max_timeout(timeout);

  const auto started = Clock::now();
  httplib::Result response = request.method == "POST"
                                 ? client_->Post(request.path, request.form_body,
                                                 "application/x-www-form-urlencoded")
                                 : client_->Get(request.path);
  const auto elapsed =
      std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);

  if (!response) {
    const std::string error_text = httplib::to_string(response.error());
    result.status = LooksLikeTimeout(error_text, elapsed, timeout) ? FetchStatus::kTimeout
                                                                    : FetchStatus::kConnectError;
    result.detail = request.method + " " + request.path + ": " + error_text;
    return true;
  }

  result.http_status = response->status;
  if (response->status < 200 || response->status >= 300) {
    result.status = FetchStatus::kHttpStatusError;
    result.detail = request.method + " " + request.path + ": HTTP status " +
                    std::to_string(response->status);
    return true;
  }

  result.status = FetchStatus::kOk;
  result.body = std::move(response->body);
  return true;
}

} // namespace modemstat::transport

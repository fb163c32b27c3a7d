#include "../common/assertions.hpp"
#include "../common/fake_transport.hpp"
#include "../common/modem_fixtures.hpp"
#include "endpoints/strategy_table.hpp"
#include "transport/device_session.hpp"

#include <chrono>
#include <cstddef>
#include <string>

int main() {
  using modemstat::tests::common::AssertContains;
  using modemstat::tests::common::FakeTransport;
  using modemstat::tests::common::Fail;
  using modemstat::tests::common::kNetworkStatusPath;
  using modemstat::tests::common::kStatusPagePath;
  using modemstat::transport::DeviceSession;
  using modemstat::transport::FetchRequest;
  using modemstat::transport::FetchResult;
  using modemstat::transport::FetchStatus;

  const auto& table = modemstat::endpoints::DefaultStrategyTable();
  const auto* network = table.Find("network_status");
  const auto* page = table.Find("status_page");
  if (network == nullptr || page == nullptr) {
    Fail("expected built-in endpoints");
  }
  constexpr std::chrono::milliseconds kTimeout{1500};

  // Lazy open, priming once, cached status page reused, close on scope exit.
  {
    FakeTransport transport;
    transport.RespondOk(kStatusPagePath, "<html>Cable Modem</html>");
    transport.RespondOk(kNetworkStatusPath, modemstat::tests::common::NetworkStatusObjectJson());
    {
      DeviceSession session(transport);
      if (session.open() || transport.open_calls() != 0) {
        Fail("session must not open before the first request");
      }

      FetchResult result;
      std::string error;
      if (!session.FetchEndpoint(*network, kTimeout, result, error) || !result.ok()) {
        Fail("expected network_status fetch to succeed: " + error);
      }
      if (transport.calls().size() != 2U || transport.calls()[0].path != kStatusPagePath ||
          transport.calls()[1].path != kNetworkStatusPath) {
        Fail("network_status must be preceded by its priming visit");
      }
      if (transport.calls()[1].timeout != kTimeout) {
        Fail("endpoint timeout must reach the transport");
      }

      if (!session.FetchEndpoint(*network, kTimeout, result, error) || !result.ok()) {
        Fail("second network_status fetch failed");
      }
      if (transport.calls().size() != 2U) {
        Fail("priming happens once per session and GET bodies are reused");
      }

      if (!session.FetchEndpoint(*page, kTimeout, result, error) || !result.ok()) {
        Fail("status page fetch failed");
      }
      AssertContains(result.body, "Cable Modem");
      if (transport.CallsTo(kStatusPagePath) != 1U) {
        Fail("status page body must be served from the session cache");
      }

      const auto snapshot = session.DebugSnapshot();
      if (!snapshot.open || snapshot.open_calls != 1U || snapshot.requests_sent != 2U ||
          snapshot.cache_hits != 2U) {
        Fail("unexpected session counters");
      }
    }
    if (transport.IsOpen() || transport.close_calls() != 1) {
      Fail("session scope exit must close the transport exactly once");
    }
  }

  // Failed priming does not fail the endpoint; failed GETs are not cached.
  {
    FakeTransport transport;
    transport.RespondStatus(kStatusPagePath, 500);
    transport.RespondOk(kStatusPagePath, "<html>recovered</html>");
    transport.RespondOk(kNetworkStatusPath, "{}");

    DeviceSession session(transport);
    FetchResult result;
    std::string error;
    if (!session.FetchEndpoint(*network, kTimeout, result, error) || !result.ok()) {
      Fail("endpoint should still be attempted after a failed priming visit");
    }
    if (!session.FetchEndpoint(*page, kTimeout, result, error) || !result.ok()) {
      Fail("status page should be fetched again after a failed attempt");
    }
    AssertContains(result.body, "recovered");
    if (transport.CallsTo(kStatusPagePath) != 2U) {
      Fail("error responses must not be cached");
    }
  }

  // Priming is repeated until it succeeds; a passed deadline sends nothing.
  {
    FakeTransport transport;
    transport.RespondConnectError(kStatusPagePath);
    transport.RespondOk(kStatusPagePath, "<html>Cable Modem</html>");
    transport.RespondOk(kNetworkStatusPath, "{}");

    DeviceSession session(transport);
    FetchResult result;
    std::string error;
    for (int i = 0; i < 3; ++i) {
      if (!session.FetchEndpoint(*network, kTimeout, result, error) || !result.ok()) {
        Fail("network_status fetch failed");
      }
    }
    if (transport.CallsTo(kStatusPagePath) != 2U) {
      Fail("a failed priming visit must be retried on the next fetch, then only once");
    }

    const std::size_t sent = transport.calls().size();
    const auto spent = std::chrono::steady_clock::now() - std::chrono::milliseconds(1);
    if (!session.FetchEndpoint(*network, kTimeout, spent, result, error)) {
      Fail("deadline exhaustion is not misuse: " + error);
    }
    if (result.status != FetchStatus::kTimeout || transport.calls().size() != sent) {
      Fail("no request may be sent after the deadline");
    }
    AssertContains(result.detail, "poll deadline exhausted");

    auto uncached = *network;
    uncached.path = "/php/uncached.php";
    transport.RespondOk(uncached.path, "{}");
    const auto soon = std::chrono::steady_clock::now() + std::chrono::milliseconds(200);
    if (!session.FetchEndpoint(uncached, kTimeout, soon, result, error) ||
        transport.calls().back().path != uncached.path ||
        transport.calls().back().timeout > std::chrono::milliseconds(200)) {
      Fail("request timeout must be clipped to the deadline");
    }
  }

  // POST requests carry their form body and bypass the cache.
  {
    FakeTransport transport;
    transport.RespondOk("/php/data.php", "{}");
    DeviceSession session(transport);

    FetchRequest request;
    request.method = "POST";
    request.path = "/php/data.php";
    request.form_body = "userData=%7B%7D";
    FetchResult result;
    std::string error;
    for (int i = 0; i < 2; ++i) {
      if (!session.Fetch(request, result, error) || !result.ok()) {
        Fail("POST fetch failed");
      }
    }
    if (transport.CallsTo("/php/data.php") != 2U ||
        transport.calls()[0].form_body != "userData=%7B%7D" ||
        transport.calls()[0].method != "POST") {
      Fail("POST requests must go to the device every time with their body");
    }
  }

  // Open failure is a connect error, not misuse; bad paths are misuse.
  {
    FakeTransport transport;
    transport.FailOpen("No route to host");
    DeviceSession session(transport);
    FetchRequest request;
    FetchResult result;
    std::string error;
    if (!session.Fetch(request, result, error)) {
      Fail("open failure should be reported through the result");
    }
    if (result.status != FetchStatus::kConnectError || result.detail != "No route to host") {
      Fail("expected connect error carrying the open failure text");
    }
    if (session.open() || !transport.calls().empty()) {
      Fail("no request may be sent when open fails");
    }

    request.path = "status";
    if (session.Fetch(request, result, error)) {
      Fail("relative path must be rejected");
    }
    AssertContains(error, "must start with '/'");

    session.Close();
    session.Close();
    if (transport.close_calls() != 0) {
      Fail("closing a never-opened session must not touch the transport");
    }
  }

  return 0;
}

#include "../common/assertions.hpp"
#include "../common/fake_transport.hpp"
#include "../common/modem_fixtures.hpp"
#include "transport/device_probe.hpp"

#include <chrono>

int main() {
  using modemstat::tests::common::AssertContains;
  using modemstat::tests::common::FakeTransport;
  using modemstat::tests::common::Fail;
  using modemstat::transport::ProbeDevice;

  constexpr std::chrono::milliseconds kTimeout{2000};

  {
    FakeTransport transport;
    transport.RespondOk("/", modemstat::tests::common::StatusPageHtml(1, 1));
    const auto report = ProbeDevice(transport, kTimeout);
    if (!report.reachable || !report.looks_like_modem || report.http_status != 200 ||
        report.body_bytes == 0U || !report.detail.empty()) {
      Fail("expected a reachable modem status page");
    }
    if (transport.calls().size() != 1U || transport.calls()[0].timeout != kTimeout) {
      Fail("probe sends exactly one request with the given timeout");
    }
    if (transport.IsOpen()) {
      Fail("probe must release the transport");
    }
  }

  {
    FakeTransport transport;
    transport.RespondOk("/", "<html><body>Router login</body></html>");
    const auto report = ProbeDevice(transport, kTimeout);
    if (!report.reachable || report.looks_like_modem) {
      Fail("reachable non-modem page should be flagged but reachable");
    }
    AssertContains(report.detail, "does not mention");
  }

  {
    FakeTransport transport;
    transport.RespondConnectError("/");
    const auto report = ProbeDevice(transport, kTimeout);
    if (report.reachable) {
      Fail("refused connection must not be reachable");
    }
    AssertContains(report.detail, "DEVICE_CONNECT_FAILED");
  }

  {
    FakeTransport transport;
    transport.RespondStatus("/", 401);
    const auto report = ProbeDevice(transport, kTimeout);
    if (report.reachable || report.http_status != 401) {
      Fail("HTTP error status should be reported as unreachable with the status");
    }
    AssertContains(report.detail, "DEVICE_HTTP_STATUS");
  }

  if (!modemstat::transport::LooksLikeModemPage("<title>DOCSIS Status</title>") ||
      modemstat::transport::LooksLikeModemPage("hello")) {
    Fail("unexpected modem page detection");
  }

  return 0;
}

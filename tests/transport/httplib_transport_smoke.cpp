#include "../common/assertions.hpp"
#include "transport/httplib_transport.hpp"

#include <httplib.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <thread>

namespace {

using modemstat::tests::common::AssertContains;
using modemstat::tests::common::Fail;
using modemstat::transport::FetchRequest;
using modemstat::transport::FetchResult;
using modemstat::transport::FetchStatus;
using modemstat::transport::HttplibTransport;

// Loopback web UI. "/trickle" sends one byte every 100 ms for four seconds.
void InstallRoutes(httplib::Server& server) {
  server.Get("/", [](const httplib::Request&, httplib::Response& res) {
    res.set_content("<html>Cable Modem Status</html>", "text/html");
  });
  server.Post("/php/data.php", [](const httplib::Request& req, httplib::Response& res) {
    res.set_content(req.body, "text/plain");
  });
  server.Get("/trickle", [](const httplib::Request&, httplib::Response& res) {
    res.set_chunked_content_provider("text/plain", [](std::size_t offset, httplib::DataSink& sink) {
      if (offset >= 40U) {
        sink.done();
        return true;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
      return sink.write("x", 1);
    });
  });
}

FetchResult FetchOrFail(HttplibTransport& transport, const FetchRequest& request) {
  FetchResult result;
  std::string error;
  if (!transport.Fetch(request, result, error)) {
    Fail("fetch rejected: " + error);
  }
  return result;
}

} // namespace

int main() {
  httplib::Server server;
  InstallRoutes(server);
  const int port = server.bind_to_any_port("127.0.0.1");
  if (port <= 0) {
    Fail("could not bind a loopback port");
  }
  std::thread listener([&server] { server.listen_after_bind(); });
  server.wait_until_ready();

  {
    HttplibTransport transport("127.0.0.1", static_cast<std::uint16_t>(port));
    std::string error;
    if (!transport.Open(error) || !transport.IsOpen()) {
      Fail("expected transport to open: " + error);
    }

    FetchRequest request;
    request.path = "/";
    request.timeout = std::chrono::milliseconds(2000);
    FetchResult result = FetchOrFail(transport, request);
    if (!result.ok() || result.http_status != 200) {
      Fail("expected status page: " + result.detail);
    }
    AssertContains(result.body, "Cable Modem Status");

    request.path = "/missing";
    result = FetchOrFail(transport, request);
    if (result.status != FetchStatus::kHttpStatusError || result.http_status != 404) {
      Fail("non-2xx answers must be HTTP status errors");
    }
    AssertContains(result.detail, "HTTP status 404");

    request.method = "POST";
    request.path = "/php/data.php";
    request.form_body = "userData=%7B%7D";
    result = FetchOrFail(transport, request);
    if (!result.ok() || result.body != "userData=%7B%7D") {
      Fail("POST must deliver its form body");
    }

    // Each byte arrives well inside the socket timeout, but the whole answer
    // takes far longer than the request timeout.
    request = FetchRequest{};
    request.path = "/trickle";
    request.timeout = std::chrono::milliseconds(300);
    const auto started = std::chrono::steady_clock::now();
    result = FetchOrFail(transport, request);
    const auto elapsed = std::chrono::steady_clock::now() - started;
    if (result.status != FetchStatus::kTimeout) {
      Fail("a trickling response must time out, got " +
           std::string(modemstat::transport::ToString(result.status)) + ": " + result.detail);
    }
    if (elapsed > std::chrono::milliseconds(1500)) {
      Fail("request ran far past its timeout");
    }

    request.method = "PUT";
    if (transport.Fetch(request, result, error)) {
      Fail("unsupported methods are misuse");
    }
    AssertContains(error, "unsupported HTTP method");
    transport.Close();
  }

  {
    HttplibTransport transport("127.0.0.1", static_cast<std::uint16_t>(port));
    FetchRequest request;
    FetchResult result;
    std::string error;
    if (transport.Fetch(request, result, error)) {
      Fail("fetch before open must be rejected");
    }
    AssertContains(error, "not open");
  }

  server.stop();
  listener.join();
  return 0;
}

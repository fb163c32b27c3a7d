#pragma once

#include "transport/device_transport.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace httplib {
class Client;
}

namespace modemstat::transport {

// Production transport: plain HTTP to the modem's web UI over one keep-alive
// connection per session.
class HttplibTransport final : public IDeviceTransport {
public:
  HttplibTransport(std::string host, std::uint16_t port);
  ~HttplibTransport() override;

  HttplibTransport(const HttplibTransport&) = delete;
  HttplibTransport& operator=(const HttplibTransport&) = delete;

  bool Open(std::string& error) override;
  void Close() override;
  bool IsOpen() const override;
  bool Fetch(const FetchRequest& request, FetchResult& result, std::string& error) override;

private:
  std::string host_;
  std::uint16_t port_ = 80;
  std::unique_ptr<httplib::Client> client_;
};

} // namespace modemstat::transport

#pragma once

#include <asio.hpp>
#include <cstdint>

#include "relay/core/config.hpp"
#include "relay/core/types.hpp"

namespace relay::proxy {
class ProxyService;
}

namespace relay::server {

// HTTP/1.1 listener. Every accepted connection runs on its own strand.
class HttpServer {
 public:
  HttpServer(asio::io_context& io_ctx, const Config& config, proxy::ProxyService& service);

  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Bind listen_host:listen_port and start accepting. Returns the bound port.
  Result<uint16_t> start();

  // Stop accepting; connections in flight finish on their own
  void stop();

  uint16_t port() const {
    return port_;
  }

 private:
  void do_accept();

  asio::io_context& io_ctx_;
  const Config& config_;
  proxy::ProxyService& service_;
  asio::ip::tcp::acceptor acceptor_;
  uint16_t port_ = 0;
};

}  // namespace relay::server

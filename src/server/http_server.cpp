#include "relay/server/http_server.hpp"

#include <spdlog/spdlog.h>

#include "server/client_session.hpp"

namespace relay::server {

HttpServer::HttpServer(asio::io_context& io_ctx, const Config& config, proxy::ProxyService& service)
    : io_ctx_(io_ctx), config_(config), service_(service), acceptor_(io_ctx) {}

HttpServer::~HttpServer() {
  stop();
}

Result<uint16_t> HttpServer::start() {
  asio::error_code ec;
  auto address = asio::ip::make_address(config_.listen_host, ec);
  if (ec) {
    return Result<uint16_t>::failure("Invalid listen address '" + config_.listen_host + "': " + ec.message());
  }

  asio::ip::tcp::endpoint endpoint(address, static_cast<uint16_t>(config_.listen_port));
  std::string where = config_.listen_host + ":" + std::to_string(config_.listen_port);

  acceptor_.open(endpoint.protocol(), ec);
  if (!ec) acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true), ec);
  if (!ec) acceptor_.bind(endpoint, ec);
  if (!ec) acceptor_.listen(asio::socket_base::max_listen_connections, ec);
  if (ec) {
    asio::error_code ignored;
    acceptor_.close(ignored);
    return Result<uint16_t>::failure("Cannot listen on " + where + ": " + ec.message());
  }

  port_ = acceptor_.local_endpoint(ec).port();
  spdlog::debug("Listening on {}:{}", config_.listen_host, port_);

  do_accept();
  return Result<uint16_t>::success(port_);
}

void HttpServer::stop() {
  if (!acceptor_.is_open()) {
    return;
  }
  asio::error_code ignored;
  acceptor_.close(ignored);
}

void HttpServer::do_accept() {
  acceptor_.async_accept(asio::make_strand(io_ctx_), [this](const std::error_code& ec, asio::ip::tcp::socket socket) {
    if (ec == asio::error::operation_aborted || !acceptor_.is_open()) {
      return;
    }

    if (ec) {
      spdlog::warn("Accept failed: {}", ec.message());
    } else {
      std::make_shared<ClientSession>(std::move(socket), config_, service_)->start();
    }

    do_accept();
  });
}

}  // namespace relay::server

#include "net/upstream_connection.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include "relay/net/http_client.hpp"

namespace relay::net {

UpstreamConnection::UpstreamConnection(const asio::any_io_executor& executor, std::shared_ptr<ConnectionLedger> ledger)
    : socket_(executor), deadline_(executor), ledger_(std::move(ledger)) {
  ledger_->opened.fetch_add(1);
}

UpstreamConnection::~UpstreamConnection() {
  close();
}

void UpstreamConnection::start_tls(asio::ssl::context& ssl_ctx, const std::string& host, bool verify,
                                   std::function<void(const std::error_code&)> handler) {
  tls_ = std::make_unique<asio::ssl::stream<asio::ip::tcp::socket&>>(socket_, ssl_ctx);

  // Set SNI hostname
  if (!SSL_set_tlsext_host_name(tls_->native_handle(), host.c_str())) {
    std::error_code ec(static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category());
    asio::post(executor(), [handler = std::move(handler), ec]() {
      handler(ec);
    });
    return;
  }

  if (verify) {
    tls_->set_verify_mode(asio::ssl::verify_peer);
    tls_->set_verify_callback(asio::ssl::host_name_verification(host));
  } else {
    tls_->set_verify_mode(asio::ssl::verify_none);
  }

  tls_->async_handshake(asio::ssl::stream_base::client, [self = shared_from_this(), handler = std::move(handler)](const std::error_code& ec) {
    handler(ec);
  });
}

void UpstreamConnection::async_read_some(asio::mutable_buffer buffer, IoHandler handler) {
  auto self = shared_from_this();
  auto done = [self, handler = std::move(handler)](const std::error_code& ec, size_t n) {
    handler(ec, n);
  };
  if (tls_) {
    tls_->async_read_some(buffer, std::move(done));
  } else {
    socket_.async_read_some(buffer, std::move(done));
  }
}

void UpstreamConnection::async_read_until(asio::streambuf& buffer, const std::string& delim, IoHandler handler) {
  auto self = shared_from_this();
  auto done = [self, handler = std::move(handler)](const std::error_code& ec, size_t n) {
    handler(ec, n);
  };
  if (tls_) {
    asio::async_read_until(*tls_, buffer, delim, std::move(done));
  } else {
    asio::async_read_until(socket_, buffer, delim, std::move(done));
  }
}

void UpstreamConnection::async_write(asio::const_buffer buffer, IoHandler handler) {
  auto self = shared_from_this();
  auto done = [self, handler = std::move(handler)](const std::error_code& ec, size_t n) {
    handler(ec, n);
  };
  if (tls_) {
    asio::async_write(*tls_, buffer, std::move(done));
  } else {
    asio::async_write(socket_, buffer, std::move(done));
  }
}

void UpstreamConnection::arm_deadline(std::chrono::seconds timeout) {
  if (timeout.count() <= 0) {
    return;
  }
  deadline_.expires_after(timeout);
  deadline_.async_wait([weak = weak_from_this()](const std::error_code& ec) {
    if (ec) return;  // cancelled
    if (auto self = weak.lock()) {
      spdlog::warn("Upstream exchange exceeded its time ceiling, closing connection");
      self->timed_out_ = true;
      self->close();
    }
  });
}

void UpstreamConnection::close() {
  if (closed_) {
    return;
  }
  closed_ = true;

  asio::error_code ignored;
  deadline_.cancel();
  socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
  socket_.close(ignored);

  ledger_->closed.fetch_add(1);
}

}  // namespace relay::net

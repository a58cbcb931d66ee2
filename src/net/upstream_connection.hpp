#pragma once

#include <asio.hpp>
#include <asio/ssl.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace relay::net {

struct ConnectionLedger;

using IoHandler = std::function<void(const std::error_code& ec, size_t bytes)>;

// One outbound TCP connection, optionally wrapped in TLS.
// Owned through a shared_ptr by exactly one party at a time: the exchange
// that dials it, then the response that reads from it. close() is
// idempotent and the destructor closes a connection that is still open,
// so the ledger sees exactly one close per connection.
class UpstreamConnection : public std::enable_shared_from_this<UpstreamConnection> {
 public:
  UpstreamConnection(const asio::any_io_executor& executor, std::shared_ptr<ConnectionLedger> ledger);

  ~UpstreamConnection();

  UpstreamConnection(const UpstreamConnection&) = delete;
  UpstreamConnection& operator=(const UpstreamConnection&) = delete;

  asio::ip::tcp::socket& socket() {
    return socket_;
  }

  asio::any_io_executor executor() {
    return socket_.get_executor();
  }

  // TLS client handshake over the connected socket (SNI + optional peer verification)
  void start_tls(asio::ssl::context& ssl_ctx, const std::string& host, bool verify, std::function<void(const std::error_code&)> handler);

  void async_read_some(asio::mutable_buffer buffer, IoHandler handler);

  void async_read_until(asio::streambuf& buffer, const std::string& delim, IoHandler handler);

  void async_write(asio::const_buffer buffer, IoHandler handler);

  // Close the connection when timeout elapses. 0 disables the ceiling.
  void arm_deadline(std::chrono::seconds timeout);

  bool timed_out() const {
    return timed_out_;
  }

  bool is_open() const {
    return !closed_;
  }

  void close();

 private:
  asio::ip::tcp::socket socket_;
  std::unique_ptr<asio::ssl::stream<asio::ip::tcp::socket&>> tls_;
  asio::steady_timer deadline_;
  std::shared_ptr<ConnectionLedger> ledger_;
  bool closed_ = false;
  bool timed_out_ = false;
};

}  // namespace relay::net

#pragma once

#include <asio.hpp>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "net/chunked_decoder.hpp"
#include "net/http_parser.hpp"
#include "relay/core/config.hpp"
#include "relay/net/http_message.hpp"
#include "relay/net/stream.hpp"

namespace relay::proxy {
class ProxyService;
}

namespace relay::server {

// One caller connection: reads requests, hands them to the proxy service and
// writes the replies. Complete replies keep the connection alive, streamed
// replies end it.
class ClientSession : public std::enable_shared_from_this<ClientSession> {
 public:
  ClientSession(asio::ip::tcp::socket socket, const Config& config, proxy::ProxyService& service);

  ~ClientSession();

  ClientSession(const ClientSession&) = delete;
  ClientSession& operator=(const ClientSession&) = delete;

  void start();

 private:
  class Channel;
  class StreamSink;

  void read_request();

  void on_head(const std::error_code& ec, size_t n);

  void read_length_body();

  void read_chunked_body();

  void read_more(std::function<void()> next);

  void dispatch();

  void respond(int status, HeaderMap headers, std::string body);

  std::shared_ptr<net::ChunkSink> open_stream(int status, const std::string& content_type);

  // Local error reply; the connection is closed after it
  void reject(int status, const std::string& text);

  // Pending read on the socket while streaming; EOF means the caller left
  void watch_disconnect();

  void write(std::string bytes, net::WriteHandler handler);

  void do_write();

  void close();

  asio::ip::tcp::socket socket_;
  const Config& config_;
  proxy::ProxyService& service_;
  std::string peer_;

  asio::streambuf head_buf_{net::kMaxHeadBytes};
  std::string pending_;  // bytes received past what has been parsed
  std::vector<char> read_buf_;

  net::InboundRequest request_;
  net::BodyFraming body_framing_ = net::BodyFraming::None;
  uint64_t body_remaining_ = 0;
  net::ChunkedDecoder decoder_;

  // Per-request reply state
  bool keep_alive_ = true;
  bool head_only_ = false;
  bool chunked_reply_ = true;
  bool streaming_ = false;
  bool stream_finished_ = false;
  std::function<void()> disconnect_cb_;

  std::deque<std::pair<std::string, net::WriteHandler>> outbox_;
  bool writing_ = false;
  bool closed_ = false;
};

}  // namespace relay::server

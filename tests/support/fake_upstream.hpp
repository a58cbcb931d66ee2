#pragma once

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "net/http_parser.hpp"
#include "relay/net/http_message.hpp"

namespace relay::testing {

// Request as seen on the wire by a fake server
struct RecordedRequest {
  std::string head;  // request line and header block, verbatim
  net::InboundRequest request;
};

// Blocking loopback HTTP server on its own thread. Connections are served one
// after another; the script writes the response and may keep the socket open.
class FakeUpstream {
 public:
  using Script = std::function<void(asio::ip::tcp::socket&, const RecordedRequest&)>;

  // raw: hand the socket to the script without reading a request first
  explicit FakeUpstream(Script script, bool raw = false)
      : script_(std::move(script)), raw_(raw), acceptor_(io_ctx_, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)) {
    port_ = acceptor_.local_endpoint().port();
    thread_ = std::thread([this]() {
      serve();
    });
  }

  ~FakeUpstream() {
    stop();
  }

  FakeUpstream(const FakeUpstream&) = delete;
  FakeUpstream& operator=(const FakeUpstream&) = delete;

  uint16_t port() const {
    return port_;
  }

  std::string url(const std::string& path = "") const {
    return "http://127.0.0.1:" + std::to_string(port_) + path;
  }

  std::vector<RecordedRequest> requests() {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }

  size_t connections() const {
    return connections_.load();
  }

  void stop() {
    if (stopping_.exchange(true)) {
      return;
    }
    // Wake the blocking accept
    asio::io_context io;
    asio::ip::tcp::socket wake(io);
    asio::error_code ignored;
    wake.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port_), ignored);
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  // Fixed response with Content-Length
  static Script respond(int status, const std::string& body, const std::string& extra_headers = "") {
    return [status, body, extra_headers](asio::ip::tcp::socket& socket, const RecordedRequest&) {
      std::string out = "HTTP/1.1 " + std::to_string(status) + " " + net::status_reason(status) + "\r\n" + extra_headers +
                        "Content-Length: " + std::to_string(body.size()) + "\r\nConnection: close\r\n\r\n" + body;
      asio::error_code ignored;
      asio::write(socket, asio::buffer(out), ignored);
    };
  }

  // Chunked event stream, one HTTP chunk per event, with a pause between them
  static Script stream(const std::vector<std::string>& events, std::chrono::milliseconds gap = std::chrono::milliseconds(5)) {
    return [events, gap](asio::ip::tcp::socket& socket, const RecordedRequest&) {
      asio::error_code ec;
      std::string head = "HTTP/1.1 200 OK\r\nContent-Type: text/event-stream\r\nTransfer-Encoding: chunked\r\n\r\n";
      asio::write(socket, asio::buffer(head), ec);
      for (const auto& event : events) {
        if (ec) return;
        std::this_thread::sleep_for(gap);
        std::ostringstream chunk;
        chunk << std::hex << event.size() << "\r\n" << event << "\r\n";
        asio::write(socket, asio::buffer(chunk.str()), ec);
      }
      if (!ec) asio::write(socket, asio::buffer(std::string("0\r\n\r\n")), ec);
    };
  }

  // Blocks until the peer closes the connection
  static void wait_for_close(asio::ip::tcp::socket& socket) {
    char buf[256];
    asio::error_code ec;
    while (!ec) {
      socket.read_some(asio::buffer(buf), ec);
    }
  }

 private:
  void serve() {
    while (!stopping_) {
      asio::ip::tcp::socket socket(io_ctx_);
      asio::error_code ec;
      acceptor_.accept(socket, ec);
      if (ec || stopping_) {
        return;
      }
      connections_++;

      RecordedRequest recorded;
      if (!raw_ && !read_request(socket, recorded)) {
        continue;
      }
      {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(recorded);
      }
      script_(socket, recorded);

      asio::error_code ignored;
      socket.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
      socket.close(ignored);
    }
  }

  static bool read_request(asio::ip::tcp::socket& socket, RecordedRequest& out) {
    asio::streambuf buf;
    asio::error_code ec;
    auto n = asio::read_until(socket, buf, "\r\n\r\n", ec);
    if (ec) {
      return false;
    }

    std::string data(asio::buffers_begin(buf.data()), asio::buffers_end(buf.data()));
    out.head = data.substr(0, n);
    if (net::parse_request_head(out.head, out.request)) {
      return false;
    }

    net::BodyFraming framing;
    uint64_t length = 0;
    if (net::request_body_framing(out.request.headers, framing, length)) {
      return false;
    }
    // CONNECT carries no body
    std::string body = data.substr(n);
    if (framing == net::BodyFraming::Length && body.size() < length) {
      std::string rest(length - body.size(), '\0');
      asio::read(socket, asio::buffer(rest), ec);
      if (ec) return false;
      body += rest;
    }
    out.request.body = body;
    return true;
  }

  Script script_;
  bool raw_;
  asio::io_context io_ctx_;
  asio::ip::tcp::acceptor acceptor_;
  uint16_t port_ = 0;
  std::thread thread_;
  std::atomic<bool> stopping_{false};
  std::atomic<size_t> connections_{0};
  std::mutex mutex_;
  std::vector<RecordedRequest> requests_;
};

// Port nothing listens on
inline uint16_t closed_port() {
  asio::io_context io;
  asio::ip::tcp::acceptor acceptor(io, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
  auto port = acceptor.local_endpoint().port();
  acceptor.close();
  return port;
}

}  // namespace relay::testing

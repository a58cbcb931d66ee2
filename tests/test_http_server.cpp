#include <gtest/gtest.h>

#include <asio.hpp>
#include <chrono>
#include <sstream>
#include <thread>

#include "relay/proxy/proxy_service.hpp"
#include "relay/server/http_server.hpp"
#include "support/fake_upstream.hpp"

using namespace relay;
using relay::testing::FakeUpstream;
using relay::testing::RecordedRequest;

namespace {

struct WireResponse {
  std::string head;
  std::string body;
};

// Reads one Content-Length response from a kept-alive connection
WireResponse read_response(asio::ip::tcp::socket& socket, asio::streambuf& buf) {
  WireResponse out;
  asio::error_code ec;
  auto n = asio::read_until(socket, buf, "\r\n\r\n", ec);
  if (ec) return out;

  std::string data(asio::buffers_begin(buf.data()), asio::buffers_end(buf.data()));
  out.head = data.substr(0, n);
  buf.consume(n);

  size_t length = 0;
  auto pos = out.head.find("Content-Length: ");
  if (pos != std::string::npos) {
    length = std::stoul(out.head.substr(pos + 16));
  }
  if (buf.size() < length) {
    asio::read(socket, buf, asio::transfer_exactly(length - buf.size()), ec);
  }
  std::string rest(asio::buffers_begin(buf.data()), asio::buffers_end(buf.data()));
  out.body = rest.substr(0, length);
  buf.consume(length);
  return out;
}

// Everything the server sends until it closes the connection
std::string read_all(asio::ip::tcp::socket& socket) {
  std::string all;
  char tmp[1024];
  asio::error_code ec;
  while (!ec) {
    auto n = socket.read_some(asio::buffer(tmp), ec);
    all.append(tmp, n);
  }
  return all;
}

std::string framed(const std::string& chunk) {
  std::ostringstream out;
  out << std::hex << chunk.size() << "\r\n" << chunk << "\r\n";
  return out.str();
}

}  // namespace

class HttpServerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    config_.listen_host = "127.0.0.1";
    config_.listen_port = 0;
  }

  void TearDown() override {
    if (server_) server_->stop();
    io_ctx_.stop();
    if (thread_.joinable()) thread_.join();
  }

  void start(const FakeUpstream& upstream) {
    config_.openai_base_url = upstream.url("/v1");
    config_.anthropic_base_url = upstream.url("/anthropic");
    server_ = std::make_unique<server::HttpServer>(io_ctx_, config_, service_);
    auto started = server_->start();
    ASSERT_TRUE(started.ok()) << *started.error;
    thread_ = std::thread([this]() {
      io_ctx_.run();
    });
  }

  asio::ip::tcp::socket connect() {
    asio::ip::tcp::socket socket(client_ctx_);
    socket.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), server_->port()));
    return socket;
  }

  template <typename Pred>
  bool wait_until(Pred pred) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!pred() && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
  }

  asio::io_context io_ctx_;
  asio::executor_work_guard<asio::io_context::executor_type> work_{io_ctx_.get_executor()};
  asio::io_context client_ctx_;
  Config config_;
  net::Dispatcher dispatcher_{net::DispatcherOptions{}};
  proxy::ProxyService service_{config_, dispatcher_};
  std::unique_ptr<server::HttpServer> server_;
  std::thread thread_;
};

TEST_F(HttpServerTest, BufferedRepliesKeepConnectionAlive) {
  FakeUpstream upstream(FakeUpstream::respond(200, R"({"data":[]})", "Content-Type: application/json\r\n"));
  start(upstream);

  auto socket = connect();
  asio::streambuf buf;
  std::string request = "GET /v1/models HTTP/1.1\r\nHost: localhost\r\n\r\n";

  for (int i = 0; i < 2; ++i) {
    asio::write(socket, asio::buffer(request));
    auto response = read_response(socket, buf);
    EXPECT_EQ(response.head.rfind("HTTP/1.1 200 OK\r\n", 0), 0u) << response.head;
    EXPECT_NE(response.head.find("Connection: keep-alive\r\n"), std::string::npos);
    EXPECT_NE(response.head.find("Content-Type: application/json\r\n"), std::string::npos);
    EXPECT_EQ(response.body, R"({"data":[]})");
  }

  EXPECT_EQ(upstream.connections(), 2u);
  EXPECT_EQ(upstream.requests().at(1).request.path, "/v1/models");
}

TEST_F(HttpServerTest, StreamedReplyKeepsChunkBoundaries) {
  std::vector<std::string> events = {"data: {\"id\":1}\n\n", "data: {\"id\":2}\n\n", "data: [DONE]\n\n"};
  FakeUpstream upstream(FakeUpstream::stream(events));
  start(upstream);

  auto socket = connect();
  std::string body = R"({"model":"gpt-4o","stream":true})";
  std::string request = "POST /v1/chat/completions HTTP/1.1\r\nHost: localhost\r\nContent-Type: application/json\r\nContent-Length: " +
                        std::to_string(body.size()) + "\r\n\r\n" + body;
  asio::write(socket, asio::buffer(request));

  auto all = read_all(socket);
  auto split = all.find("\r\n\r\n");
  ASSERT_NE(split, std::string::npos);
  std::string head = all.substr(0, split + 4);
  EXPECT_EQ(head.rfind("HTTP/1.1 200 OK\r\n", 0), 0u);
  EXPECT_NE(head.find("Content-Type: text/event-stream\r\n"), std::string::npos);
  EXPECT_NE(head.find("Transfer-Encoding: chunked\r\n"), std::string::npos);
  EXPECT_NE(head.find("Connection: close\r\n"), std::string::npos);

  EXPECT_EQ(all.substr(split + 4), framed(events[0]) + framed(events[1]) + framed(events[2]) + "0\r\n\r\n");

  EXPECT_TRUE(wait_until([&]() {
    return dispatcher_.ledger().closed.load() == 1;
  }));
  EXPECT_EQ(dispatcher_.ledger().opened.load(), 1u);
}

TEST_F(HttpServerTest, MalformedRequestIs400) {
  FakeUpstream upstream(FakeUpstream::respond(200, "{}"));
  start(upstream);

  auto socket = connect();
  asio::write(socket, asio::buffer(std::string("NOT-HTTP\r\n\r\n")));

  auto all = read_all(socket);
  EXPECT_EQ(all.rfind("HTTP/1.1 400 Bad Request\r\n", 0), 0u) << all;
  EXPECT_NE(all.find("\r\n\r\nBad Request: "), std::string::npos);
  EXPECT_EQ(upstream.connections(), 0u);
}

TEST_F(HttpServerTest, OversizedBodyIs413) {
  FakeUpstream upstream(FakeUpstream::respond(200, "{}"));
  config_.max_body_bytes = 16;
  start(upstream);

  auto socket = connect();
  std::string request = "POST /v1/messages HTTP/1.1\r\nHost: localhost\r\nContent-Length: 100\r\n\r\n";
  asio::write(socket, asio::buffer(request));

  auto all = read_all(socket);
  EXPECT_EQ(all.rfind("HTTP/1.1 413 ", 0), 0u) << all;
  EXPECT_NE(all.find("Payload Too Large"), std::string::npos);
  EXPECT_EQ(dispatcher_.ledger().opened.load(), 0u);
}

TEST_F(HttpServerTest, UnsupportedMethodIs405) {
  FakeUpstream upstream(FakeUpstream::respond(200, "{}"));
  start(upstream);

  auto socket = connect();
  asio::streambuf buf;
  asio::write(socket, asio::buffer(std::string("TRACE /v1/models HTTP/1.1\r\nHost: localhost\r\n\r\n")));

  auto response = read_response(socket, buf);
  EXPECT_EQ(response.head.rfind("HTTP/1.1 405 ", 0), 0u) << response.head;
  EXPECT_NE(response.head.find("allow: GET, POST"), std::string::npos);
  EXPECT_EQ(response.body, "Method Not Allowed");
}

TEST_F(HttpServerTest, ChunkedRequestBodyIsForwarded) {
  FakeUpstream upstream(FakeUpstream::respond(200, "{}"));
  start(upstream);

  auto socket = connect();
  std::string request = "POST /v1/messages HTTP/1.1\r\nHost: localhost\r\nTransfer-Encoding: chunked\r\n\r\n" +
                        framed("{\"model\":\"claude") + framed("-sonnet-4-20250514\"}") + "0\r\n\r\n";
  asio::write(socket, asio::buffer(request));

  asio::streambuf buf;
  auto response = read_response(socket, buf);
  EXPECT_EQ(response.head.rfind("HTTP/1.1 200 OK\r\n", 0), 0u) << response.head;

  auto requests = upstream.requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(json::parse(requests[0].request.body)["model"], "anthropic/claude-sonnet-4");
}

TEST_F(HttpServerTest, CallerDisconnectClosesUpstream) {
  std::atomic<bool> upstream_released{false};
  FakeUpstream upstream([&](asio::ip::tcp::socket& socket, const RecordedRequest&) {
    std::string out =
        "HTTP/1.1 200 OK\r\nContent-Type: text/event-stream\r\nTransfer-Encoding: chunked\r\n\r\n" + framed("data: first\n\n");
    asio::error_code ec;
    asio::write(socket, asio::buffer(out), ec);
    FakeUpstream::wait_for_close(socket);
    upstream_released = true;
  });
  start(upstream);

  auto socket = connect();
  std::string body = R"({"model":"gpt-4o","stream":true})";
  std::string request = "POST /chat/completions HTTP/1.1\r\nHost: localhost\r\nContent-Length: " + std::to_string(body.size()) +
                        "\r\n\r\n" + body;
  asio::write(socket, asio::buffer(request));

  asio::streambuf buf;
  asio::read_until(socket, buf, "data: first\n\n");
  EXPECT_EQ(dispatcher_.ledger().active(), 1u);

  // 客户端中途断开
  asio::error_code ignored;
  socket.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
  socket.close(ignored);

  EXPECT_TRUE(wait_until([&]() {
    return upstream_released.load();
  }));
  EXPECT_TRUE(wait_until([&]() {
    return dispatcher_.ledger().closed.load() == 1;
  }));
  EXPECT_EQ(dispatcher_.ledger().opened.load(), 1u);
}

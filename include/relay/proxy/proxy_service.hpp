#pragma once

#include <asio.hpp>
#include <functional>
#include <memory>
#include <string>

#include "relay/core/config.hpp"
#include "relay/core/headers.hpp"
#include "relay/net/http_client.hpp"
#include "relay/net/http_message.hpp"
#include "relay/net/stream.hpp"

namespace relay::proxy {

// Caller side of one request, implemented by the front-end server
class ResponseChannel {
 public:
  virtual ~ResponseChannel() = default;

  // Complete response. Content-Length is added by the channel.
  virtual void respond(int status, HeaderMap headers, std::string body) = 0;

  // Start a streamed response; each chunk written to the sink reaches the caller as one unit
  virtual std::shared_ptr<net::ChunkSink> open_stream(int status, const std::string& content_type) = 0;

  // Invoked at most once, when the caller goes away while a stream is open
  virtual void on_disconnect(std::function<void()> callback) = 0;
};

// Routes inbound requests through the sanitize/transform/dispatch/relay pipeline
class ProxyService {
 public:
  ProxyService(const Config& config, net::Dispatcher& dispatcher);

  // Runs on the caller's executor; every reply goes through channel
  void handle(net::InboundRequest request, std::shared_ptr<ResponseChannel> channel, const asio::any_io_executor& executor);

  const Config& config() const {
    return config_;
  }

 private:
  void handle_chat(net::InboundRequest request, const std::string& url, std::shared_ptr<ResponseChannel> channel,
                   const asio::any_io_executor& executor);

  void handle_messages(net::InboundRequest request, const std::string& url, std::shared_ptr<ResponseChannel> channel,
                       const asio::any_io_executor& executor);

  void handle_pass_through(net::InboundRequest request, const std::string& url, const std::string& log_path,
                           std::shared_ptr<ResponseChannel> channel, const asio::any_io_executor& executor);

  void relay(std::shared_ptr<net::StreamingResponse> response, std::shared_ptr<ResponseChannel> channel, const std::string& label);

  const Config& config_;
  net::Dispatcher& dispatcher_;
};

}  // namespace relay::proxy

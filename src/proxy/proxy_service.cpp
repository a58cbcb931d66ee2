#include "relay/proxy/proxy_service.hpp"

#include <spdlog/spdlog.h>

#include <chrono>

#include "dialect_transformer.hpp"
#include "header_sanitizer.hpp"
#include "route_matcher.hpp"
#include "stream_relay.hpp"

namespace relay::proxy {

namespace {

void respond_text(const std::shared_ptr<ResponseChannel>& channel, int status, std::string text) {
  HeaderMap headers;
  headers.emplace("content-type", "text/plain; charset=utf-8");
  channel->respond(status, std::move(headers), std::move(text));
}

void respond_json(const std::shared_ptr<ResponseChannel>& channel, int status, const json& body) {
  HeaderMap headers;
  headers.emplace("content-type", "application/json");
  channel->respond(status, std::move(headers), body.dump());
}

std::string model_of(const json& body) {
  auto it = body.find("model");
  if (it != body.end() && it->is_string()) {
    return it->get<std::string>();
  }
  return "unknown";
}

int64_t since_ms(std::chrono::steady_clock::time_point started) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count();
}

}  // namespace

ProxyService::ProxyService(const Config& config, net::Dispatcher& dispatcher) : config_(config), dispatcher_(dispatcher) {}

void ProxyService::handle(net::InboundRequest request, std::shared_ptr<ResponseChannel> channel, const asio::any_io_executor& executor) {
  auto route = match_route(request.method, request.path, request.query, config_);

  if (!route.allowed) {
    spdlog::warn("[Proxy] {} {} rejected: method not allowed", request.method, request.path);
    HeaderMap headers;
    headers.emplace("content-type", "text/plain; charset=utf-8");
    headers.emplace("allow", "GET, POST, PUT, DELETE, OPTIONS, HEAD");
    channel->respond(405, std::move(headers), "Method Not Allowed");
    return;
  }

  spdlog::debug("{} {} routed as {} -> {}", request.method, request.path, to_string(route.dialect), route.url);

  switch (route.dialect) {
    case Dialect::OpenAiChat:
      handle_chat(std::move(request), route.url, std::move(channel), executor);
      break;
    case Dialect::AnthropicMessages:
      handle_messages(std::move(request), route.url, std::move(channel), executor);
      break;
    case Dialect::PassThrough:
      handle_pass_through(std::move(request), route.url, route.log_path, std::move(channel), executor);
      break;
  }
}

void ProxyService::handle_chat(net::InboundRequest request, const std::string& url, std::shared_ptr<ResponseChannel> channel,
                               const asio::any_io_executor& executor) {
  auto body = parse_body_or_empty(request.body);
  auto model = model_of(body);
  spdlog::info("[Chat] Request -> {}", model);

  if (inject_usage_reporting(body)) {
    spdlog::info("[Chat] Injected stream_options.include_usage");
  }

  net::OutboundRequest out;
  out.method = "POST";
  out.url = url;
  out.headers = sanitize_headers(request.headers, config_.api_key, Dialect::OpenAiChat);
  set_header(out.headers, "content-type", "application/json");
  out.body = body.dump();

  dispatcher_.send_streaming(executor, std::move(out), [this, channel, model](net::StreamingResult result) {
    if (result.failed()) {
      spdlog::error("[Chat] Connection failed for {} | {}", model, result.error->describe());
      respond_text(channel, 502, "Connection Error: " + result.error->detail);
      return;
    }
    relay(std::move(*result.value), channel, "Chat " + model);
  });
}

void ProxyService::handle_messages(net::InboundRequest request, const std::string& url, std::shared_ptr<ResponseChannel> channel,
                                   const asio::any_io_executor& executor) {
  auto body = parse_body_or_empty(request.body);
  spdlog::info("[Messages] Request -> {}", model_of(body));

  if (auto rejected = transform_anthropic_body(body, config_)) {
    spdlog::warn("[Messages] {}", rejected->message());
    respond_json(channel, config_.model_not_mapped_status, rejected->to_json());
    return;
  }

  auto model = model_of(body);
  auto stream = body.find("stream");
  bool streaming = stream != body.end() && stream->is_boolean() && stream->get<bool>();

  net::OutboundRequest out;
  out.method = "POST";
  out.url = url;
  out.headers = sanitize_headers(request.headers, config_.api_key, Dialect::AnthropicMessages);
  set_header(out.headers, "content-type", "application/json");
  out.body = body.dump();

  if (streaming) {
    dispatcher_.send_streaming(executor, std::move(out), [this, channel, model](net::StreamingResult result) {
      if (result.failed()) {
        spdlog::error("[Messages] Connection failed for {} | {}", model, result.error->describe());
        respond_text(channel, 502, "Connection Error: " + result.error->detail);
        return;
      }
      relay(std::move(*result.value), channel, "Messages " + model);
    });
    return;
  }

  auto started = std::chrono::steady_clock::now();
  dispatcher_.send_buffered(executor, std::move(out), [channel, model, started](net::BufferedResult result) {
    if (result.failed()) {
      spdlog::error("[Messages] Connection failed for {} | {}", model, result.error->describe());
      respond_text(channel, 502, "Connection Error: " + result.error->detail);
      return;
    }
    auto& response = *result.value;
    spdlog::info("[Messages] Response: {} for {} ({}ms)", response.status_code, model, since_ms(started));
    channel->respond(response.status_code, std::move(response.headers), std::move(response.body));
  });
}

void ProxyService::handle_pass_through(net::InboundRequest request, const std::string& url, const std::string& log_path,
                                       std::shared_ptr<ResponseChannel> channel, const asio::any_io_executor& executor) {
  spdlog::info("[Proxy] {} {} -> forwarding", request.method, log_path);

  net::OutboundRequest out;
  out.method = request.method;
  out.url = url;
  out.headers = sanitize_headers(request.headers, config_.api_key, Dialect::PassThrough);
  out.body = std::move(request.body);

  auto started = std::chrono::steady_clock::now();
  dispatcher_.send_buffered(executor, std::move(out), [channel, started](net::BufferedResult result) {
    if (result.failed()) {
      spdlog::error("[Proxy] Forwarding failed | {}", result.error->describe());
      respond_text(channel, 502, "Proxy Error: " + result.error->detail);
      return;
    }
    auto& response = *result.value;
    spdlog::info("[Proxy] Response: {} ({}ms)", response.status_code, since_ms(started));
    channel->respond(response.status_code, std::move(response.headers), std::move(response.body));
  });
}

void ProxyService::relay(std::shared_ptr<net::StreamingResponse> response, std::shared_ptr<ResponseChannel> channel,
                         const std::string& label) {
  auto sink = channel->open_stream(response->status_code(), "text/event-stream");
  auto stream_relay = std::make_shared<StreamRelay>(std::move(response), std::move(sink), label);

  channel->on_disconnect([weak = std::weak_ptr<StreamRelay>(stream_relay)]() {
    if (auto r = weak.lock()) {
      r->cancel();
    }
  });

  stream_relay->start([this, label](RelayOutcome outcome, const RelaySession& session) {
    spdlog::debug("[{}] Relay ended: {} after {} chunks, {} upstream connections open", label, to_string(outcome), session.chunk_count,
                  dispatcher_.ledger().active());
  });
}

}  // namespace relay::proxy

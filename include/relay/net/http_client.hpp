#pragma once

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "relay/core/types.hpp"
#include "relay/net/errors.hpp"
#include "relay/net/http_message.hpp"
#include "relay/net/stream.hpp"

namespace relay {
struct Config;
}

namespace relay::net {

// URL parsing helper
struct ParsedUrl {
  std::string scheme;
  std::string userinfo;  // "user:pass" (percent-encoded as given)
  std::string host;      // IPv6 literals keep their brackets
  std::string port;
  std::string path;
  std::string query;  // includes the leading '?'

  bool is_https() const {
    return scheme == "https";
  }

  std::string port_or_default() const;

  // Host without IPv6 brackets, for name resolution and SNI
  std::string bare_host() const;

  // "host" or "host:port" when the port is not the scheme default
  std::string host_header() const;

  static std::optional<ParsedUrl> parse(const std::string& url);
};

// Upstream connections opened and closed over the process lifetime
struct ConnectionLedger {
  std::atomic<uint64_t> opened{0};
  std::atomic<uint64_t> closed{0};

  uint64_t active() const {
    return opened.load() - closed.load();
  }
};

// Upstream response whose body is still on the wire.
// Owns the connection; reading to the end or close() releases it.
class StreamingResponse : public ChunkSource {
 public:
  virtual int status_code() const = 0;

  virtual const HeaderMap& headers() const = 0;
};

using StreamingResult = Result<std::shared_ptr<StreamingResponse>, ConnectionError>;
using BufferedResult = Result<BufferedResponse, ConnectionError>;

struct DispatcherOptions {
  std::optional<std::string> proxy_url;
  std::chrono::seconds timeout{0};  // 0 = unbounded
  bool verify_tls = true;

  static DispatcherOptions from_config(const Config& config);
};

// Sends outbound requests over a fresh connection per exchange,
// directly or through an HTTP forward proxy
class Dispatcher {
 public:
  explicit Dispatcher(DispatcherOptions options);

  ~Dispatcher();

  // Completes as soon as the response head is parsed. On success the
  // handler receives sole ownership of the open connection.
  void send_streaming(const asio::any_io_executor& executor, OutboundRequest request, std::function<void(StreamingResult)> handler);

  // Completes with the whole body; the connection is closed before the handler runs
  void send_buffered(const asio::any_io_executor& executor, OutboundRequest request, std::function<void(BufferedResult)> handler);

  const ConnectionLedger& ledger() const;

 private:
  class Impl;

  std::unique_ptr<Impl> impl_;
};

// Headers never copied from an upstream response into a buffered reply
bool is_excluded_response_header(const std::string& name);

}  // namespace relay::net

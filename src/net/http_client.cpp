#include "relay/net/http_client.hpp"

#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>
#include <vector>

#include "net/chunked_decoder.hpp"
#include "net/http_parser.hpp"
#include "net/upstream_connection.hpp"
#include "relay/core/config.hpp"
#include "relay/core/headers.hpp"

namespace relay::net {

// URL parsing
std::optional<ParsedUrl> ParsedUrl::parse(const std::string& url) {
  // scheme, optional userinfo, host or [v6], optional port, path, query, ignored fragment
  static const std::regex url_regex(
      R"(^(https?):\/\/(?:([^@\/\s?#]*)@)?(\[[0-9A-Fa-f:.]+\]|[^:\/\s?#@\[\]]+)(?::(\d+))?(\/[^\?#\s]*)?(\?[^#\s]*)?(?:#\S*)?$)");
  std::smatch match;

  if (!std::regex_match(url, match, url_regex)) {
    return std::nullopt;
  }

  ParsedUrl result;
  result.scheme = match[1].str();
  result.userinfo = match[2].str();
  result.host = match[3].str();
  result.port = match[4].str();
  result.path = match[5].str().empty() ? "/" : match[5].str();
  result.query = match[6].str();

  return result;
}

std::string ParsedUrl::port_or_default() const {
  if (!port.empty()) return port;
  return is_https() ? "443" : "80";
}

std::string ParsedUrl::bare_host() const {
  if (host.size() > 2 && host.front() == '[' && host.back() == ']') {
    return host.substr(1, host.size() - 2);
  }
  return host;
}

std::string ParsedUrl::host_header() const {
  if (port.empty() || port == (is_https() ? "443" : "80")) {
    return host;
  }
  return host + ":" + port;
}

DispatcherOptions DispatcherOptions::from_config(const Config& config) {
  DispatcherOptions options;
  options.proxy_url = config.proxy_url;
  options.timeout = std::chrono::seconds(std::max(0, config.upstream_timeout_seconds));
  options.verify_tls = config.verify_tls;
  return options;
}

bool is_excluded_response_header(const std::string& name) {
  return iequals(name, "content-encoding") || iequals(name, "content-length") || iequals(name, "transfer-encoding") ||
         iequals(name, "connection");
}

namespace {

using StreamingHandler = std::function<void(StreamingResult)>;

// Fields the dispatcher writes itself, never copied from the outbound request
bool is_framing_header(const std::string& name) {
  static const char* const kNames[] = {"host",      "connection", "content-length", "transfer-encoding",   "accept-encoding",
                                       "keep-alive", "te",         "trailer",        "upgrade",             "proxy-connection",
                                       "proxy-authorization"};
  for (const char* n : kNames) {
    if (iequals(name, n)) return true;
  }
  return false;
}

bool is_eof(const std::error_code& ec) {
  return ec == asio::error::eof || ec == asio::ssl::error::stream_truncated;
}

std::string percent_decode(const std::string& in) {
  std::string out;
  out.reserve(in.size());
  for (size_t i = 0; i < in.size(); ++i) {
    if (in[i] == '%' && i + 2 < in.size() && std::isxdigit(static_cast<unsigned char>(in[i + 1])) &&
        std::isxdigit(static_cast<unsigned char>(in[i + 2]))) {
      out.push_back(static_cast<char>(std::stoi(in.substr(i + 1, 2), nullptr, 16)));
      i += 2;
    } else {
      out.push_back(in[i]);
    }
  }
  return out;
}

std::string base64(const std::string& in) {
  std::vector<unsigned char> out(4 * ((in.size() + 2) / 3) + 1);
  int n = EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(in.data()), static_cast<int>(in.size()));
  return std::string(reinterpret_cast<const char*>(out.data()), n > 0 ? static_cast<size_t>(n) : 0);
}

ConnectionError make_connection_error(ConnectionStage stage, const std::error_code& ec, const std::string& detail = "") {
  ConnectionError err;
  err.stage = stage;
  err.code = ec;
  err.detail = detail.empty() ? ec.message() : detail;
  return err;
}

// Response whose body is read off the connection chunk by chunk
class UpstreamResponse : public StreamingResponse, public std::enable_shared_from_this<UpstreamResponse> {
 public:
  UpstreamResponse(std::shared_ptr<UpstreamConnection> conn, ResponseHead head, BodyFraming framing, uint64_t length,
                   std::string leftover)
      : conn_(std::move(conn)),
        head_(std::move(head)),
        framing_(framing),
        remaining_(length),
        leftover_(std::move(leftover)),
        finished_(framing == BodyFraming::None),
        read_buf_(16 * 1024) {}

  ~UpstreamResponse() override {
    close();
  }

  int status_code() const override {
    return head_.status_code;
  }

  const HeaderMap& headers() const override {
    return head_.headers;
  }

  void read_chunk(ChunkHandler handler) override {
    if (pending_error_) {
      auto ec = pending_error_;
      pending_error_ = {};
      complete(std::move(handler), ec, {});
      return;
    }

    // Body bytes that arrived together with the head come first
    if (!leftover_.empty()) {
      std::string raw;
      raw.swap(leftover_);
      std::string out;
      auto ec = consume(raw, out);
      if (ec && !out.empty()) {
        pending_error_ = ec;
        ec = {};
      }
      if (ec || !out.empty() || finished_) {
        complete(std::move(handler), ec, std::move(out));
        return;
      }
    }

    if (finished_) {
      complete(std::move(handler), {}, {});
      return;
    }

    if (!conn_->is_open()) {
      auto ec = conn_->timed_out() ? make_error_code(Error::timed_out) : std::error_code(asio::error::operation_aborted);
      complete(std::move(handler), ec, {});
      return;
    }

    read_more(std::move(handler));
  }

  void close() override {
    conn_->close();
  }

 private:
  // Never run a handler inline from read_chunk
  void complete(ChunkHandler handler, std::error_code ec, std::string chunk) {
    asio::post(conn_->executor(), [self = shared_from_this(), handler = std::move(handler), ec, chunk = std::move(chunk)]() mutable {
      handler(ec, std::move(chunk));
    });
  }

  void read_more(ChunkHandler handler) {
    conn_->async_read_some(asio::buffer(read_buf_), [self = shared_from_this(), handler = std::move(handler)](const std::error_code& ec,
                                                                                                            size_t n) mutable {
      self->on_read(std::move(handler), ec, n);
    });
  }

  void on_read(ChunkHandler handler, const std::error_code& ec, size_t n) {
    std::string out;
    if (n > 0) {
      if (auto derr = consume(std::string_view(read_buf_.data(), n), out)) {
        // Bytes decoded ahead of the framing error go out first
        if (!out.empty()) {
          pending_error_ = derr;
          handler({}, std::move(out));
        } else {
          handler(derr, {});
        }
        return;
      }
      if (!out.empty()) {
        handler({}, std::move(out));
        return;
      }
    }

    if (ec) {
      if (conn_->timed_out()) {
        handler(make_error_code(Error::timed_out), {});
      } else if (is_eof(ec) && (finished_ || framing_ == BodyFraming::UntilClose)) {
        finished_ = true;
        handler({}, {});
      } else if (is_eof(ec)) {
        handler(make_error_code(Error::incomplete_body), {});
      } else {
        handler(ec, {});
      }
      return;
    }

    if (finished_) {
      handler({}, {});
      return;
    }

    // Framing bytes only (chunk size line, CRLF); keep reading
    read_more(std::move(handler));
  }

  std::error_code consume(std::string_view raw, std::string& out) {
    switch (framing_) {
      case BodyFraming::None:
        finished_ = true;
        return {};
      case BodyFraming::Length: {
        auto n = static_cast<size_t>(std::min<uint64_t>(remaining_, raw.size()));
        out.append(raw.data(), n);
        remaining_ -= n;
        if (remaining_ == 0) finished_ = true;
        return {};
      }
      case BodyFraming::Chunked: {
        auto ec = decoder_.feed(raw, out);
        if (decoder_.done()) finished_ = true;
        return ec;
      }
      case BodyFraming::UntilClose:
        out.append(raw.data(), raw.size());
        return {};
    }
    return {};
  }

  std::shared_ptr<UpstreamConnection> conn_;
  ResponseHead head_;
  BodyFraming framing_;
  uint64_t remaining_;
  std::string leftover_;
  bool finished_;
  std::error_code pending_error_;  // reported by the next read_chunk
  ChunkedDecoder decoder_;
  std::vector<char> read_buf_;
};

// One outbound request from dialing to the parsed response head
class Exchange : public std::enable_shared_from_this<Exchange> {
 public:
  Exchange(const asio::any_io_executor& executor, OutboundRequest request, ParsedUrl target, std::optional<ParsedUrl> proxy,
           const DispatcherOptions& options, std::shared_ptr<asio::ssl::context> ssl_ctx, std::shared_ptr<ConnectionLedger> ledger,
           StreamingHandler handler)
      : executor_(executor),
        resolver_(executor),
        request_(std::move(request)),
        target_(std::move(target)),
        proxy_(std::move(proxy)),
        timeout_(options.timeout),
        verify_tls_(options.verify_tls),
        ssl_ctx_(std::move(ssl_ctx)),
        ledger_(std::move(ledger)),
        handler_(std::move(handler)) {}

  void start() {
    conn_ = std::make_shared<UpstreamConnection>(executor_, ledger_);
    conn_->arm_deadline(timeout_);

    const ParsedUrl& hop = proxy_ ? *proxy_ : target_;
    spdlog::debug("Dialing {}:{}{} for {} {}", hop.bare_host(), hop.port_or_default(), proxy_ ? " (proxy)" : "", request_.method,
                  request_.url);

    resolver_.async_resolve(hop.bare_host(), hop.port_or_default(),
                            [self = shared_from_this()](const std::error_code& ec, asio::ip::tcp::resolver::results_type results) {
                              if (ec || !self->conn_->is_open()) {
                                self->fail(ConnectionStage::Resolve, ec);
                                return;
                              }

                              asio::async_connect(self->conn_->socket(), results,
                                                  [self](const std::error_code& ec, const asio::ip::tcp::endpoint&) {
                                                    if (ec || !self->conn_->is_open()) {
                                                      self->fail(ConnectionStage::Connect, ec);
                                                      return;
                                                    }
                                                    self->connected();
                                                  });
                            });
  }

 private:
  bool tunneled() const {
    return proxy_ && target_.is_https();
  }

  bool absolute_form() const {
    return proxy_ && !target_.is_https();
  }

  void connected() {
    if (tunneled()) {
      open_tunnel();
    } else if (target_.is_https()) {
      handshake();
    } else {
      write_request();
    }
  }

  // HTTP CONNECT through the forward proxy, then TLS inside the tunnel
  void open_tunnel() {
    std::string authority = target_.host + ":" + target_.port_or_default();
    std::ostringstream req;
    req << "CONNECT " << authority << " HTTP/1.1\r\n";
    req << "Host: " << authority << "\r\n";
    if (!proxy_->userinfo.empty()) {
      req << "Proxy-Authorization: Basic " << base64(percent_decode(proxy_->userinfo)) << "\r\n";
    }
    req << "\r\n";
    tunnel_request_ = req.str();

    conn_->async_write(asio::buffer(tunnel_request_), [self = shared_from_this()](const std::error_code& ec, size_t) {
      if (ec) {
        self->fail(ConnectionStage::ProxyTunnel, ec);
        return;
      }

      self->conn_->async_read_until(self->buffer_, "\r\n\r\n", [self](const std::error_code& ec, size_t n) {
        if (ec) {
          self->fail(ConnectionStage::ProxyTunnel, ec == asio::error::not_found ? make_error_code(Error::header_too_large) : ec);
          return;
        }

        std::string data(asio::buffers_begin(self->buffer_.data()), asio::buffers_end(self->buffer_.data()));
        self->buffer_.consume(self->buffer_.size());

        ResponseHead head;
        if (auto perr = parse_response_head(std::string_view(data).substr(0, n), head)) {
          self->fail(ConnectionStage::ProxyTunnel, perr);
          return;
        }
        if (head.status_code < 200 || head.status_code >= 300) {
          self->fail(ConnectionStage::ProxyTunnel, make_error_code(Error::proxy_tunnel_refused),
                     "Forward proxy refused CONNECT with status " + std::to_string(head.status_code));
          return;
        }

        self->handshake();
      });
    });
  }

  void handshake() {
    conn_->start_tls(*ssl_ctx_, target_.bare_host(), verify_tls_, [self = shared_from_this()](const std::error_code& ec) {
      if (ec) {
        self->fail(ConnectionStage::TlsHandshake, ec);
        return;
      }
      self->write_request();
    });
  }

  void write_request() {
    request_bytes_ = build_request();

    conn_->async_write(asio::buffer(request_bytes_), [self = shared_from_this()](const std::error_code& ec, size_t) {
      if (ec) {
        self->fail(ConnectionStage::Write, ec);
        return;
      }
      self->read_head();
    });
  }

  void read_head() {
    conn_->async_read_until(buffer_, "\r\n\r\n", [self = shared_from_this()](const std::error_code& ec, size_t n) {
      if (ec) {
        self->fail(ConnectionStage::ReadHead, ec == asio::error::not_found ? make_error_code(Error::header_too_large) : ec);
        return;
      }

      std::string data(asio::buffers_begin(self->buffer_.data()), asio::buffers_end(self->buffer_.data()));
      self->buffer_.consume(self->buffer_.size());
      std::string leftover = data.substr(n);

      ResponseHead head;
      if (auto perr = parse_response_head(std::string_view(data).substr(0, n), head)) {
        self->fail(ConnectionStage::ReadHead, perr);
        return;
      }

      // Skip interim responses (100 Continue, 103 Early Hints)
      if (head.status_code < 200 && head.status_code != 101) {
        self->buffer_.sputn(leftover.data(), static_cast<std::streamsize>(leftover.size()));
        self->read_head();
        return;
      }

      BodyFraming framing = BodyFraming::None;
      uint64_t length = 0;
      if (auto ferr = response_body_framing(self->request_.method, head, framing, length)) {
        self->fail(ConnectionStage::ReadHead, ferr);
        return;
      }

      spdlog::debug("Upstream answered {} for {} {}", head.status_code, self->request_.method, self->request_.url);

      auto response =
          std::make_shared<UpstreamResponse>(std::move(self->conn_), std::move(head), framing, length, std::move(leftover));
      auto handler = std::move(self->handler_);
      self->handler_ = nullptr;
      handler(StreamingResult::success(std::move(response)));
    });
  }

  std::string build_request() const {
    std::string path = target_.path + target_.query;

    std::ostringstream req;
    req << request_.method << " " << (absolute_form() ? target_.scheme + "://" + target_.host_header() + path : path) << " HTTP/1.1\r\n";
    req << "Host: " << target_.host_header() << "\r\n";

    for (const auto& [key, value] : request_.headers) {
      if (is_framing_header(key)) continue;
      req << key << ": " << value << "\r\n";
    }

    if (absolute_form() && !proxy_->userinfo.empty()) {
      req << "Proxy-Authorization: Basic " << base64(percent_decode(proxy_->userinfo)) << "\r\n";
    }

    req << "Connection: close\r\n";
    req << "Accept-Encoding: identity\r\n";

    const auto& m = request_.method;
    if (!request_.body.empty() || m == "POST" || m == "PUT" || m == "PATCH") {
      req << "Content-Length: " << request_.body.size() << "\r\n";
    }

    req << "\r\n";
    req << request_.body;
    return req.str();
  }

  // The half-open connection is closed here, before the handler learns of the failure
  void fail(ConnectionStage stage, std::error_code ec, const std::string& detail = "") {
    if (!handler_) return;

    bool timed_out = conn_ && conn_->timed_out();
    if (conn_) {
      conn_->close();
      conn_.reset();
    }
    resolver_.cancel();

    ConnectionError err = timed_out ? make_connection_error(ConnectionStage::Timeout, make_error_code(Error::timed_out))
                                    : make_connection_error(stage, ec ? ec : make_error_code(asio::error::operation_aborted), detail);

    auto handler = std::move(handler_);
    handler_ = nullptr;
    handler(StreamingResult::failure(std::move(err)));
  }

  asio::any_io_executor executor_;
  asio::ip::tcp::resolver resolver_;
  OutboundRequest request_;
  ParsedUrl target_;
  std::optional<ParsedUrl> proxy_;
  std::chrono::seconds timeout_;
  bool verify_tls_;
  std::shared_ptr<asio::ssl::context> ssl_ctx_;
  std::shared_ptr<ConnectionLedger> ledger_;
  StreamingHandler handler_;

  std::shared_ptr<UpstreamConnection> conn_;
  asio::streambuf buffer_{kMaxHeadBytes};
  std::string tunnel_request_;
  std::string request_bytes_;
};

// Reads a response to the end, then closes it before reporting
void drain(std::shared_ptr<StreamingResponse> response, std::shared_ptr<BufferedResponse> out,
           std::function<void(BufferedResult)> handler) {
  auto* source = response.get();
  source->read_chunk([response = std::move(response), out = std::move(out), handler = std::move(handler)](const std::error_code& ec,
                                                                                                         std::string chunk) mutable {
    if (ec) {
      response->close();
      auto stage = ec == make_error_code(Error::timed_out) ? ConnectionStage::Timeout : ConnectionStage::ReadBody;
      handler(BufferedResult::failure(make_connection_error(stage, ec)));
      return;
    }
    if (chunk.empty()) {
      response->close();
      handler(BufferedResult::success(std::move(*out)));
      return;
    }
    out->body += chunk;
    drain(std::move(response), std::move(out), std::move(handler));
  });
}

}  // namespace

class Dispatcher::Impl {
 public:
  explicit Impl(DispatcherOptions options)
      : options_(std::move(options)),
        ssl_ctx_(std::make_shared<asio::ssl::context>(asio::ssl::context::tls_client)),
        ledger_(std::make_shared<ConnectionLedger>()) {
    ssl_ctx_->set_options(asio::ssl::context::default_workarounds | asio::ssl::context::no_sslv2 | asio::ssl::context::no_sslv3 |
                          asio::ssl::context::no_tlsv1 | asio::ssl::context::no_tlsv1_1);

    asio::error_code ec;
    ssl_ctx_->set_default_verify_paths(ec);
    if (ec) {
      spdlog::warn("Cannot load system CA certificates: {}", ec.message());
    }

    if (options_.proxy_url) {
      proxy_ = ParsedUrl::parse(*options_.proxy_url);
      if (!proxy_ || proxy_->is_https()) {
        spdlog::error("Unsupported forward proxy URL '{}', only http:// proxies are supported", *options_.proxy_url);
      }
    }
  }

  void start(const asio::any_io_executor& executor, OutboundRequest request, StreamingHandler handler) {
    auto target = ParsedUrl::parse(request.url);
    if (!target) {
      post_failure(executor, std::move(handler), "Invalid URL: " + request.url);
      return;
    }
    if (options_.proxy_url && (!proxy_ || proxy_->is_https())) {
      post_failure(executor, std::move(handler), "Invalid proxy URL: " + *options_.proxy_url);
      return;
    }

    auto exchange = std::make_shared<Exchange>(executor, std::move(request), std::move(*target), proxy_, options_, ssl_ctx_, ledger_,
                                               std::move(handler));
    exchange->start();
  }

  const ConnectionLedger& ledger() const {
    return *ledger_;
  }

 private:
  static void post_failure(const asio::any_io_executor& executor, StreamingHandler handler, const std::string& detail) {
    auto err = make_connection_error(ConnectionStage::InvalidUrl, make_error_code(Error::invalid_url), detail);
    asio::post(executor, [handler = std::move(handler), err]() {
      handler(StreamingResult::failure(err));
    });
  }

  DispatcherOptions options_;
  std::optional<ParsedUrl> proxy_;
  std::shared_ptr<asio::ssl::context> ssl_ctx_;
  std::shared_ptr<ConnectionLedger> ledger_;
};

Dispatcher::Dispatcher(DispatcherOptions options) : impl_(std::make_unique<Impl>(std::move(options))) {}

Dispatcher::~Dispatcher() = default;

void Dispatcher::send_streaming(const asio::any_io_executor& executor, OutboundRequest request, std::function<void(StreamingResult)> handler) {
  impl_->start(executor, std::move(request), std::move(handler));
}

void Dispatcher::send_buffered(const asio::any_io_executor& executor, OutboundRequest request, std::function<void(BufferedResult)> handler) {
  impl_->start(executor, std::move(request), [handler = std::move(handler)](StreamingResult result) mutable {
    if (result.failed()) {
      handler(BufferedResult::failure(std::move(*result.error)));
      return;
    }

    auto response = std::move(*result.value);
    auto out = std::make_shared<BufferedResponse>();
    out->status_code = response->status_code();
    for (const auto& [name, value] : response->headers()) {
      if (!is_excluded_response_header(name)) {
        out->headers.emplace(name, value);
      }
    }
    drain(std::move(response), std::move(out), std::move(handler));
  });
}

const ConnectionLedger& Dispatcher::ledger() const {
  return impl_->ledger();
}

}  // namespace relay::net

#include "relay/net/errors.hpp"

namespace relay::net {

namespace {

class RelayErrorCategory : public std::error_category {
 public:
  const char* name() const noexcept override {
    return "llm-relay";
  }

  std::string message(int value) const override {
    switch (static_cast<Error>(value)) {
      case Error::invalid_url:
        return "Invalid URL";
      case Error::bad_status_line:
        return "Malformed HTTP status line";
      case Error::bad_request_line:
        return "Malformed HTTP request line";
      case Error::bad_header:
        return "Malformed HTTP header";
      case Error::header_too_large:
        return "HTTP header block too large";
      case Error::bad_chunk_encoding:
        return "Malformed chunked transfer encoding";
      case Error::incomplete_body:
        return "Peer closed connection without sending complete message body";
      case Error::proxy_tunnel_refused:
        return "Forward proxy refused the tunnel";
      case Error::timed_out:
        return "Upstream exchange timed out";
    }
    return "Unknown llm-relay error";
  }
};

}  // namespace

const std::error_category& error_category() {
  static RelayErrorCategory category;
  return category;
}

std::error_code make_error_code(Error e) {
  return {static_cast<int>(e), error_category()};
}

std::string to_string(ConnectionStage stage) {
  switch (stage) {
    case ConnectionStage::InvalidUrl:
      return "invalid_url";
    case ConnectionStage::Resolve:
      return "resolve";
    case ConnectionStage::Connect:
      return "connect";
    case ConnectionStage::ProxyTunnel:
      return "proxy_tunnel";
    case ConnectionStage::TlsHandshake:
      return "tls_handshake";
    case ConnectionStage::Write:
      return "write";
    case ConnectionStage::ReadHead:
      return "read_head";
    case ConnectionStage::ReadBody:
      return "read_body";
    case ConnectionStage::Timeout:
      return "timeout";
  }
  return "unknown";
}

std::string error_kind(const std::error_code& ec) {
  return std::string(ec.category().name()) + ":" + std::to_string(ec.value());
}

std::string ConnectionError::describe() const {
  return to_string(stage) + " [" + error_kind(code) + "] " + detail;
}

}  // namespace relay::net

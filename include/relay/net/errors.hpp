#pragma once

#include <string>
#include <system_error>

namespace relay::net {

// Protocol-level failures detected by the relay itself
enum class Error {
  invalid_url = 1,
  bad_status_line,
  bad_request_line,
  bad_header,
  header_too_large,
  bad_chunk_encoding,
  incomplete_body,
  proxy_tunnel_refused,
  timed_out,
};

const std::error_category& error_category();

std::error_code make_error_code(Error e);

// Where an outbound exchange failed
enum class ConnectionStage {
  InvalidUrl,
  Resolve,
  Connect,
  ProxyTunnel,
  TlsHandshake,
  Write,
  ReadHead,
  ReadBody,
  Timeout,
};

std::string to_string(ConnectionStage stage);

// Failure to reach or talk to the upstream before (or while buffering) a response
struct ConnectionError {
  ConnectionStage stage = ConnectionStage::Connect;
  std::error_code code;
  std::string detail;

  // "<stage> [<category>:<value>] <detail>", for logs
  std::string describe() const;
};

// "asio.misc:2" style kind of an error code
std::string error_kind(const std::error_code& ec);

}  // namespace relay::net

namespace std {
template <>
struct is_error_code_enum<relay::net::Error> : true_type {};
}  // namespace std

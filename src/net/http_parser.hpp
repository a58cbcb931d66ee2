#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

#include "relay/core/headers.hpp"
#include "relay/net/http_message.hpp"

namespace relay::net {

// Upper bound of a request or response head, including the blank line
inline constexpr size_t kMaxHeadBytes = 64 * 1024;

struct ResponseHead {
  int version_minor = 1;
  int status_code = 0;
  std::string reason;
  HeaderMap headers;
};

// How the message body is delimited
enum class BodyFraming {
  None,        // no body
  Length,      // Content-Length bytes
  Chunked,     // Transfer-Encoding: chunked
  UntilClose,  // read until the peer closes
};

// Parse "METHOD target HTTP/1.x" plus header lines. body is left untouched.
std::error_code parse_request_head(std::string_view head, InboundRequest& out);

// Parse "HTTP/1.x code reason" plus header lines
std::error_code parse_response_head(std::string_view head, ResponseHead& out);

// Request bodies are never read until close
std::error_code request_body_framing(const HeaderMap& headers, BodyFraming& framing, uint64_t& length);

std::error_code response_body_framing(const std::string& request_method, const ResponseHead& head, BodyFraming& framing,
                                      uint64_t& length);

}  // namespace relay::net

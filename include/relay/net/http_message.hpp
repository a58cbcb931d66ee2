#pragma once

#include <string>

#include "relay/core/headers.hpp"

namespace relay::net {

// Request received from a local client
struct InboundRequest {
  std::string method;
  std::string path;   // "/v1/models"
  std::string query;  // raw query string without '?', forwarded as-is
  int version_minor = 1;
  HeaderMap headers;
  std::string body;

  // HTTP/1.1 defaults to keep-alive, HTTP/1.0 to close
  bool keep_alive() const;
};

// Request sent to the upstream gateway, consumed once by the Dispatcher
struct OutboundRequest {
  std::string method = "POST";
  std::string url;
  HeaderMap headers;
  std::string body;
};

// Fully read upstream response
struct BufferedResponse {
  int status_code = 0;
  HeaderMap headers;
  std::string body;
};

std::string status_reason(int status_code);

}  // namespace relay::net

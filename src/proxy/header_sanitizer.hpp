#pragma once

#include <string>

#include "relay/core/headers.hpp"
#include "relay/core/types.hpp"

namespace relay::proxy {

// Whether name is dropped from every forwarded request
bool is_hop_by_hop_header(const std::string& name);

// Copy of inbound without hop-by-hop and framing headers, plus the fixed
// credential when one is configured. Anthropic targets also get x-api-key.
HeaderMap sanitize_headers(const HeaderMap& inbound, const std::string& api_key, Dialect dialect);

}  // namespace relay::proxy

#pragma once

// Core types
#include "relay/core/config.hpp"
#include "relay/core/headers.hpp"
#include "relay/core/types.hpp"

// Network
#include "relay/net/errors.hpp"
#include "relay/net/http_client.hpp"
#include "relay/net/http_message.hpp"
#include "relay/net/stream.hpp"

// Proxy pipeline
#include "relay/proxy/proxy_service.hpp"

// Front-end server
#include "relay/server/http_server.hpp"

namespace relay {

// Initialize logging from the configuration
void init(const Config& config);

// Get version string
std::string version();

}  // namespace relay

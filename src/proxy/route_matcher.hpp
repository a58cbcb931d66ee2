#pragma once

#include <string>

#include "relay/core/config.hpp"
#include "relay/core/types.hpp"

namespace relay::proxy {

struct Route {
  Dialect dialect = Dialect::PassThrough;
  std::string url;       // upstream target, query included
  std::string log_path;  // path as shown in [Proxy] log lines
  bool allowed = true;   // false: method not served, answer 405
};

// Methods forwarded on the pass-through route
bool is_forwarded_method(const std::string& method);

// Pass-through target: the base URL plus the path without its leading '/'.
// "<strip_prefix>/" is removed only when the base URL ends in "/<strip_prefix>".
std::string pass_through_path(const std::string& base_url, const std::string& path, const std::string& strip_prefix);

Route match_route(const std::string& method, const std::string& path, const std::string& query, const Config& config);

}  // namespace relay::proxy

#include "route_matcher.hpp"

namespace relay::proxy {

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool starts_with(const std::string& s, const std::string& prefix) {
  return s.compare(0, prefix.size(), prefix) == 0;
}

}  // namespace

bool is_forwarded_method(const std::string& method) {
  return method == "GET" || method == "POST" || method == "PUT" || method == "DELETE" || method == "OPTIONS" || method == "HEAD";
}

std::string pass_through_path(const std::string& base_url, const std::string& path, const std::string& strip_prefix) {
  std::string clean = path;
  if (starts_with(clean, "/")) {
    clean.erase(0, 1);
  }

  if (!strip_prefix.empty() && ends_with(base_url, "/" + strip_prefix) && starts_with(clean, strip_prefix + "/")) {
    clean.erase(0, strip_prefix.size() + 1);
  }
  return clean;
}

Route match_route(const std::string& method, const std::string& path, const std::string& query, const Config& config) {
  Route route;

  if (method == "POST" && config.is_chat_path(path)) {
    route.dialect = Dialect::OpenAiChat;
    route.url = config.openai_base_url + "/chat/completions";
    return route;
  }

  if (method == "POST" && config.is_messages_path(path)) {
    route.dialect = Dialect::AnthropicMessages;
    route.url = config.anthropic_base_url + "/v1/messages";
    return route;
  }

  route.dialect = Dialect::PassThrough;
  if (!is_forwarded_method(method)) {
    route.allowed = false;
    return route;
  }

  route.log_path = pass_through_path(config.openai_base_url, path, config.strip_prefix);
  route.url = config.openai_base_url + "/" + route.log_path;
  if (!query.empty()) {
    route.url += "?" + query;
  }
  return route;
}

}  // namespace relay::proxy

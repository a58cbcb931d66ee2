#pragma once

#include <optional>
#include <string>

#include "relay/core/config.hpp"
#include "relay/core/types.hpp"

namespace relay::proxy {

// Rejection of an Anthropic request whose model has no upstream id
struct ModelNotMapped {
  std::string model;
  std::string table;

  // "Model '<model>' not found in <table>"
  std::string message() const;

  // {"error": message()}
  json to_json() const;
};

// Anything that is not a JSON object becomes {}
json parse_body_or_empty(const std::string& body);

// Adds stream_options.include_usage to streaming chat requests that lack stream_options.
// Returns true when the body changed.
bool inject_usage_reporting(json& body);

// Appends tool unless tools already holds an entry of the same type.
// A missing or non-array tools field counts as empty. Returns true when appended.
bool inject_tool(json& body, const json& tool);

// Rewrites model to its upstream id and injects the web search tool when enabled.
// On rejection the body is left untouched.
std::optional<ModelNotMapped> transform_anthropic_body(json& body, const Config& config);

}  // namespace relay::proxy

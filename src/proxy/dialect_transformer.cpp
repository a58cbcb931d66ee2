#include "dialect_transformer.hpp"

#include <spdlog/spdlog.h>

namespace relay::proxy {

std::string ModelNotMapped::message() const {
  return "Model '" + model + "' not found in " + table;
}

json ModelNotMapped::to_json() const {
  return json{{"error", message()}};
}

json parse_body_or_empty(const std::string& body) {
  auto parsed = json::parse(body, nullptr, false);
  if (parsed.is_discarded()) {
    spdlog::warn("Request body is not valid JSON, using an empty document");
    return json::object();
  }
  if (!parsed.is_object()) {
    spdlog::warn("Request body is a JSON {}, not an object, using an empty document", parsed.type_name());
    return json::object();
  }
  return parsed;
}

bool inject_usage_reporting(json& body) {
  auto it = body.find("stream");
  if (it == body.end() || !it->is_boolean() || !it->get<bool>()) {
    return false;
  }
  if (body.contains("stream_options")) {
    return false;
  }
  body["stream_options"] = {{"include_usage", true}};
  return true;
}

bool inject_tool(json& body, const json& tool) {
  if (!tool.is_object() || !tool.contains("type")) {
    return false;
  }

  auto it = body.find("tools");
  if (it == body.end() || !it->is_array()) {
    body["tools"] = json::array();
    it = body.find("tools");
  }

  for (const auto& existing : *it) {
    if (existing.is_object() && existing.contains("type") && existing["type"] == tool["type"]) {
      return false;
    }
  }

  it->push_back(tool);
  return true;
}

std::optional<ModelNotMapped> transform_anthropic_body(json& body, const Config& config) {
  auto it = body.find("model");

  // Absent ids are reported as '' and non-string ids by their JSON text
  std::string model;
  if (it != body.end()) {
    model = it->is_string() ? it->get<std::string>() : it->dump();
  }

  std::optional<std::string> mapped;
  if (it != body.end() && it->is_string()) {
    mapped = config.map_anthropic_model(model);
  }
  if (!mapped) {
    return ModelNotMapped{model, kModelMapName};
  }

  spdlog::info("[Messages] Model mapped: {} -> {}", model, *mapped);
  *it = *mapped;

  if (config.enable_web_search && !config.web_search_tool.is_null()) {
    if (inject_tool(body, config.web_search_tool)) {
      spdlog::info("[Messages] Injected tool {}", config.web_search_tool.value("type", std::string()));
    }
  }

  return std::nullopt;
}

}  // namespace relay::proxy

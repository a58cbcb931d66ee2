#include "relay/core/config.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <fstream>

namespace relay {

namespace fs = std::filesystem;

namespace {

bool env_flag(const char* value) {
  std::string v = value;
  return v == "true" || v == "1" || v == "yes";
}

// Integer from the environment; a malformed value keeps the fallback
int env_int(const char* name, const char* value, int fallback) {
  try {
    return std::stoi(value);
  } catch (const std::exception&) {
    spdlog::warn("Ignoring {}={}: not an integer", name, value);
    return fallback;
  }
}

}  // namespace

std::map<std::string, std::string> default_anthropic_model_map() {
  return {
      {"claude-opus-4-1-20250805", "anthropic/claude-opus-4.1"},
      {"claude-opus-4-20250514", "anthropic/claude-opus-4"},
      {"claude-sonnet-4-5-20250929", "anthropic/claude-sonnet-4.5"},
      {"claude-sonnet-4-20250514", "anthropic/claude-sonnet-4"},
      {"claude-haiku-4-5-20251001", "anthropic/claude-haiku-4.5"},
      {"claude-3-7-sonnet-20250219", "anthropic/claude-3.7-sonnet"},
      {"claude-3-5-haiku-20241022", "anthropic/claude-3.5-haiku"},
  };
}

json default_web_search_tool() {
  return {{"type", "web_search_20250305"}, {"name", "web_search"}, {"max_uses", 5}};
}

Config Config::load(const fs::path& path) {
  Config config;

  if (!fs::exists(path)) {
    return config;
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    spdlog::warn("Cannot open config file {}, using defaults", path.string());
    return config;
  }

  try {
    auto j = nlohmann::json::parse(file);

    config.listen_host = j.value("listen_host", config.listen_host);
    config.listen_port = j.value("listen_port", config.listen_port);
    config.threads = j.value("threads", config.threads);

    config.openai_base_url = j.value("openai_base_url", config.openai_base_url);
    config.anthropic_base_url = j.value("anthropic_base_url", config.anthropic_base_url);
    if (j.contains("proxy_url") && j["proxy_url"].is_string()) {
      config.proxy_url = j["proxy_url"].get<std::string>();
    }
    config.api_key = j.value("api_key", "");

    // A table in the file replaces the built-in one
    if (j.contains("anthropic_model_map")) {
      config.anthropic_model_map.clear();
      for (auto& [from, to] : j["anthropic_model_map"].items()) {
        config.anthropic_model_map[from] = to.get<std::string>();
      }
    }

    config.enable_web_search = j.value("enable_web_search", false);
    if (j.contains("web_search_tool") && j["web_search_tool"].is_object()) {
      config.web_search_tool = json::parse(j["web_search_tool"].dump());
    }

    if (j.contains("chat_paths")) {
      config.chat_paths = j["chat_paths"].get<std::vector<std::string>>();
    }
    if (j.contains("messages_paths")) {
      config.messages_paths = j["messages_paths"].get<std::vector<std::string>>();
    }
    config.strip_prefix = j.value("strip_prefix", config.strip_prefix);

    config.model_not_mapped_status = j.value("model_not_mapped_status", config.model_not_mapped_status);
    config.upstream_timeout_seconds = j.value("upstream_timeout_seconds", config.upstream_timeout_seconds);
    config.verify_tls = j.value("verify_tls", config.verify_tls);
    config.max_body_bytes = j.value("max_body_bytes", config.max_body_bytes);

    config.log_level = j.value("log_level", "info");
    if (j.contains("log_file")) {
      config.log_file = j["log_file"].get<std::string>();
    }

  } catch (const std::exception& e) {
    spdlog::warn("Invalid config file {}: {}, using defaults", path.string(), e.what());
    return Config{};
  }

  return config;
}

Config Config::load_default() {
  // Try to load from project config first, then global
  auto project_config = config_paths::project_config_file();
  if (fs::exists(project_config)) {
    return load(project_config);
  }

  auto global_config = config_paths::default_config_file();
  if (fs::exists(global_config)) {
    return load(global_config);
  }

  return Config{};
}

Config Config::from_env() {
  Config config = load_default();

  if (const char* host = std::getenv("RELAY_LISTEN_HOST")) {
    config.listen_host = host;
  }
  if (const char* port = std::getenv("RELAY_LISTEN_PORT")) {
    config.listen_port = env_int("RELAY_LISTEN_PORT", port, config.listen_port);
  }
  if (const char* threads = std::getenv("RELAY_THREADS")) {
    config.threads = env_int("RELAY_THREADS", threads, config.threads);
  }

  if (const char* base_url = std::getenv("TARGET_BASE_URL")) {
    config.openai_base_url = base_url;
  }
  if (const char* base_url = std::getenv("ANTHROPIC_BASE_URL")) {
    config.anthropic_base_url = base_url;
  }

  // An empty PROXY_URL switches the proxy off
  if (const char* proxy = std::getenv("PROXY_URL")) {
    if (*proxy) {
      config.proxy_url = proxy;
    } else {
      config.proxy_url.reset();
    }
  }

  if (const char* key = std::getenv("API_KEY")) {
    config.api_key = key;
  }
  if (const char* web_search = std::getenv("ENABLE_WEB_SEARCH")) {
    config.enable_web_search = env_flag(web_search);
  }
  if (const char* timeout = std::getenv("RELAY_UPSTREAM_TIMEOUT")) {
    config.upstream_timeout_seconds = env_int("RELAY_UPSTREAM_TIMEOUT", timeout, config.upstream_timeout_seconds);
  }

  if (const char* level = std::getenv("RELAY_LOG_LEVEL")) {
    config.log_level = level;
  }
  if (const char* log_file = std::getenv("RELAY_LOG_FILE")) {
    config.log_file = fs::path(log_file);
  }

  return config;
}

void Config::save(const fs::path& path) const {
  nlohmann::json j;

  j["listen_host"] = listen_host;
  j["listen_port"] = listen_port;
  j["threads"] = threads;

  j["openai_base_url"] = openai_base_url;
  j["anthropic_base_url"] = anthropic_base_url;
  if (proxy_url) {
    j["proxy_url"] = *proxy_url;
  }
  j["api_key"] = api_key;

  j["anthropic_model_map"] = anthropic_model_map;
  j["enable_web_search"] = enable_web_search;
  j["web_search_tool"] = nlohmann::json::parse(web_search_tool.dump());

  j["chat_paths"] = chat_paths;
  j["messages_paths"] = messages_paths;
  j["strip_prefix"] = strip_prefix;

  j["model_not_mapped_status"] = model_not_mapped_status;
  j["upstream_timeout_seconds"] = upstream_timeout_seconds;
  j["verify_tls"] = verify_tls;
  j["max_body_bytes"] = max_body_bytes;

  j["log_level"] = log_level;
  if (log_file) {
    j["log_file"] = log_file->string();
  }

  std::ofstream file(path);
  if (!file.is_open()) {
    spdlog::error("Cannot write config file {}", path.string());
    return;
  }
  file << j.dump(2);
}

std::optional<std::string> Config::map_anthropic_model(const std::string& model) const {
  auto it = anthropic_model_map.find(model);
  if (it != anthropic_model_map.end()) {
    return it->second;
  }
  return std::nullopt;
}

bool Config::is_chat_path(const std::string& path) const {
  return std::find(chat_paths.begin(), chat_paths.end(), path) != chat_paths.end();
}

bool Config::is_messages_path(const std::string& path) const {
  return std::find(messages_paths.begin(), messages_paths.end(), path) != messages_paths.end();
}

namespace config_paths {

fs::path home_dir() {
  const char* home = std::getenv("HOME");
  if (home) {
    return fs::path(home);
  }
#ifdef _WIN32
  const char* userprofile = std::getenv("USERPROFILE");
  if (userprofile) {
    return fs::path(userprofile);
  }
#endif
  return fs::current_path();
}

fs::path config_dir() {
  return home_dir() / ".config" / "llm-relay";
}

fs::path default_config_file() {
  return config_dir() / "config.json";
}

fs::path project_config_file() {
  return fs::current_path() / ".llm-relay" / "config.json";
}

}  // namespace config_paths

}  // namespace relay

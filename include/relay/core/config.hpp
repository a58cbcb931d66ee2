#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "relay/core/types.hpp"

namespace relay {

// Name of the model table as reported to callers
inline constexpr const char* kModelMapName = "ANTHROPIC_MODEL_MAP";

// Caller-facing Anthropic model id -> upstream gateway model id
std::map<std::string, std::string> default_anthropic_model_map();

json default_web_search_tool();

// Process configuration. Built once at start-up and passed by const reference.
struct Config {
  // Listener
  std::string listen_host = "0.0.0.0";
  int listen_port = 11731;
  int threads = 1;

  // Upstream gateway
  std::string openai_base_url = "https://zenmux.ai/api/v1";
  std::string anthropic_base_url = "https://zenmux.ai/api/anthropic";

  // Forward proxy (http://[user:pass@]host:port); unset = direct
  std::optional<std::string> proxy_url;

  // Fixed credential; empty = keep the caller's own
  std::string api_key;

  std::map<std::string, std::string> anthropic_model_map = default_anthropic_model_map();

  // Web search tool injection on the messages path
  bool enable_web_search = false;
  json web_search_tool = default_web_search_tool();

  // Routes
  std::vector<std::string> chat_paths = {"/v1/chat/completions", "/chat/completions"};
  std::vector<std::string> messages_paths = {"/v1/messages", "/messages"};

  // Pass-through drops "<strip_prefix>/" from the path when the base URL ends in "/<strip_prefix>"
  std::string strip_prefix = "v1";

  int model_not_mapped_status = 400;

  // Exchange ceiling in seconds, 0 = unbounded
  int upstream_timeout_seconds = 0;
  bool verify_tls = true;
  size_t max_body_bytes = 32 * 1024 * 1024;

  // Logging
  std::string log_level = "info";
  std::optional<std::filesystem::path> log_file;

  // Load from file
  static Config load(const std::filesystem::path& path);

  // Load default config from project/global config files
  static Config load_default();

  // Load config from environment variables, with file config as base
  // Reads: RELAY_LISTEN_HOST, RELAY_LISTEN_PORT, RELAY_THREADS,
  //        TARGET_BASE_URL, ANTHROPIC_BASE_URL, PROXY_URL, API_KEY,
  //        ENABLE_WEB_SEARCH (true/1/yes), RELAY_UPSTREAM_TIMEOUT,
  //        RELAY_LOG_LEVEL, RELAY_LOG_FILE
  static Config from_env();

  // Save to file
  void save(const std::filesystem::path& path) const;

  std::optional<std::string> map_anthropic_model(const std::string& model) const;

  bool is_chat_path(const std::string& path) const;

  bool is_messages_path(const std::string& path) const;
};

// Configuration paths
namespace config_paths {
std::filesystem::path home_dir();

std::filesystem::path config_dir();

std::filesystem::path default_config_file();

std::filesystem::path project_config_file();
}  // namespace config_paths

}  // namespace relay

#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace relay {

// Request bodies keep their key order through a rewrite
using json = nlohmann::ordered_json;

// Result type for operations that can fail
template <typename T, typename E = std::string>
struct Result {
  std::optional<T> value;
  std::optional<E> error;

  bool ok() const {
    return value.has_value();
  }

  bool failed() const {
    return error.has_value();
  }

  static Result success(T val) {
    return Result{std::move(val), std::nullopt};
  }

  static Result failure(E err) {
    return Result{std::nullopt, std::move(err)};
  }
};

// Upstream request/response shape selected by the route
enum class Dialect {
  OpenAiChat,         // /chat/completions
  AnthropicMessages,  // /messages
  PassThrough         // everything else, forwarded unchanged
};

std::string to_string(Dialect dialect);

// Observability record of one relayed stream
struct RelaySession {
  std::chrono::steady_clock::time_point started = std::chrono::steady_clock::now();
  uint64_t chunk_count = 0;
  uint64_t total_bytes = 0;

  int64_t elapsed_ms() const;
};

}  // namespace relay

#include "relay/core/types.hpp"

namespace relay {

std::string to_string(Dialect dialect) {
  switch (dialect) {
    case Dialect::OpenAiChat:
      return "openai_chat";
    case Dialect::AnthropicMessages:
      return "anthropic_messages";
    case Dialect::PassThrough:
      return "pass_through";
  }
  return "unknown";
}

int64_t RelaySession::elapsed_ms() const {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count();
}

}  // namespace relay

#include "header_sanitizer.hpp"

#include <set>

namespace relay::proxy {

namespace {

const std::set<std::string, CaseInsensitiveLess>& hop_by_hop_headers() {
  static const std::set<std::string, CaseInsensitiveLess> names = {
      "host",      "content-length", "connection", "accept-encoding", "transfer-encoding", "keep-alive",
      "proxy-connection", "proxy-authorization", "te", "trailer", "upgrade",
  };
  return names;
}

// Names listed in the Connection header are hop-by-hop as well (RFC 9110 7.6.1)
std::set<std::string, CaseInsensitiveLess> connection_tokens(const HeaderMap& headers) {
  std::set<std::string, CaseInsensitiveLess> tokens;
  auto [begin, end] = headers.equal_range("connection");
  for (auto it = begin; it != end; ++it) {
    const std::string& value = it->second;
    size_t pos = 0;
    while (pos <= value.size()) {
      size_t comma = value.find(',', pos);
      if (comma == std::string::npos) comma = value.size();
      std::string token = value.substr(pos, comma - pos);
      auto first = token.find_first_not_of(" \t");
      auto last = token.find_last_not_of(" \t");
      if (first != std::string::npos) {
        tokens.insert(token.substr(first, last - first + 1));
      }
      pos = comma + 1;
    }
  }
  return tokens;
}

}  // namespace

bool is_hop_by_hop_header(const std::string& name) {
  return hop_by_hop_headers().count(name) > 0;
}

HeaderMap sanitize_headers(const HeaderMap& inbound, const std::string& api_key, Dialect dialect) {
  auto listed = connection_tokens(inbound);

  HeaderMap out;
  for (const auto& [name, value] : inbound) {
    if (is_hop_by_hop_header(name) || listed.count(name) > 0) {
      continue;
    }
    out.emplace(name, value);
  }

  if (!api_key.empty()) {
    set_header(out, "authorization", "Bearer " + api_key);
    if (dialect == Dialect::AnthropicMessages) {
      set_header(out, "x-api-key", api_key);
    }
  }

  return out;
}

}  // namespace relay::proxy

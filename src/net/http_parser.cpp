#include "net/http_parser.hpp"

#include <cctype>
#include <limits>

#include "relay/net/errors.hpp"

namespace relay::net {

namespace {

std::string_view trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
  return s;
}

// Pops the next line (without CRLF) off the front of text
bool next_line(std::string_view& text, std::string_view& line) {
  if (text.empty()) return false;
  auto nl = text.find('\n');
  if (nl == std::string_view::npos) {
    line = text;
    text = {};
  } else {
    line = text.substr(0, nl);
    text.remove_prefix(nl + 1);
  }
  if (!line.empty() && line.back() == '\r') {
    line.remove_suffix(1);
  }
  return true;
}

bool is_token_char(char c) {
  if (std::isalnum(static_cast<unsigned char>(c))) return true;
  switch (c) {
    case '!': case '#': case '$': case '%': case '&': case '\'': case '*':
    case '+': case '-': case '.': case '^': case '_': case '`': case '|': case '~':
      return true;
    default:
      return false;
  }
}

// Control characters other than HTAB would split or corrupt a forwarded line
bool has_control_char(std::string_view s) {
  for (char c : s) {
    auto u = static_cast<unsigned char>(c);
    if ((u < 0x20 && c != '\t') || u == 0x7f) return true;
  }
  return false;
}

bool parse_version(std::string_view v, int& minor) {
  if (v.size() != 8 || v.substr(0, 7) != "HTTP/1.") return false;
  if (v[7] != '0' && v[7] != '1') return false;
  minor = v[7] - '0';
  return true;
}

std::error_code parse_header_lines(std::string_view rest, HeaderMap& headers) {
  std::string_view line;
  while (next_line(rest, line)) {
    if (line.empty()) break;
    // obsolete line folding is rejected
    if (line.front() == ' ' || line.front() == '\t') {
      return Error::bad_header;
    }
    auto colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0) {
      return Error::bad_header;
    }
    auto name = line.substr(0, colon);
    for (char c : name) {
      if (!is_token_char(c)) return Error::bad_header;
    }
    auto value = trim(line.substr(colon + 1));
    if (has_control_char(value)) {
      return Error::bad_header;
    }
    headers.emplace(std::string(name), std::string(value));
  }
  return {};
}

bool parse_uint(std::string_view s, uint64_t& out) {
  if (s.empty()) return false;
  uint64_t value = 0;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
    if (value > (std::numeric_limits<uint64_t>::max() - 9) / 10) return false;
    value = value * 10 + static_cast<uint64_t>(c - '0');
  }
  out = value;
  return true;
}

// Content-Length, rejecting conflicting duplicates
std::error_code content_length(const HeaderMap& headers, bool& present, uint64_t& length) {
  present = false;
  auto range = headers.equal_range("content-length");
  for (auto it = range.first; it != range.second; ++it) {
    uint64_t value = 0;
    if (!parse_uint(trim(it->second), value)) {
      return Error::bad_header;
    }
    if (present && value != length) {
      return Error::bad_header;
    }
    present = true;
    length = value;
  }
  return {};
}

// Whether chunked is the final transfer coding
bool is_chunked(const HeaderMap& headers, bool& has_transfer_encoding) {
  has_transfer_encoding = false;
  std::string last;
  auto range = headers.equal_range("transfer-encoding");
  for (auto it = range.first; it != range.second; ++it) {
    has_transfer_encoding = true;
    std::string_view value = it->second;
    auto comma = value.rfind(',');
    last = std::string(trim(comma == std::string_view::npos ? value : value.substr(comma + 1)));
  }
  return has_transfer_encoding && iequals(last, "chunked");
}

}  // namespace

std::error_code parse_request_head(std::string_view head, InboundRequest& out) {
  std::string_view line;
  if (!next_line(head, line)) {
    return Error::bad_request_line;
  }

  auto sp1 = line.find(' ');
  auto sp2 = line.rfind(' ');
  if (sp1 == std::string_view::npos || sp2 == sp1) {
    return Error::bad_request_line;
  }

  auto method = line.substr(0, sp1);
  auto target = line.substr(sp1 + 1, sp2 - sp1 - 1);
  auto version = line.substr(sp2 + 1);

  if (method.empty() || target.empty() || target.find(' ') != std::string_view::npos || has_control_char(target)) {
    return Error::bad_request_line;
  }
  for (char c : method) {
    if (!is_token_char(c)) return Error::bad_request_line;
  }
  if (!parse_version(version, out.version_minor)) {
    return Error::bad_request_line;
  }

  // absolute-form: keep only path and query
  auto scheme_end = target.find("://");
  if (target.front() != '/' && scheme_end != std::string_view::npos) {
    auto path_start = target.find('/', scheme_end + 3);
    target = path_start == std::string_view::npos ? std::string_view("/") : target.substr(path_start);
  }

  auto q = target.find('?');
  out.method = std::string(method);
  out.path = std::string(target.substr(0, q));
  out.query = q == std::string_view::npos ? std::string() : std::string(target.substr(q + 1));
  if (out.path.empty()) {
    out.path = "/";
  }

  return parse_header_lines(head, out.headers);
}

std::error_code parse_response_head(std::string_view head, ResponseHead& out) {
  std::string_view line;
  if (!next_line(head, line)) {
    return Error::bad_status_line;
  }

  auto sp1 = line.find(' ');
  if (sp1 == std::string_view::npos || !parse_version(line.substr(0, sp1), out.version_minor)) {
    return Error::bad_status_line;
  }

  auto rest = line.substr(sp1 + 1);
  auto sp2 = rest.find(' ');
  auto code = rest.substr(0, sp2);
  uint64_t status = 0;
  if (code.size() != 3 || !parse_uint(code, status) || status < 100) {
    return Error::bad_status_line;
  }
  out.status_code = static_cast<int>(status);
  out.reason = sp2 == std::string_view::npos ? std::string() : std::string(rest.substr(sp2 + 1));

  return parse_header_lines(head, out.headers);
}

std::error_code request_body_framing(const HeaderMap& headers, BodyFraming& framing, uint64_t& length) {
  bool has_te = false;
  if (is_chunked(headers, has_te)) {
    framing = BodyFraming::Chunked;
    return {};
  }
  if (has_te) {
    return Error::bad_header;
  }

  bool present = false;
  if (auto ec = content_length(headers, present, length)) {
    return ec;
  }
  framing = present && length > 0 ? BodyFraming::Length : BodyFraming::None;
  return {};
}

std::error_code response_body_framing(const std::string& request_method, const ResponseHead& head, BodyFraming& framing,
                                      uint64_t& length) {
  if (request_method == "HEAD" || head.status_code < 200 || head.status_code == 204 || head.status_code == 304) {
    framing = BodyFraming::None;
    return {};
  }

  bool has_te = false;
  if (is_chunked(head.headers, has_te)) {
    framing = BodyFraming::Chunked;
    return {};
  }
  if (has_te) {
    framing = BodyFraming::UntilClose;
    return {};
  }

  bool present = false;
  if (auto ec = content_length(head.headers, present, length)) {
    return ec;
  }
  if (!present) {
    framing = BodyFraming::UntilClose;
  } else {
    framing = length > 0 ? BodyFraming::Length : BodyFraming::None;
  }
  return {};
}

}  // namespace relay::net

#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace relay {

// Orders header names without regard to ASCII case
struct CaseInsensitiveLess {
  using is_transparent = void;

  bool operator()(std::string_view a, std::string_view b) const;
};

// HTTP header fields. Names compare case-insensitively, a name may repeat,
// and fields with the same name keep their arrival order.
using HeaderMap = std::multimap<std::string, std::string, CaseInsensitiveLess>;

bool iequals(std::string_view a, std::string_view b);

// First value stored under name, if any
std::optional<std::string> find_header(const HeaderMap& headers, std::string_view name);

// Replace every field named name by a single field
void set_header(HeaderMap& headers, const std::string& name, std::string value);

void erase_header(HeaderMap& headers, std::string_view name);

// Whether the comma separated header value contains token (case-insensitive)
bool header_has_token(const HeaderMap& headers, std::string_view name, std::string_view token);

}  // namespace relay

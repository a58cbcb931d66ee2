#include "relay/core/headers.hpp"

#include <algorithm>
#include <cctype>

namespace relay {

namespace {

unsigned char lower(char c) {
  return static_cast<unsigned char>(std::tolower(static_cast<unsigned char>(c)));
}

std::string_view trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
  return s;
}

}  // namespace

bool CaseInsensitiveLess::operator()(std::string_view a, std::string_view b) const {
  return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
    return lower(x) < lower(y);
  });
}

bool iequals(std::string_view a, std::string_view b) {
  return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return lower(x) == lower(y);
         });
}

std::optional<std::string> find_header(const HeaderMap& headers, std::string_view name) {
  auto it = headers.find(name);
  if (it == headers.end()) {
    return std::nullopt;
  }
  return it->second;
}

void set_header(HeaderMap& headers, const std::string& name, std::string value) {
  erase_header(headers, name);
  headers.emplace(name, std::move(value));
}

void erase_header(HeaderMap& headers, std::string_view name) {
  auto range = headers.equal_range(name);
  headers.erase(range.first, range.second);
}

bool header_has_token(const HeaderMap& headers, std::string_view name, std::string_view token) {
  auto range = headers.equal_range(name);
  for (auto it = range.first; it != range.second; ++it) {
    std::string_view value = it->second;
    while (!value.empty()) {
      auto comma = value.find(',');
      auto item = trim(value.substr(0, comma));
      if (iequals(item, token)) {
        return true;
      }
      if (comma == std::string_view::npos) break;
      value.remove_prefix(comma + 1);
    }
  }
  return false;
}

}  // namespace relay

#pragma once

#include <cctype>
#include <cstddef>
#include <cstdio>
#include <string>
#include <string_view>

namespace witkit::common {

// Escape a string for use inside a JSON string literal.
inline auto EscapeForJsonString(std::string_view s) -> std::string {
  std::string result;
  result.reserve(s.size() + (s.size() / 10));  // Estimate some escapes
  for (char c : s) {
    switch (c) {
      case '\\':
        result += "\\\\";
        break;
      case '"':
        result += "\\\"";
        break;
      case '\n':
        result += "\\n";
        break;
      case '\r':
        result += "\\r";
        break;
      case '\t':
        result += "\\t";
        break;
      case '\b':
        result += "\\b";
        break;
      case '\f':
        result += "\\f";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(
              buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
          result += buf;
        } else {
          result += c;
        }
        break;
    }
  }
  return result;
}

// Upper-case the first character, leave the rest untouched ("pending" ->
// "Pending", "ok-value" -> "Ok-value").
inline auto Capitalize(std::string_view s) -> std::string {
  std::string result(s);
  if (!result.empty()) {
    result[0] = static_cast<char>(
        std::toupper(static_cast<unsigned char>(result[0])));
  }
  return result;
}

// WIT identifiers are kebab-case; the export listing shows them as
// camelCase. Only a dash followed by a lower-case letter is folded.
inline auto KebabToCamel(std::string_view s) -> std::string {
  std::string result;
  result.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    char c = s[i];
    if (c == '-' && i + 1 < s.size() &&
        std::islower(static_cast<unsigned char>(s[i + 1])) != 0) {
      result += static_cast<char>(
          std::toupper(static_cast<unsigned char>(s[i + 1])));
      ++i;
      continue;
    }
    result += c;
  }
  return result;
}

inline auto ContainsIgnoreCase(std::string_view haystack, std::string_view needle)
    -> bool {
  if (needle.empty()) {
    return true;
  }
  if (needle.size() > haystack.size()) {
    return false;
  }
  auto lower = [](char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  };
  for (size_t start = 0; start + needle.size() <= haystack.size(); ++start) {
    bool match = true;
    for (size_t i = 0; i < needle.size(); ++i) {
      if (lower(haystack[start + i]) != lower(needle[i])) {
        match = false;
        break;
      }
    }
    if (match) {
      return true;
    }
  }
  return false;
}

}  // namespace witkit::common

#include "smoke/common/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>

namespace smoke::common {

auto DashCase(std::string_view id) -> std::string {
  std::string result(id);
  std::ranges::replace(result, '_', '-');
  return result;
}

auto UnderscoreCase(std::string_view name) -> std::string {
  std::string result(name);
  std::ranges::replace(result, '-', '_');
  return result;
}

auto Slugify(std::string_view text) -> std::string {
  std::string result;
  result.reserve(text.size());
  bool pending_separator = false;
  for (char c : Trim(text)) {
    auto uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc) != 0) {
      if (pending_separator && !result.empty()) {
        result += '_';
      }
      pending_separator = false;
      result += static_cast<char>(std::tolower(uc));
    } else {
      pending_separator = true;
    }
  }
  return result;
}

auto HumanizeId(std::string_view id) -> std::string {
  std::string result(id);
  std::ranges::replace(result, '_', ' ');
  if (!result.empty()) {
    result[0] = static_cast<char>(
        std::toupper(static_cast<unsigned char>(result[0])));
  }
  return result;
}

auto StripAnsi(std::string_view text) -> std::string {
  std::string result;
  result.reserve(text.size());
  size_t i = 0;
  while (i < text.size()) {
    if (text[i] == '\x1b' && i + 1 < text.size() && text[i + 1] == '[') {
      size_t j = i + 2;
      while (j < text.size() &&
             (std::isdigit(static_cast<unsigned char>(text[j])) != 0 ||
              text[j] == ';')) {
        ++j;
      }
      if (j < text.size() && text[j] == 'm') {
        i = j + 1;
        continue;
      }
    }
    result += text[i];
    ++i;
  }
  return result;
}

auto Utf8Prefix(std::string_view text, size_t max_bytes) -> std::string_view {
  if (text.size() <= max_bytes) {
    return text;
  }
  // Back off over continuation bytes (10xxxxxx) to the lead byte of the
  // sequence that straddles the limit, and cut before it.
  size_t end = max_bytes;
  while (end > 0 &&
         (static_cast<unsigned char>(text[end]) & 0xC0U) == 0x80U) {
    --end;
  }
  return text.substr(0, end);
}

auto Truncate(std::string_view text, size_t max_length) -> std::string {
  if (text.size() <= max_length) {
    return std::string(text);
  }
  std::string result(Utf8Prefix(text, max_length));
  result += "...";
  return result;
}

auto Trim(std::string_view text) -> std::string_view {
  auto start = text.find_first_not_of(" \t\r\n");
  if (start == std::string_view::npos) {
    return {};
  }
  auto end = text.find_last_not_of(" \t\r\n");
  return text.substr(start, end - start + 1);
}

auto TrimTrailingSlashes(std::string_view url) -> std::string {
  while (!url.empty() && url.back() == '/') {
    url.remove_suffix(1);
  }
  return std::string(url);
}

auto EscapeXml(std::string_view text) -> std::string {
  std::string result;
  result.reserve(text.size() + (text.size() / 10));
  for (char c : text) {
    switch (c) {
      case '&':
        result += "&amp;";
        break;
      case '<':
        result += "&lt;";
        break;
      case '>':
        result += "&gt;";
        break;
      case '"':
        result += "&quot;";
        break;
      case '\'':
        result += "&apos;";
        break;
      default:
        result += c;
        break;
    }
  }
  return result;
}

auto RemoveInvalidXmlChars(std::string_view text) -> std::string {
  std::string result;
  result.reserve(text.size());
  for (char c : text) {
    auto uc = static_cast<unsigned char>(c);
    bool allowed_control = c == '\t' || c == '\n' || c == '\r';
    if ((uc < 0x20 && !allowed_control) || uc == 0x7F) {
      continue;
    }
    result += c;
  }
  return result;
}

}  // namespace smoke::common

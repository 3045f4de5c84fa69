#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace smoke::common {

// Suite id <-> spec file naming. Suite ids are lower_snake_case; spec files
// and directories use the same string with '_' replaced by '-'.
auto DashCase(std::string_view id) -> std::string;
auto UnderscoreCase(std::string_view name) -> std::string;

// Lowercase, collapse every run of non-alphanumerics to '_', trim '_' at both
// ends. "Core Pages!" -> "core_pages".
auto Slugify(std::string_view text) -> std::string;

// "agency_seo" -> "Agency seo"
auto HumanizeId(std::string_view id) -> std::string;

// Remove ANSI SGR sequences (ESC '[' [0-9;]* 'm').
auto StripAnsi(std::string_view text) -> std::string;

// Longest prefix of at most max_bytes that does not end inside a UTF-8
// multibyte sequence.
auto Utf8Prefix(std::string_view text, size_t max_bytes) -> std::string_view;

// Returns text unchanged when it fits, otherwise Utf8Prefix(text, max_length)
// followed by "...".
auto Truncate(std::string_view text, size_t max_length) -> std::string;

auto Trim(std::string_view text) -> std::string_view;
auto TrimTrailingSlashes(std::string_view url) -> std::string;

// Escape &, <, >, " and ' for use inside an XML attribute or text node.
auto EscapeXml(std::string_view text) -> std::string;

// Drop control characters that are not allowed in XML 1.0 documents
// (everything below 0x20 except tab, LF and CR, plus DEL).
auto RemoveInvalidXmlChars(std::string_view text) -> std::string;

}  // namespace smoke::common

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace code_intelligence {

// Cuts at `length` bytes without splitting a multi-byte sequence.
std::string utf8_safe_substr(const std::string& str, size_t length);

// Replaces invalid UTF-8 bytes so the text can be serialized as JSON.
std::string sanitize_utf8(const std::string& str);

// Collapses whitespace runs into one space and trims both ends.
std::string collapse_whitespace(const std::string& text);

std::string trim(const std::string& s);

bool starts_with(std::string_view s, std::string_view prefix);
bool ends_with(std::string_view s, std::string_view suffix);

std::vector<std::string> split_lines(const std::string& content);
std::vector<std::string> split(const std::string& s, char delim);

uint64_t fnv1a_64(std::string_view data);

// Identifier-aware tokenization: splits on non-alphanumerics and on
// camelCase / snake_case boundaries, lowercased.
std::vector<std::string> identifier_tokens(const std::string& text);

// fnmatch-style glob with '*' and '?'.
bool glob_match(std::string_view pattern, std::string_view text);

} // namespace code_intelligence

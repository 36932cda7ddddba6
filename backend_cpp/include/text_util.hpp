#pragma once
#include <string>

namespace code_query {

// First `length` bytes of str, shortened so no UTF-8 sequence is cut in half.
std::string utf8_safe_substr(const std::string& str, size_t length);

// Last `length` bytes of str, starting on a UTF-8 sequence boundary.
std::string utf8_safe_suffix(const std::string& str, size_t length);

std::string to_lower(std::string s);

std::string trim(const std::string& s);

} // namespace code_query

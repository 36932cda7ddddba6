#include "text_util.hpp"
#include <algorithm>
#include <cctype>

namespace code_query {

std::string utf8_safe_substr(const std::string& str, size_t length) {
    if (str.length() <= length) return str;
    std::string sub = str.substr(0, length);
    // Drop a trailing lead byte and any continuation bytes that lost their tail.
    size_t back = 0;
    while (back < sub.size() && back < 4) {
        unsigned char c = static_cast<unsigned char>(sub[sub.size() - 1 - back]);
        if (c < 0x80) return sub;
        if (c >= 0xC0) {
            size_t need = (c >= 0xF0) ? 4 : (c >= 0xE0) ? 3 : 2;
            if (back + 1 < need) sub.resize(sub.size() - 1 - back);
            return sub;
        }
        ++back;
    }
    return sub;
}

std::string utf8_safe_suffix(const std::string& str, size_t length) {
    if (str.length() <= length) return str;
    size_t start = str.length() - length;
    while (start < str.length() && (static_cast<unsigned char>(str[start]) & 0xC0) == 0x80) {
        ++start;
    }
    return str.substr(start);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    auto a = s.find_first_not_of(" \t\r\n");
    auto b = s.find_last_not_of(" \t\r\n");
    if (a == std::string::npos) return "";
    return s.substr(a, b - a + 1);
}

} // namespace code_query

#pragma once

#include <string>

// Strict base-10 integer parse: surrounding whitespace and a leading sign are
// accepted, anything else (trailing garbage, empty input, overflow) fails.
bool parse_int(const std::string& s, int& out);

// Lower-case ASCII letters.
std::string to_lower(std::string s);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

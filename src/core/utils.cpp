#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

bool parse_int(const std::string& s, int& out) {
    std::string text = s;
    trim(text);
    if (text.empty()) return false;

    try {
        size_t pos = 0;
        int value = std::stoi(text, &pos, 10);
        if (pos != text.size()) return false;
        out = value;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

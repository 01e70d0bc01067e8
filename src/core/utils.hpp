#pragma once

#include <string>
#include <vector>

// Split text into lines, each keeping its trailing '\n' (the last may lack one).
std::vector<std::string> split_lines_keep_newline(const std::string& text);

// Join strings with a separator.
std::string join(const std::vector<std::string>& parts, const std::string& sep);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

inline std::string trimmed(std::string s) {
    trim(s);
    return s;
}

inline bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

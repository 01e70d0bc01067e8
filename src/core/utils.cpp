#include "utils.hpp"

std::vector<std::string> split_lines_keep_newline(const std::string& text) {
    std::vector<std::string> lines;
    size_t pos = 0;
    size_t newline_pos;
    while ((newline_pos = text.find('\n', pos)) != std::string::npos) {
        lines.push_back(text.substr(pos, newline_pos - pos + 1));
        pos = newline_pos + 1;
    }
    // Remaining partial line
    if (pos < text.size()) {
        lines.push_back(text.substr(pos));
    }
    return lines;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

#include "script_guard.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <vector>

namespace {

enum class ScanState {
    ScanningDirectives,
    FoundInsertionPoint,
};

} // namespace

std::string isolation_guard(const std::string& image, const std::string& runtime) {
    return fmt::format(GUARD_TEMPLATE, CONTAINER_SENTINEL, runtime, image);
}

bool is_directive_line(const std::string& line, const std::string& options_identifier) {
    if (options_identifier.empty()) return false;
    std::string t = trimmed(line);
    return !t.empty() && t[0] == '#' && t.find(options_identifier, 1) != std::string::npos;
}

std::string inject_isolation_guard(const std::string& script,
                                   const std::string& options_identifier,
                                   const std::string& guard) {
    auto lines = split_lines_keep_newline(script);

    // One past the last directive line anywhere in the script
    size_t directive_end = 0;
    for (size_t i = 0; i < lines.size(); i++) {
        if (is_directive_line(lines[i], options_identifier)) directive_end = i + 1;
    }

    ScanState state = ScanState::ScanningDirectives;
    size_t insert_at = lines.size();
    for (size_t i = 0; i < lines.size() && state == ScanState::ScanningDirectives; i++) {
        std::string line = trimmed(lines[i]);

        // First real statement: guard must precede it
        if (!line.empty() && line[0] != '#') {
            insert_at = i;
            state = ScanState::FoundInsertionPoint;
            continue;
        }

        bool directive_ahead = options_identifier.empty() || i + 1 < directive_end;
        if (!directive_ahead) {
            insert_at = i + 1;
            state = ScanState::FoundInsertionPoint;
        }
    }

    std::string out;
    out.reserve(script.size() + guard.size() + 1);
    for (size_t i = 0; i < insert_at; i++) out += lines[i];
    if (!out.empty() && out.back() != '\n') out += '\n';
    out += guard;
    for (size_t i = insert_at; i < lines.size(); i++) out += lines[i];
    return out;
}

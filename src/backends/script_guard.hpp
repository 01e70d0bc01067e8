#pragma once

#include <string>
#include <core/constants.hpp>

// Container isolation guard: re-executes the script inside `image` unless the
// sentinel variable shows it already runs there, then exits with its status.
std::string isolation_guard(const std::string& image,
                            const std::string& runtime = DEFAULT_CONTAINER_RUNTIME);

// A comment line carrying a scheduler option, e.g. "#SBATCH --time=1:00:00".
// Leading whitespace is ignored, so an indented "  #SBATCH" matches even though
// sbatch itself only reads directives at column 0; the guard then still lands
// below it. Always false for an empty identifier.
bool is_directive_line(const std::string& line, const std::string& options_identifier);

// Insert `guard` after the last leading directive line and before the first
// statement. Directive lines stay contiguous at the top so the scheduler still
// parses them. Every other line is kept byte for byte.
//
// With an empty identifier there are no directives: comment and blank lines
// are skipped and the guard goes before the first statement.
std::string inject_isolation_guard(const std::string& script,
                                   const std::string& options_identifier,
                                   const std::string& guard);

#pragma once

#include <string>

// Ask a yes/no question on the terminal (readline). Only "y"/"yes" consent;
// an empty answer or EOF declines.
bool prompt_decision(const std::string& question);

// True for answers that count as consent ("y", "yes", any case, surrounding blanks ignored).
bool is_affirmative(const std::string& answer);

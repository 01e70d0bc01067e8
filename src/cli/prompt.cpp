#include "prompt.hpp"
#include "theme.hpp"
#include <core/utils.hpp>
#include <readline/readline.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>

bool is_affirmative(const std::string& answer) {
    std::string a = trimmed(answer);
    std::transform(a.begin(), a.end(), a.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return a == "y" || a == "yes";
}

bool prompt_decision(const std::string& question) {
    std::string prompt = theme::rl_esc(theme::color::BROWN) + "    " + question + " [y/N] "
                       + theme::rl_esc(theme::color::RESET);

    char* raw = readline(prompt.c_str());
    if (!raw) {
        std::cout << "\n";
        return false;  // EOF / Ctrl-D
    }

    std::string answer = raw;
    free(raw);
    return is_affirmative(answer);
}

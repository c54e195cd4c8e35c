// readline.cpp - Wrapper for the editline library
//
// This file isolates all editline dependencies. Only the console
// executable links it; the interpreter core never reads the terminal.

#include "tinybasic/readline.hpp"
#include <cstdlib>

#include <editline/readline.h>

namespace tinybasic {

void readline_init() {
    // Keep the history bounded for long sessions
    stifle_history(500);
}

std::string readline_getline(const char* prompt) {
    char* line = readline(prompt);
    if (line == nullptr) {
        return std::string("\x04");  // EOF marker
    }
    std::string result(line);
    free(line);
    return result;
}

void readline_add_history(const std::string& line) {
    if (!line.empty()) {
        add_history(line.c_str());
    }
}

} // namespace tinybasic

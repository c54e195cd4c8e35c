#pragma once

#include <string>

namespace tinybasic {

// Initialize the readline subsystem (call once at startup)
void readline_init();

// Read a line with optional prompt
// Returns the line read, or "\x04" on EOF (Ctrl+D)
std::string readline_getline(const char* prompt = "");

// Add a line to the history
void readline_add_history(const std::string& line);

} // namespace tinybasic

#pragma once

#include <vector>
#include <string>
#include "tokens.hpp"

namespace tinybasic {

// Largest line number a program may use
constexpr long MAX_LINE_NUMBER = 65529;

class Lexer {
public:
    // source_line is only used to locate errors (0 when unknown)
    explicit Lexer(const std::string& source, int source_line = 0);

    // Tokenize the line; the result always ends with END_OF_FILE
    std::vector<Token> tokenize();

private:
    std::string source_;
    size_t pos_ = 0;
    int line_;
    int column_ = 1;

    // Character access
    char current() const;
    char advance();
    bool at_end() const;

    // Whitespace handling
    void skip_whitespace();

    // Token readers
    Token read_number();
    Token read_string();
    Token read_identifier();
    Token read_line_number();
    std::string read_comment();

    // Helper to uppercase a string
    static std::string to_upper(const std::string& s);
};

// Convenience function
std::vector<Token> tokenize(const std::string& source, int source_line = 0);

} // namespace tinybasic

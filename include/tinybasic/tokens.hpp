#pragma once

#include <string>

namespace tinybasic {

enum class TokenType {
    // Literals
    NUMBER,
    STRING,

    // Identifiers (variable letters)
    IDENTIFIER,

    // Keywords - Statements
    PRINT,
    IF,
    THEN,
    INPUT,
    LET,
    GOTO,
    GOSUB,
    RETURN,
    END,
    REM,
    CLS,

    // Keywords - Direct mode commands
    LIST,
    RUN,
    NEW,
    HELP,
    LOAD,
    SAVE,

    // Operators - Arithmetic
    PLUS,
    MINUS,
    MULTIPLY,
    DIVIDE,

    // Operators - Relational
    EQUAL,
    NOT_EQUAL,
    LESS_THAN,
    GREATER_THAN,
    LESS_EQUAL,
    GREATER_EQUAL,

    // Delimiters
    LPAREN,
    RPAREN,
    COMMA,

    // Special
    LINE_NUMBER,
    END_OF_FILE
};

struct Token {
    TokenType type;
    std::string value;       // Normalized value (uppercase for identifiers/keywords)
    int column;

    Token() : type(TokenType::END_OF_FILE), column(0) {}

    Token(TokenType t, std::string v, int c)
        : type(t), value(std::move(v)), column(c) {}
};

// Check if a string is a keyword
bool is_keyword(const std::string& s);

// Get TokenType for a keyword (returns IDENTIFIER if not found)
TokenType keyword_type(const std::string& s);

// Token type to string (for diagnostics)
std::string token_type_name(TokenType t);

// Human readable description of a token for error messages
std::string describe_token(const Token& tok);

} // namespace tinybasic

#pragma once

#include <stdexcept>
#include <string>

namespace tinybasic {

enum class ErrorKind {
    LEX,
    PARSE,
    RUNTIME
};

// Base class for all TinyBasic errors
class TinyBasicError : public std::runtime_error {
public:
    ErrorKind kind;
    int line;      // Source line for lex/parse errors, BASIC line number at runtime (0 = direct)
    int column;

    TinyBasicError(ErrorKind k, const std::string& msg, int l = 0, int c = 0)
        : std::runtime_error(msg), kind(k), line(l), column(c) {}
};

// Lexer errors
class LexerError : public TinyBasicError {
public:
    LexerError(const std::string& msg, int l, int c)
        : TinyBasicError(ErrorKind::LEX, "Lexer error at " + location(l, c) + ": " + msg, l, c) {}

    static std::string location(int l, int c) {
        if (l > 0) return std::to_string(l) + ":" + std::to_string(c);
        return "column " + std::to_string(c);
    }
};

// Parser errors
class ParseError : public TinyBasicError {
public:
    ParseError(const std::string& msg, int l, int c)
        : TinyBasicError(ErrorKind::PARSE, "Syntax error at " + LexerError::location(l, c) + ": " + msg, l, c) {}
};

// Runtime errors with numeric error codes
class RuntimeError : public TinyBasicError {
public:
    int error_code;

    RuntimeError(int code, const std::string& msg, int l = 0)
        : TinyBasicError(ErrorKind::RUNTIME, msg, l, 0), error_code(code) {}
};

// Error codes (numbering follows MBASIC where a counterpart exists)
namespace ErrorCode {
    constexpr int RETURN_WITHOUT_GOSUB = 3;
    constexpr int OVERFLOW_ERROR = 6;
    constexpr int UNDEFINED_LINE = 8;
    constexpr int DIVISION_BY_ZERO = 11;
    constexpr int INVALID_INPUT = 13;
    constexpr int FILE_NOT_FOUND = 53;
    constexpr int DISK_IO_ERROR = 57;
}

// Get error message for error code
inline std::string error_message(int code) {
    switch (code) {
        case ErrorCode::RETURN_WITHOUT_GOSUB: return "RETURN without GOSUB";
        case ErrorCode::OVERFLOW_ERROR: return "Overflow";
        case ErrorCode::UNDEFINED_LINE: return "Undefined line number";
        case ErrorCode::DIVISION_BY_ZERO: return "Division by zero";
        case ErrorCode::INVALID_INPUT: return "Invalid input";
        case ErrorCode::FILE_NOT_FOUND: return "File not found";
        case ErrorCode::DISK_IO_ERROR: return "Disk I/O error";
        default: return "Unknown error";
    }
}

} // namespace tinybasic

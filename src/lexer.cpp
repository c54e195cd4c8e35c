#include "tinybasic/lexer.hpp"
#include "tinybasic/error.hpp"
#include <cctype>
#include <cstdlib>
#include <cerrno>
#include <cstdint>
#include <algorithm>
#include <limits>

namespace tinybasic {

Lexer::Lexer(const std::string& source, int source_line)
    : source_(source), line_(source_line) {}

char Lexer::current() const {
    if (pos_ >= source_.size()) return '\0';
    return source_[pos_];
}

char Lexer::advance() {
    if (pos_ >= source_.size()) return '\0';
    column_++;
    return source_[pos_++];
}

bool Lexer::at_end() const {
    return pos_ >= source_.size();
}

void Lexer::skip_whitespace() {
    while (!at_end() && (current() == ' ' || current() == '\t' ||
                         current() == '\r' || current() == '\n')) {
        advance();
    }
}

std::string Lexer::to_upper(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return result;
}

Token Lexer::read_number() {
    int start_col = column_;
    std::string num_str;

    while (!at_end() && std::isdigit(static_cast<unsigned char>(current()))) {
        num_str += advance();
    }

    errno = 0;
    long long value = std::strtoll(num_str.c_str(), nullptr, 10);
    if (errno == ERANGE || value > std::numeric_limits<std::int32_t>::max()) {
        throw LexerError("Number out of range: " + num_str, line_, start_col);
    }

    // Normalize away leading zeros
    return Token(TokenType::NUMBER, std::to_string(value), start_col);
}

Token Lexer::read_string() {
    int start_col = column_;

    advance();  // Skip opening quote
    std::string str_val;

    while (!at_end() && current() != '"') {
        if (current() == '\n' || current() == '\r') {
            throw LexerError("Unterminated string", line_, column_);
        }
        str_val += advance();
    }

    if (at_end()) {
        throw LexerError("Unterminated string", line_, column_);
    }

    advance();  // Skip closing quote
    return Token(TokenType::STRING, str_val, start_col);
}

Token Lexer::read_identifier() {
    int start_col = column_;
    std::string ident;

    while (!at_end() && std::isalpha(static_cast<unsigned char>(current()))) {
        ident += advance();
    }

    std::string ident_upper = to_upper(ident);

    // Check if it's a keyword
    if (is_keyword(ident_upper)) {
        return Token(keyword_type(ident_upper), ident_upper, start_col);
    }

    return Token(TokenType::IDENTIFIER, ident_upper, start_col);
}

Token Lexer::read_line_number() {
    int start_col = column_;
    std::string num_str;

    while (!at_end() && std::isdigit(static_cast<unsigned char>(current()))) {
        num_str += advance();
    }

    errno = 0;
    long line_num = std::strtol(num_str.c_str(), nullptr, 10);
    if (errno == ERANGE || line_num < 1 || line_num > MAX_LINE_NUMBER) {
        throw LexerError("Line number " + num_str + " must be between 1 and " +
                         std::to_string(MAX_LINE_NUMBER), line_, start_col);
    }

    return Token(TokenType::LINE_NUMBER, std::to_string(line_num), start_col);
}

std::string Lexer::read_comment() {
    std::string comment;
    while (!at_end() && current() != '\n' && current() != '\r') {
        comment += advance();
    }
    // Trim leading/trailing whitespace
    size_t start = comment.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = comment.find_last_not_of(" \t");
    return comment.substr(start, end - start + 1);
}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> tokens;
    bool at_line_start = true;

    while (!at_end()) {
        skip_whitespace();
        if (at_end()) break;

        int start_col = column_;
        char c = current();

        // Line number at start of line
        if (at_line_start && std::isdigit(static_cast<unsigned char>(c))) {
            tokens.push_back(read_line_number());
            at_line_start = false;
            continue;
        }
        at_line_start = false;

        if (std::isdigit(static_cast<unsigned char>(c))) {
            tokens.push_back(read_number());
            continue;
        }

        if (c == '"') {
            tokens.push_back(read_string());
            continue;
        }

        // Identifiers and keywords
        if (std::isalpha(static_cast<unsigned char>(c))) {
            Token tok = read_identifier();
            // REM swallows the rest of the line as its comment
            if (tok.type == TokenType::REM) {
                tok.value = read_comment();
            }
            tokens.push_back(tok);
            continue;
        }

        // Operators and delimiters
        switch (c) {
            case '+':
                tokens.push_back(Token(TokenType::PLUS, "+", start_col));
                advance();
                break;
            case '-':
                tokens.push_back(Token(TokenType::MINUS, "-", start_col));
                advance();
                break;
            case '*':
                tokens.push_back(Token(TokenType::MULTIPLY, "*", start_col));
                advance();
                break;
            case '/':
                tokens.push_back(Token(TokenType::DIVIDE, "/", start_col));
                advance();
                break;
            case '=':
                tokens.push_back(Token(TokenType::EQUAL, "=", start_col));
                advance();
                break;
            case '<':
                advance();
                if (current() == '>') {
                    tokens.push_back(Token(TokenType::NOT_EQUAL, "<>", start_col));
                    advance();
                } else if (current() == '=') {
                    tokens.push_back(Token(TokenType::LESS_EQUAL, "<=", start_col));
                    advance();
                } else {
                    tokens.push_back(Token(TokenType::LESS_THAN, "<", start_col));
                }
                break;
            case '>':
                advance();
                if (current() == '<') {
                    tokens.push_back(Token(TokenType::NOT_EQUAL, "><", start_col));
                    advance();
                } else if (current() == '=') {
                    tokens.push_back(Token(TokenType::GREATER_EQUAL, ">=", start_col));
                    advance();
                } else {
                    tokens.push_back(Token(TokenType::GREATER_THAN, ">", start_col));
                }
                break;
            case '(':
                tokens.push_back(Token(TokenType::LPAREN, "(", start_col));
                advance();
                break;
            case ')':
                tokens.push_back(Token(TokenType::RPAREN, ")", start_col));
                advance();
                break;
            case ',':
                tokens.push_back(Token(TokenType::COMMA, ",", start_col));
                advance();
                break;
            default:
                if (std::isprint(static_cast<unsigned char>(c))) {
                    throw LexerError(std::string("Unexpected character: '") + c + "'",
                                     line_, start_col);
                }
                throw LexerError("Unexpected character code " +
                                 std::to_string(static_cast<unsigned char>(c)),
                                 line_, start_col);
        }
    }

    // Add EOF token
    tokens.push_back(Token(TokenType::END_OF_FILE, "", column_));
    return tokens;
}

std::vector<Token> tokenize(const std::string& source, int source_line) {
    Lexer lexer(source, source_line);
    return lexer.tokenize();
}

} // namespace tinybasic

#include "tinybasic/tokens.hpp"
#include <unordered_map>

namespace tinybasic {

// Static keyword table
static const std::unordered_map<std::string, TokenType> keywords = {
    // Statements
    {"PRINT", TokenType::PRINT},
    {"IF", TokenType::IF},
    {"THEN", TokenType::THEN},
    {"INPUT", TokenType::INPUT},
    {"LET", TokenType::LET},
    {"GOTO", TokenType::GOTO},
    {"GOSUB", TokenType::GOSUB},
    {"RETURN", TokenType::RETURN},
    {"END", TokenType::END},
    {"REM", TokenType::REM},
    {"CLS", TokenType::CLS},

    // Direct mode commands
    {"LIST", TokenType::LIST},
    {"RUN", TokenType::RUN},
    {"NEW", TokenType::NEW},
    {"HELP", TokenType::HELP},
    {"LOAD", TokenType::LOAD},
    {"SAVE", TokenType::SAVE},
};

bool is_keyword(const std::string& s) {
    return keywords.find(s) != keywords.end();
}

TokenType keyword_type(const std::string& s) {
    auto it = keywords.find(s);
    return (it != keywords.end()) ? it->second : TokenType::IDENTIFIER;
}

std::string token_type_name(TokenType t) {
    switch (t) {
        case TokenType::NUMBER: return "NUMBER";
        case TokenType::STRING: return "STRING";
        case TokenType::IDENTIFIER: return "IDENTIFIER";
        case TokenType::PRINT: return "PRINT";
        case TokenType::IF: return "IF";
        case TokenType::THEN: return "THEN";
        case TokenType::INPUT: return "INPUT";
        case TokenType::LET: return "LET";
        case TokenType::GOTO: return "GOTO";
        case TokenType::GOSUB: return "GOSUB";
        case TokenType::RETURN: return "RETURN";
        case TokenType::END: return "END";
        case TokenType::REM: return "REM";
        case TokenType::CLS: return "CLS";
        case TokenType::LIST: return "LIST";
        case TokenType::RUN: return "RUN";
        case TokenType::NEW: return "NEW";
        case TokenType::HELP: return "HELP";
        case TokenType::LOAD: return "LOAD";
        case TokenType::SAVE: return "SAVE";
        case TokenType::PLUS: return "PLUS";
        case TokenType::MINUS: return "MINUS";
        case TokenType::MULTIPLY: return "MULTIPLY";
        case TokenType::DIVIDE: return "DIVIDE";
        case TokenType::EQUAL: return "EQUAL";
        case TokenType::NOT_EQUAL: return "NOT_EQUAL";
        case TokenType::LESS_THAN: return "LESS_THAN";
        case TokenType::GREATER_THAN: return "GREATER_THAN";
        case TokenType::LESS_EQUAL: return "LESS_EQUAL";
        case TokenType::GREATER_EQUAL: return "GREATER_EQUAL";
        case TokenType::LPAREN: return "LPAREN";
        case TokenType::RPAREN: return "RPAREN";
        case TokenType::COMMA: return "COMMA";
        case TokenType::LINE_NUMBER: return "LINE_NUMBER";
        case TokenType::END_OF_FILE: return "EOF";
        default: return "UNKNOWN";
    }
}

std::string describe_token(const Token& tok) {
    switch (tok.type) {
        case TokenType::END_OF_FILE: return "end of line";
        case TokenType::STRING: return "string \"" + tok.value + "\"";
        case TokenType::NUMBER:
        case TokenType::LINE_NUMBER:
            return "number " + tok.value;
        case TokenType::IDENTIFIER: return "identifier " + tok.value;
        default: return "'" + tok.value + "'";
    }
}

} // namespace tinybasic

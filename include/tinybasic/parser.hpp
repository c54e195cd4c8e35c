#pragma once

#include <vector>
#include <string>
#include <initializer_list>
#include "tokens.hpp"
#include "ast.hpp"
#include "error.hpp"

namespace tinybasic {

class Parser {
public:
    // source_line is only used to locate errors (0 when unknown)
    explicit Parser(std::vector<Token> tokens, int source_line = 0);

    // Parse one source line (numbered or immediate)
    Line parse_line();

private:
    std::vector<Token> tokens_;
    size_t pos_ = 0;
    int source_line_;
    bool direct_ = true;    // Line has no number
    int then_depth_ = 0;    // Nesting of IF ... THEN branches being parsed
    int stmt_column_ = 0;
    int depth_ = 0;         // Nesting of signs, parentheses and THEN branches
    int operators_ = 0;     // Binary operators seen on this line

    static constexpr int MAX_NESTING = 128;
    static constexpr int MAX_OPERATORS = 1024;

    // Token access
    const Token& current() const;
    Token advance();
    bool at_end() const;
    bool check(TokenType type) const;
    bool check_any(std::initializer_list<TokenType> types) const;
    bool match(TokenType type);
    Token expect(TokenType type, const std::string& what);
    ParseError unexpected(const std::string& what) const;
    void enter_nested(int column);
    void count_operator(int column);

    // Statement parsers
    Stmt parse_statement();
    Stmt parse_print();
    Stmt parse_if();
    Stmt parse_input();
    Stmt parse_let();
    Stmt parse_goto();
    Stmt parse_gosub();
    Stmt parse_return();
    Stmt parse_end();
    Stmt parse_rem();
    Stmt parse_cls();
    Stmt parse_list();
    Stmt parse_run();
    Stmt parse_new();
    Stmt parse_help();
    Stmt parse_load();
    Stmt parse_save();

    // Expression parsing (precedence climbing)
    Expr parse_expression();
    Expr parse_additive();
    Expr parse_multiplicative();
    Expr parse_unary();
    Expr parse_primary();

    // Helpers
    VariableExpr parse_variable();
    Relation parse_relation();
    void require_direct(const std::string& command) const;
};

// Convenience function: tokenize and parse one line
Line parse_line(const std::string& source, int source_line = 0);

} // namespace tinybasic

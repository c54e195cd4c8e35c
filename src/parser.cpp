#include "tinybasic/parser.hpp"
#include "tinybasic/lexer.hpp"
#include <cstdlib>

namespace tinybasic {

Parser::Parser(std::vector<Token> tokens, int source_line)
    : tokens_(std::move(tokens)), source_line_(source_line) {}

// Token access helpers
const Token& Parser::current() const {
    if (pos_ >= tokens_.size()) {
        static Token eof(TokenType::END_OF_FILE, "", 0);
        return eof;
    }
    return tokens_[pos_];
}

Token Parser::advance() {
    if (pos_ < tokens_.size()) {
        return tokens_[pos_++];
    }
    return Token(TokenType::END_OF_FILE, "", 0);
}

bool Parser::at_end() const {
    return pos_ >= tokens_.size() || current().type == TokenType::END_OF_FILE;
}

bool Parser::check(TokenType type) const {
    return current().type == type;
}

bool Parser::check_any(std::initializer_list<TokenType> types) const {
    for (auto t : types) {
        if (check(t)) return true;
    }
    return false;
}

bool Parser::match(TokenType type) {
    if (check(type)) {
        advance();
        return true;
    }
    return false;
}

Token Parser::expect(TokenType type, const std::string& what) {
    if (check(type)) {
        return advance();
    }
    throw unexpected(what);
}

ParseError Parser::unexpected(const std::string& what) const {
    return ParseError("Expected " + what + ", found " + describe_token(current()),
                      source_line_, current().column);
}

// Bounds recursion for pathological input; caller decrements depth_ on return
void Parser::enter_nested(int column) {
    if (++depth_ > MAX_NESTING) {
        throw ParseError("Expression too complex", source_line_, column);
    }
}

// Left-associative chains nest one tree level per operator
void Parser::count_operator(int column) {
    if (++operators_ > MAX_OPERATORS) {
        throw ParseError("Expression too complex", source_line_, column);
    }
}

// ============================================================================
// Program Structure
// ============================================================================

Line Parser::parse_line() {
    Line line;

    if (check(TokenType::LINE_NUMBER)) {
        line.line_number = std::atoi(advance().value.c_str());
        direct_ = false;
    } else {
        direct_ = true;
    }

    // Blank line, or a bare line number (delete that line)
    if (at_end()) {
        return line;
    }

    line.statement = parse_statement();

    if (!at_end()) {
        throw unexpected("end of line");
    }

    return line;
}

Stmt Parser::parse_statement() {
    stmt_column_ = current().column;

    switch (current().type) {
        case TokenType::PRINT: advance(); return parse_print();
        case TokenType::IF: advance(); return parse_if();
        case TokenType::INPUT: advance(); return parse_input();
        case TokenType::LET: advance(); return parse_let();
        case TokenType::GOTO: advance(); return parse_goto();
        case TokenType::GOSUB: advance(); return parse_gosub();
        case TokenType::RETURN: advance(); return parse_return();
        case TokenType::END: return parse_end();
        case TokenType::REM: return parse_rem();
        case TokenType::CLS: advance(); return parse_cls();
        case TokenType::LIST: advance(); return parse_list();
        case TokenType::RUN: advance(); return parse_run();
        case TokenType::NEW: advance(); return parse_new();
        case TokenType::HELP: advance(); return parse_help();
        case TokenType::LOAD: advance(); return parse_load();
        case TokenType::SAVE: advance(); return parse_save();

        // Implicit LET: A = expression
        case TokenType::IDENTIFIER:
            return parse_let();

        default:
            throw unexpected("statement");
    }
}

VariableExpr Parser::parse_variable() {
    if (!check(TokenType::IDENTIFIER)) {
        throw unexpected("variable name");
    }

    Token tok = current();
    if (tok.value.size() != 1) {
        throw ParseError("Invalid variable name: " + tok.value, source_line_, tok.column);
    }
    advance();

    return VariableExpr(tok.value[0], tok.column);
}

Relation Parser::parse_relation() {
    switch (current().type) {
        case TokenType::EQUAL: advance(); return Relation::EQUAL;
        case TokenType::NOT_EQUAL: advance(); return Relation::NOT_EQUAL;
        case TokenType::LESS_THAN: advance(); return Relation::LESS_THAN;
        case TokenType::GREATER_THAN: advance(); return Relation::GREATER_THAN;
        case TokenType::LESS_EQUAL: advance(); return Relation::LESS_EQUAL;
        case TokenType::GREATER_EQUAL: advance(); return Relation::GREATER_EQUAL;
        default:
            throw unexpected("relational operator");
    }
}

void Parser::require_direct(const std::string& command) const {
    if (!direct_ || then_depth_ > 0) {
        throw ParseError(command + " is only allowed in direct mode",
                         source_line_, stmt_column_);
    }
}

// ============================================================================
// Statement Parsers
// ============================================================================

Stmt Parser::parse_print() {
    auto stmt = std::make_unique<PrintStmt>();
    stmt->column = stmt_column_;

    // Bare PRINT outputs an empty line
    if (at_end()) {
        return Stmt{std::move(stmt)};
    }

    do {
        if (check(TokenType::STRING)) {
            stmt->items.emplace_back(advance().value);
        } else {
            stmt->items.emplace_back(parse_expression());
        }
    } while (match(TokenType::COMMA));

    return Stmt{std::move(stmt)};
}

Stmt Parser::parse_if() {
    auto stmt = std::make_unique<IfStmt>();
    stmt->column = stmt_column_;

    stmt->left = parse_expression();
    stmt->relation = parse_relation();
    stmt->right = parse_expression();

    expect(TokenType::THEN, "THEN");

    // THEN line_number is shorthand for THEN GOTO line_number
    if (check(TokenType::NUMBER)) {
        Token tok = advance();
        auto jump = std::make_unique<GotoStmt>();
        jump->column = tok.column;
        jump->target = make_expr<NumberExpr>(static_cast<Value>(std::atol(tok.value.c_str())),
                                             tok.column);
        stmt->then_stmt = Stmt{std::move(jump)};
        return Stmt{std::move(stmt)};
    }

    if (at_end()) {
        throw unexpected("statement after THEN");
    }

    enter_nested(current().column);
    ++then_depth_;
    stmt->then_stmt = parse_statement();
    --then_depth_;
    --depth_;

    return Stmt{std::move(stmt)};
}

Stmt Parser::parse_input() {
    auto stmt = std::make_unique<InputStmt>();
    stmt->column = stmt_column_;

    do {
        stmt->variables.push_back(parse_variable());
    } while (match(TokenType::COMMA));

    return Stmt{std::move(stmt)};
}

Stmt Parser::parse_let() {
    auto stmt = std::make_unique<LetStmt>();
    stmt->column = stmt_column_;

    stmt->target = parse_variable();
    expect(TokenType::EQUAL, "'=' in assignment");
    stmt->expression = parse_expression();

    return Stmt{std::move(stmt)};
}

Stmt Parser::parse_goto() {
    auto stmt = std::make_unique<GotoStmt>();
    stmt->column = stmt_column_;
    stmt->target = parse_expression();
    return Stmt{std::move(stmt)};
}

Stmt Parser::parse_gosub() {
    auto stmt = std::make_unique<GosubStmt>();
    stmt->column = stmt_column_;
    stmt->target = parse_expression();
    return Stmt{std::move(stmt)};
}

Stmt Parser::parse_return() {
    auto stmt = std::make_unique<ReturnStmt>();
    stmt->column = stmt_column_;
    return Stmt{std::move(stmt)};
}

Stmt Parser::parse_end() {
    advance();
    auto stmt = std::make_unique<EndStmt>();
    stmt->column = stmt_column_;
    return Stmt{std::move(stmt)};
}

Stmt Parser::parse_rem() {
    auto stmt = std::make_unique<RemStmt>();
    stmt->column = stmt_column_;
    stmt->comment = advance().value;
    return Stmt{std::move(stmt)};
}

Stmt Parser::parse_cls() {
    auto stmt = std::make_unique<ClsStmt>();
    stmt->column = stmt_column_;
    return Stmt{std::move(stmt)};
}

Stmt Parser::parse_list() {
    require_direct("LIST");

    auto stmt = std::make_unique<ListStmt>();
    stmt->column = stmt_column_;

    // LIST, LIST n, LIST n-, LIST n-m, LIST -m
    if (check(TokenType::NUMBER)) {
        stmt->from_line = std::atoi(advance().value.c_str());
        if (match(TokenType::MINUS)) {
            if (check(TokenType::NUMBER)) {
                stmt->to_line = std::atoi(advance().value.c_str());
            }
        } else {
            stmt->to_line = stmt->from_line;
        }
    } else if (match(TokenType::MINUS)) {
        stmt->to_line = std::atoi(expect(TokenType::NUMBER, "line number").value.c_str());
    }

    return Stmt{std::move(stmt)};
}

Stmt Parser::parse_run() {
    require_direct("RUN");
    auto stmt = std::make_unique<RunStmt>();
    stmt->column = stmt_column_;
    return Stmt{std::move(stmt)};
}

Stmt Parser::parse_new() {
    require_direct("NEW");
    auto stmt = std::make_unique<NewStmt>();
    stmt->column = stmt_column_;
    return Stmt{std::move(stmt)};
}

Stmt Parser::parse_help() {
    require_direct("HELP");
    auto stmt = std::make_unique<HelpStmt>();
    stmt->column = stmt_column_;
    return Stmt{std::move(stmt)};
}

Stmt Parser::parse_load() {
    require_direct("LOAD");
    auto stmt = std::make_unique<LoadStmt>();
    stmt->column = stmt_column_;
    stmt->filename = expect(TokenType::STRING, "file name in quotes").value;
    return Stmt{std::move(stmt)};
}

Stmt Parser::parse_save() {
    require_direct("SAVE");
    auto stmt = std::make_unique<SaveStmt>();
    stmt->column = stmt_column_;
    stmt->filename = expect(TokenType::STRING, "file name in quotes").value;
    return Stmt{std::move(stmt)};
}

// ============================================================================
// Expression Parsing
// ============================================================================
// Precedence (lowest to highest): + - < * / < unary + -
// Binary operators are left-associative.

Expr Parser::parse_expression() {
    return parse_additive();
}

Expr Parser::parse_additive() {
    Expr left = parse_multiplicative();

    while (check_any({TokenType::PLUS, TokenType::MINUS})) {
        Token op = advance();
        count_operator(op.column);
        Expr right = parse_multiplicative();
        left = make_expr<BinaryExpr>(op.type, std::move(left), std::move(right), op.column);
    }

    return left;
}

Expr Parser::parse_multiplicative() {
    Expr left = parse_unary();

    while (check_any({TokenType::MULTIPLY, TokenType::DIVIDE})) {
        Token op = advance();
        count_operator(op.column);
        Expr right = parse_unary();
        left = make_expr<BinaryExpr>(op.type, std::move(left), std::move(right), op.column);
    }

    return left;
}

Expr Parser::parse_unary() {
    if (check_any({TokenType::MINUS, TokenType::PLUS})) {
        Token op = advance();
        enter_nested(op.column);
        Expr operand = parse_unary();  // Allow chained signs like --X
        --depth_;
        return make_expr<UnaryExpr>(op.type, std::move(operand), op.column);
    }

    return parse_primary();
}

Expr Parser::parse_primary() {
    int col = current().column;

    // Number literal (range checked by the lexer)
    if (check(TokenType::NUMBER)) {
        Value value = static_cast<Value>(std::atol(current().value.c_str()));
        advance();
        return make_expr<NumberExpr>(value, col);
    }

    // Parenthesized expression
    if (match(TokenType::LPAREN)) {
        enter_nested(col);
        Expr expr = parse_expression();
        expect(TokenType::RPAREN, "')' after expression");
        --depth_;
        return expr;
    }

    // Variable
    if (check(TokenType::IDENTIFIER)) {
        VariableExpr var = parse_variable();
        return make_expr<VariableExpr>(var.name, var.column);
    }

    throw unexpected("expression");
}

// Convenience function
Line parse_line(const std::string& source, int source_line) {
    std::vector<Token> tokens = tokenize(source, source_line);
    Parser parser(std::move(tokens), source_line);
    Line line = parser.parse_line();

    size_t start = source.find_first_not_of(" \t\r\n");
    if (start != std::string::npos) {
        size_t end = source.find_last_not_of(" \t\r\n");
        line.source_text = source.substr(start, end - start + 1);
    }
    return line;
}

} // namespace tinybasic

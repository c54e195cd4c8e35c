#pragma once

#include <vector>
#include <optional>
#include <memory>
#include <variant>
#include <string>
#include "tokens.hpp"
#include "value.hpp"

namespace tinybasic {

// Forward declarations for expression nodes
struct NumberExpr;
struct VariableExpr;
struct BinaryExpr;
struct UnaryExpr;

// Expression node - uses variant for type safety
using Expr = std::variant<
    std::unique_ptr<NumberExpr>,
    std::unique_ptr<VariableExpr>,
    std::unique_ptr<BinaryExpr>,
    std::unique_ptr<UnaryExpr>
>;

// Helper to create expression nodes
template<typename T, typename... Args>
Expr make_expr(Args&&... args) {
    return Expr{std::make_unique<T>(std::forward<Args>(args)...)};
}

// ============================================================================
// Expression Nodes
// ============================================================================

struct NumberExpr {
    Value value;
    int column;

    NumberExpr(Value v, int c) : value(v), column(c) {}
};

struct VariableExpr {
    char name = 'A';        // Always an uppercase letter
    int column = 0;

    VariableExpr() = default;

    VariableExpr(char n, int c) : name(n), column(c) {}
};

struct BinaryExpr {
    TokenType op;           // PLUS, MINUS, MULTIPLY or DIVIDE
    Expr left;
    Expr right;
    int column;

    BinaryExpr(TokenType o, Expr l, Expr r, int c)
        : op(o), left(std::move(l)), right(std::move(r)), column(c) {}
};

struct UnaryExpr {
    TokenType op;           // PLUS or MINUS
    Expr operand;
    int column;

    UnaryExpr(TokenType o, Expr e, int c)
        : op(o), operand(std::move(e)), column(c) {}
};

// ============================================================================
// Forward declarations for statement nodes
// ============================================================================

struct PrintStmt;
struct IfStmt;
struct InputStmt;
struct LetStmt;
struct GotoStmt;
struct GosubStmt;
struct ReturnStmt;
struct EndStmt;
struct RemStmt;
struct ClsStmt;
struct ListStmt;
struct RunStmt;
struct NewStmt;
struct HelpStmt;
struct LoadStmt;
struct SaveStmt;

// Statement variant
using Stmt = std::variant<
    std::unique_ptr<PrintStmt>,
    std::unique_ptr<IfStmt>,
    std::unique_ptr<InputStmt>,
    std::unique_ptr<LetStmt>,
    std::unique_ptr<GotoStmt>,
    std::unique_ptr<GosubStmt>,
    std::unique_ptr<ReturnStmt>,
    std::unique_ptr<EndStmt>,
    std::unique_ptr<RemStmt>,
    std::unique_ptr<ClsStmt>,
    std::unique_ptr<ListStmt>,
    std::unique_ptr<RunStmt>,
    std::unique_ptr<NewStmt>,
    std::unique_ptr<HelpStmt>,
    std::unique_ptr<LoadStmt>,
    std::unique_ptr<SaveStmt>
>;

// Helper to create statement nodes
template<typename T, typename... Args>
Stmt make_stmt(Args&&... args) {
    return Stmt{std::make_unique<T>(std::forward<Args>(args)...)};
}

// ============================================================================
// Statement Nodes
// ============================================================================

// Base info for all statements
struct StmtInfo {
    int column = 0;
};

enum class Relation {
    EQUAL,
    NOT_EQUAL,
    LESS_THAN,
    GREATER_THAN,
    LESS_EQUAL,
    GREATER_EQUAL
};

// A PRINT item is either a string literal or an expression
using PrintItem = std::variant<std::string, Expr>;

struct PrintStmt : StmtInfo {
    std::vector<PrintItem> items;
};

struct IfStmt : StmtInfo {
    Expr left;
    Relation relation = Relation::EQUAL;
    Expr right;
    Stmt then_stmt;
};

struct InputStmt : StmtInfo {
    std::vector<VariableExpr> variables;
};

struct LetStmt : StmtInfo {
    VariableExpr target;
    Expr expression;
};

struct GotoStmt : StmtInfo {
    Expr target;
};

struct GosubStmt : StmtInfo {
    Expr target;
};

struct ReturnStmt : StmtInfo {};

struct EndStmt : StmtInfo {};

struct RemStmt : StmtInfo {
    std::string comment;
};

struct ClsStmt : StmtInfo {};

struct ListStmt : StmtInfo {
    std::optional<int> from_line;
    std::optional<int> to_line;
};

struct RunStmt : StmtInfo {};

struct NewStmt : StmtInfo {};

struct HelpStmt : StmtInfo {};

struct LoadStmt : StmtInfo {
    std::string filename;
};

struct SaveStmt : StmtInfo {
    std::string filename;
};

// ============================================================================
// Program Structure
// ============================================================================

// One parsed source line. A numbered line without a statement deletes
// that line from the program.
struct Line {
    std::optional<int> line_number;
    std::optional<Stmt> statement;
    std::string source_text;  // Normalized source for LIST/SAVE
};

// ============================================================================
// Formatting
// ============================================================================

// Relation operator as written in source
std::string relation_symbol(Relation r);

// Fully parenthesized rendering of an expression, e.g. "(2 + (3 * 4))"
std::string to_string(const Expr& e);

// Canonical rendering of a statement, e.g. "IF A < 4 THEN GOTO 20"
std::string to_string(const Stmt& s);

} // namespace tinybasic

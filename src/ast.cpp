#include "tinybasic/ast.hpp"

namespace tinybasic {

std::string relation_symbol(Relation r) {
    switch (r) {
        case Relation::EQUAL: return "=";
        case Relation::NOT_EQUAL: return "<>";
        case Relation::LESS_THAN: return "<";
        case Relation::GREATER_THAN: return ">";
        case Relation::LESS_EQUAL: return "<=";
        case Relation::GREATER_EQUAL: return ">=";
    }
    return "?";
}

static std::string op_symbol(TokenType op) {
    switch (op) {
        case TokenType::PLUS: return "+";
        case TokenType::MINUS: return "-";
        case TokenType::MULTIPLY: return "*";
        case TokenType::DIVIDE: return "/";
        default: return "?";
    }
}

std::string to_string(const Expr& e) {
    return std::visit([](const auto& ptr) -> std::string {
        using T = std::decay_t<decltype(*ptr)>;

        if constexpr (std::is_same_v<T, NumberExpr>) {
            return std::to_string(ptr->value);
        }
        else if constexpr (std::is_same_v<T, VariableExpr>) {
            return std::string(1, ptr->name);
        }
        else if constexpr (std::is_same_v<T, BinaryExpr>) {
            return "(" + to_string(ptr->left) + " " + op_symbol(ptr->op) + " " +
                   to_string(ptr->right) + ")";
        }
        else if constexpr (std::is_same_v<T, UnaryExpr>) {
            return op_symbol(ptr->op) + to_string(ptr->operand);
        }
    }, e);
}

std::string to_string(const Stmt& s) {
    return std::visit([](const auto& ptr) -> std::string {
        using T = std::decay_t<decltype(*ptr)>;

        if constexpr (std::is_same_v<T, PrintStmt>) {
            std::string out = "PRINT";
            for (size_t i = 0; i < ptr->items.size(); ++i) {
                out += (i == 0) ? " " : ", ";
                if (const auto* text = std::get_if<std::string>(&ptr->items[i])) {
                    out += "\"" + *text + "\"";
                } else {
                    out += to_string(std::get<Expr>(ptr->items[i]));
                }
            }
            return out;
        }
        else if constexpr (std::is_same_v<T, IfStmt>) {
            return "IF " + to_string(ptr->left) + " " + relation_symbol(ptr->relation) + " " +
                   to_string(ptr->right) + " THEN " + to_string(ptr->then_stmt);
        }
        else if constexpr (std::is_same_v<T, InputStmt>) {
            std::string out = "INPUT";
            for (size_t i = 0; i < ptr->variables.size(); ++i) {
                out += (i == 0) ? " " : ", ";
                out += ptr->variables[i].name;
            }
            return out;
        }
        else if constexpr (std::is_same_v<T, LetStmt>) {
            return std::string("LET ") + ptr->target.name + " = " + to_string(ptr->expression);
        }
        else if constexpr (std::is_same_v<T, GotoStmt>) {
            return "GOTO " + to_string(ptr->target);
        }
        else if constexpr (std::is_same_v<T, GosubStmt>) {
            return "GOSUB " + to_string(ptr->target);
        }
        else if constexpr (std::is_same_v<T, ReturnStmt>) {
            return "RETURN";
        }
        else if constexpr (std::is_same_v<T, EndStmt>) {
            return "END";
        }
        else if constexpr (std::is_same_v<T, RemStmt>) {
            return ptr->comment.empty() ? "REM" : "REM " + ptr->comment;
        }
        else if constexpr (std::is_same_v<T, ClsStmt>) {
            return "CLS";
        }
        else if constexpr (std::is_same_v<T, ListStmt>) {
            std::string out = "LIST";
            if (ptr->from_line) out += " " + std::to_string(*ptr->from_line);
            if (ptr->to_line) out += (ptr->from_line ? "-" : " -") + std::to_string(*ptr->to_line);
            return out;
        }
        else if constexpr (std::is_same_v<T, RunStmt>) {
            return "RUN";
        }
        else if constexpr (std::is_same_v<T, NewStmt>) {
            return "NEW";
        }
        else if constexpr (std::is_same_v<T, HelpStmt>) {
            return "HELP";
        }
        else if constexpr (std::is_same_v<T, LoadStmt>) {
            return "LOAD \"" + ptr->filename + "\"";
        }
        else if constexpr (std::is_same_v<T, SaveStmt>) {
            return "SAVE \"" + ptr->filename + "\"";
        }
    }, s);
}

} // namespace tinybasic

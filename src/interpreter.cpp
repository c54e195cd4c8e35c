#include "tinybasic/interpreter.hpp"
#include "tinybasic/parser.hpp"
#include <sstream>
#include <stdexcept>

namespace tinybasic {

static const char* const HELP_TEXT =
    "PRINT <expression>[, <expression>...]\n"
    "INPUT <variable>[, <variable>...]\n"
    "IF <expression> <relation> <expression> THEN <statement>\n"
    "LET <variable> = <expression>\n"
    "GOTO <line>\n"
    "GOSUB <line>\n"
    "REM <comment>\n"
    "RETURN\n"
    "END\n"
    "CLS\n"
    "LIST [<line>[-<line>]]\n"
    "RUN\n"
    "NEW\n"
    "LOAD \"<file>\"\n"
    "SAVE \"<file>\"\n";

// ============================================================================
// Interpreter
// ============================================================================

Interpreter::Interpreter(IOHandler* io)
    : io_(io)
{
    if (!io_) {
        io_owned_ = std::make_unique<ConsoleIO>();
        io_ = io_owned_.get();
    }
}

void Interpreter::load_line(const std::string& text) {
    state_.error.reset();

    Line line = parse_line(text);

    // A suspended run does not survive an edit or a new immediate line
    if (awaiting_input()) {
        stop();
    }

    if (line.line_number) {
        if (line.statement) {
            runtime_.program.insert_or_replace(*line.line_number, std::move(*line.statement),
                                               line.source_text);
        } else {
            runtime_.program.erase(*line.line_number);
        }
        return;
    }

    if (!line.statement) {
        return;  // Blank line
    }

    runtime_.direct_stmt = std::move(line.statement);
    runtime_.call_stack.clear();
    state_.statements_executed = 0;
    execute_from(PC::running_at(DIRECT_LINE));
}

std::vector<TinyBasicError> Interpreter::load_program(const std::string& text) {
    state_.error.reset();
    stop();
    return replace_program(text);
}

std::vector<TinyBasicError> Interpreter::replace_program(const std::string& text) {
    runtime_.program.clear();
    runtime_.call_stack.clear();

    std::vector<TinyBasicError> errors;
    std::istringstream in(text);
    std::string source;
    int source_line = 0;

    while (std::getline(in, source)) {
        ++source_line;
        try {
            Line line = parse_line(source, source_line);
            if (!line.line_number) {
                if (line.statement) {
                    errors.push_back(ParseError("Line number required", source_line, 1));
                }
                continue;
            }
            if (line.statement) {
                runtime_.program.insert_or_replace(*line.line_number, std::move(*line.statement),
                                                   line.source_text);
            } else {
                runtime_.program.erase(*line.line_number);
            }
        } catch (const TinyBasicError& e) {
            errors.push_back(e);
        }
    }

    return errors;
}

void Interpreter::run() {
    state_.error.reset();
    state_.pending_vars.clear();
    state_.statements_executed = 0;
    runtime_.reset();
    execute_from(runtime_.program.first());
}

void Interpreter::execute_from(PC pc) {
    runtime_.pc = pc;
    runtime_.next_pc = std::nullopt;
    while (tick()) {
        // Continue execution
    }
}

bool Interpreter::tick() {
    // Check if halted
    if (!runtime_.pc.is_running()) {
        return false;
    }

    // Get current statement
    Stmt* stmt = runtime_.current_statement();
    if (!stmt) {
        runtime_.pc = PC::halted();
        return false;
    }

    // Execute statement
    try {
        execute(*stmt);
        state_.statements_executed++;
    } catch (const RuntimeError& e) {
        record_error(e);
        return false;
    }

    // Advance PC
    advance_pc();

    return runtime_.pc.is_running();
}

bool Interpreter::provide_input(const std::string& text) {
    if (!awaiting_input() || state_.pending_vars.empty()) {
        return false;
    }

    auto value = parse_value(text);
    if (!value) {
        record_error(RuntimeError(ErrorCode::INVALID_INPUT,
                                  error_message(ErrorCode::INVALID_INPUT),
                                  runtime_.pc.line));
        return true;
    }

    runtime_.env.set(state_.pending_vars.front(), *value);
    state_.pending_vars.erase(state_.pending_vars.begin());

    if (!state_.pending_vars.empty()) {
        prompt_for_next_var();
        return true;
    }

    // All variables bound: continue after the INPUT statement
    runtime_.pc.reason = StopReason::RUNNING;
    advance_pc();
    while (tick()) {
        // Continue execution
    }
    return true;
}

void Interpreter::stop() {
    runtime_.reset();
    state_.pending_vars.clear();
}

ExecStatus Interpreter::status() const {
    if (runtime_.pc.is_running()) {
        return ExecStatus::RUNNING;
    }
    if (awaiting_input()) {
        return ExecStatus::AWAITING_INPUT;
    }
    return ExecStatus::HALTED;
}

void Interpreter::advance_pc() {
    if (runtime_.next_pc) {
        runtime_.pc = *runtime_.next_pc;
        runtime_.next_pc = std::nullopt;
    } else if (runtime_.pc.is_running()) {
        runtime_.pc = runtime_.program.next(runtime_.pc);
    }
}

void Interpreter::jump_to(Value line) {
    if (!runtime_.program.contains(line)) {
        raise_error(ErrorCode::UNDEFINED_LINE, "Undefined line number: " + std::to_string(line));
    }
    runtime_.next_pc = PC::running_at(line);
}

void Interpreter::raise_error(int code, const std::string& msg) {
    throw RuntimeError(code, msg, runtime_.pc.line);
}

void Interpreter::record_error(const RuntimeError& e) {
    state_.error = InterpreterState::ErrorInfo{e.error_code, e.line, e.what()};
    state_.pending_vars.clear();
    runtime_.next_pc = std::nullopt;
    runtime_.pc.reason = StopReason::ERROR;
}

void Interpreter::prompt_for_next_var() {
    io_->set_prompt(std::string(1, state_.pending_vars.front()) + "? ");
}

// ============================================================================
// Statement Execution
// ============================================================================

void Interpreter::execute(Stmt& stmt) {
    std::visit([this](auto& s) {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, std::unique_ptr<PrintStmt>>) exec_print(*s);
        else if constexpr (std::is_same_v<T, std::unique_ptr<IfStmt>>) exec_if(*s);
        else if constexpr (std::is_same_v<T, std::unique_ptr<InputStmt>>) exec_input(*s);
        else if constexpr (std::is_same_v<T, std::unique_ptr<LetStmt>>) exec_let(*s);
        else if constexpr (std::is_same_v<T, std::unique_ptr<GotoStmt>>) exec_goto(*s);
        else if constexpr (std::is_same_v<T, std::unique_ptr<GosubStmt>>) exec_gosub(*s);
        else if constexpr (std::is_same_v<T, std::unique_ptr<ReturnStmt>>) exec_return(*s);
        else if constexpr (std::is_same_v<T, std::unique_ptr<EndStmt>>) exec_end(*s);
        else if constexpr (std::is_same_v<T, std::unique_ptr<RemStmt>>) exec_rem(*s);
        else if constexpr (std::is_same_v<T, std::unique_ptr<ClsStmt>>) exec_cls(*s);
        else if constexpr (std::is_same_v<T, std::unique_ptr<ListStmt>>) exec_list(*s);
        else if constexpr (std::is_same_v<T, std::unique_ptr<RunStmt>>) exec_run(*s);
        else if constexpr (std::is_same_v<T, std::unique_ptr<NewStmt>>) exec_new(*s);
        else if constexpr (std::is_same_v<T, std::unique_ptr<HelpStmt>>) exec_help(*s);
        else if constexpr (std::is_same_v<T, std::unique_ptr<LoadStmt>>) exec_load(*s);
        else if constexpr (std::is_same_v<T, std::unique_ptr<SaveStmt>>) exec_save(*s);
    }, stmt);
}

void Interpreter::exec_print(PrintStmt& s) {
    // Build the whole line first so a failing item prints nothing
    std::string output;

    for (const auto& item : s.items) {
        if (const auto* text = std::get_if<std::string>(&item)) {
            output += *text;
        } else {
            output += to_string(eval(std::get<Expr>(item)));
        }
    }

    output += '\n';
    io_->write(output);
}

void Interpreter::exec_if(IfStmt& s) {
    Value left = eval(s.left);
    Value right = eval(s.right);

    if (compare(left, s.relation, right)) {
        execute(s.then_stmt);
    }
}

void Interpreter::exec_input(InputStmt& s) {
    state_.pending_vars.clear();
    for (const auto& var : s.variables) {
        state_.pending_vars.push_back(var.name);
    }

    // Suspend; provide_input resumes after this statement
    runtime_.pc.reason = StopReason::INPUT;
    prompt_for_next_var();
}

void Interpreter::exec_let(LetStmt& s) {
    Value val = eval(s.expression);
    runtime_.env.set(s.target.name, val);
}

void Interpreter::exec_goto(GotoStmt& s) {
    jump_to(eval(s.target));
}

void Interpreter::exec_gosub(GosubStmt& s) {
    PC return_pc = runtime_.program.next(runtime_.pc);
    jump_to(eval(s.target));
    runtime_.call_stack.push_back(return_pc);
}

void Interpreter::exec_return([[maybe_unused]] ReturnStmt& s) {
    if (runtime_.call_stack.empty()) {
        raise_error(ErrorCode::RETURN_WITHOUT_GOSUB, error_message(ErrorCode::RETURN_WITHOUT_GOSUB));
    }

    runtime_.next_pc = runtime_.call_stack.back();
    runtime_.call_stack.pop_back();
}

void Interpreter::exec_end([[maybe_unused]] EndStmt& s) {
    runtime_.pc = PC::halted(StopReason::END);
}

void Interpreter::exec_rem([[maybe_unused]] RemStmt& s) {
    // Comments - nothing to do
}

void Interpreter::exec_cls([[maybe_unused]] ClsStmt& s) {
    io_->clear();
}

void Interpreter::exec_list(ListStmt& s) {
    io_->write(runtime_.program.listing(s.from_line, s.to_line));
}

void Interpreter::exec_run([[maybe_unused]] RunStmt& s) {
    runtime_.call_stack.clear();
    state_.statements_executed = 0;
    runtime_.next_pc = runtime_.program.first();
}

void Interpreter::exec_new([[maybe_unused]] NewStmt& s) {
    runtime_.program.clear();
    runtime_.call_stack.clear();
}

void Interpreter::exec_help([[maybe_unused]] HelpStmt& s) {
    io_->write(HELP_TEXT);
}

void Interpreter::exec_load(LoadStmt& s) {
    auto text = io_->load_program(s.filename);
    if (!text) {
        raise_error(ErrorCode::FILE_NOT_FOUND, "File not found: " + s.filename);
    }

    for (const auto& e : replace_program(*text)) {
        io_->write("?" + std::string(e.what()) + "\n");
    }
}

void Interpreter::exec_save(SaveStmt& s) {
    if (!io_->save_program(s.filename, runtime_.program.listing())) {
        raise_error(ErrorCode::DISK_IO_ERROR, "Disk I/O error: " + s.filename);
    }
}

// ============================================================================
// Expression Evaluation
// ============================================================================

Value Interpreter::eval(const Expr& expr) {
    return std::visit([this](const auto& e) -> Value {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, std::unique_ptr<NumberExpr>>) {
            return e->value;
        }
        else if constexpr (std::is_same_v<T, std::unique_ptr<VariableExpr>>) {
            return runtime_.env.get(e->name);
        }
        else if constexpr (std::is_same_v<T, std::unique_ptr<BinaryExpr>>) {
            return eval_binary(*e);
        }
        else if constexpr (std::is_same_v<T, std::unique_ptr<UnaryExpr>>) {
            return eval_unary(*e);
        }
    }, expr);
}

Value Interpreter::eval_binary(const BinaryExpr& e) {
    // Widen so that every int32 result is exact before narrowing
    long long left = eval(e.left);
    long long right = eval(e.right);
    long long result = 0;

    switch (e.op) {
        case TokenType::PLUS: result = left + right; break;
        case TokenType::MINUS: result = left - right; break;
        case TokenType::MULTIPLY: result = left * right; break;
        case TokenType::DIVIDE:
            if (right == 0) {
                raise_error(ErrorCode::DIVISION_BY_ZERO, error_message(ErrorCode::DIVISION_BY_ZERO));
            }
            result = left / right;  // Truncates toward zero
            break;
        default:
            throw std::logic_error("Unknown binary operator: " + token_type_name(e.op));
    }

    auto value = narrow(result);
    if (!value) {
        raise_error(ErrorCode::OVERFLOW_ERROR, error_message(ErrorCode::OVERFLOW_ERROR));
    }
    return *value;
}

Value Interpreter::eval_unary(const UnaryExpr& e) {
    long long operand = eval(e.operand);

    switch (e.op) {
        case TokenType::MINUS: {
            auto value = narrow(-operand);
            if (!value) {
                raise_error(ErrorCode::OVERFLOW_ERROR, error_message(ErrorCode::OVERFLOW_ERROR));
            }
            return *value;
        }
        case TokenType::PLUS:
            return static_cast<Value>(operand);  // Unary plus is a no-op
        default:
            throw std::logic_error("Unknown unary operator: " + token_type_name(e.op));
    }
}

bool Interpreter::compare(Value left, Relation relation, Value right) const {
    switch (relation) {
        case Relation::EQUAL: return left == right;
        case Relation::NOT_EQUAL: return left != right;
        case Relation::LESS_THAN: return left < right;
        case Relation::GREATER_THAN: return left > right;
        case Relation::LESS_EQUAL: return left <= right;
        case Relation::GREATER_EQUAL: return left >= right;
    }
    return false;
}

} // namespace tinybasic

#pragma once

#include <optional>
#include <memory>
#include <string>
#include <vector>
#include "io_handler.hpp"
#include "runtime.hpp"
#include "ast.hpp"

namespace tinybasic {

// ============================================================================
// Interpreter State
// ============================================================================

struct InterpreterState {
    // Variables still waiting for an INPUT reply, in order
    std::vector<char> pending_vars;

    // Error info
    struct ErrorInfo {
        int code;
        int line;              // BASIC line number, 0 in direct mode
        std::string message;
    };
    std::optional<ErrorInfo> error;

    // Stats (reset at the start of every run)
    size_t statements_executed = 0;
};

enum class ExecStatus {
    RUNNING,
    AWAITING_INPUT,
    HALTED
};

// ============================================================================
// Interpreter
// ============================================================================

class Interpreter {
public:
    // io may be null, in which case console I/O is used
    explicit Interpreter(IOHandler* io = nullptr);

    // Load one typed line. Numbered lines are stored (or deleted when
    // nothing follows the number), immediate lines execute at once.
    // Throws LexerError/ParseError; the program is left unchanged then.
    void load_line(const std::string& text);

    // Replace the program with the numbered lines of a source text.
    // Returns the lex/parse errors of the lines that were skipped.
    std::vector<TinyBasicError> load_program(const std::string& text);

    // Run the stored program from its first line
    void run();

    // Supply one line of text for the next pending INPUT variable.
    // Returns false if no INPUT is waiting.
    bool provide_input(const std::string& text);

    // Abandon the current run
    void stop();

    // Accessors
    ExecStatus status() const;
    bool awaiting_input() const { return runtime_.pc.reason == StopReason::INPUT; }
    Runtime& runtime() { return runtime_; }
    const Runtime& runtime() const { return runtime_; }
    const InterpreterState& state() const { return state_; }

private:
    Runtime runtime_;
    std::unique_ptr<IOHandler> io_owned_;
    IOHandler* io_;
    InterpreterState state_;

    // Start executing at pc until the run stops or suspends
    void execute_from(PC pc);

    // Execute one statement; returns true if still running
    bool tick();

    // Clear the program and store every numbered line of text
    std::vector<TinyBasicError> replace_program(const std::string& text);

    // Statement execution
    void execute(Stmt& stmt);

    void exec_print(PrintStmt& s);
    void exec_if(IfStmt& s);
    void exec_input(InputStmt& s);
    void exec_let(LetStmt& s);
    void exec_goto(GotoStmt& s);
    void exec_gosub(GosubStmt& s);
    void exec_return(ReturnStmt& s);
    void exec_end(EndStmt& s);
    void exec_rem(RemStmt& s);
    void exec_cls(ClsStmt& s);
    void exec_list(ListStmt& s);
    void exec_run(RunStmt& s);
    void exec_new(NewStmt& s);
    void exec_help(HelpStmt& s);
    void exec_load(LoadStmt& s);
    void exec_save(SaveStmt& s);

    // Expression evaluation
    Value eval(const Expr& expr);
    Value eval_binary(const BinaryExpr& e);
    Value eval_unary(const UnaryExpr& e);
    bool compare(Value left, Relation relation, Value right) const;

    // Helpers
    [[noreturn]] void raise_error(int code, const std::string& msg);
    void record_error(const RuntimeError& e);
    void advance_pc();
    void jump_to(Value line);
    void prompt_for_next_var();
};

} // namespace tinybasic

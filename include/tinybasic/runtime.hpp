#pragma once

#include <array>
#include <map>
#include <vector>
#include <optional>
#include <string>
#include "value.hpp"
#include "ast.hpp"
#include "error.hpp"

namespace tinybasic {

// ============================================================================
// Program Counter
// ============================================================================

enum class StopReason {
    RUNNING,       // Still executing
    END,           // END statement, end of program or never started
    ERROR,         // Runtime error
    INPUT          // Waiting for input
};

// Line number used for the statement of an immediate-mode line
constexpr int DIRECT_LINE = 0;

struct PC {
    int line = DIRECT_LINE;
    StopReason reason = StopReason::END;

    bool is_running() const { return reason == StopReason::RUNNING; }
    bool is_halted() const { return !is_running(); }

    static PC running_at(int l) {
        return PC{l, StopReason::RUNNING};
    }

    static PC halted(StopReason r = StopReason::END) {
        return PC{DIRECT_LINE, r};
    }

    bool operator==(const PC& other) const {
        return line == other.line && reason == other.reason;
    }
};

// ============================================================================
// Program Store
// ============================================================================
// Stored lines ordered by line number. Control flow is a key lookup.

class ProgramStore {
public:
    struct Entry {
        Stmt statement;
        std::string source_text;  // Trimmed source including the line number
    };

    using const_iterator = std::map<int, Entry>::const_iterator;

    // Insert a line, replacing any statement already stored under that number
    void insert_or_replace(int line_num, Stmt stmt, std::string source_text = "");

    // Remove a line; returns false if it was not stored
    bool erase(int line_num);

    void clear();

    // Statement stored under a line number, nullptr if absent
    Stmt* get(int line_num);

    bool contains(int line_num) const;

    std::optional<int> first_line() const;

    // Smallest stored line number strictly greater than line_num
    std::optional<int> next_line_after(int line_num) const;

    size_t size() const { return lines_.size(); }
    bool empty() const { return lines_.empty(); }

    const_iterator begin() const { return lines_.begin(); }
    const_iterator end() const { return lines_.end(); }

    // PC helpers used by the executor
    PC first() const;
    PC next(const PC& current) const;

    // Source text of every stored line in [from, to], one per output line
    std::string listing(std::optional<int> from = std::nullopt,
                        std::optional<int> to = std::nullopt) const;

    // Source text for one stored line
    std::string line_text(int line_num) const;

private:
    std::map<int, Entry> lines_;
};

// ============================================================================
// Environment
// ============================================================================

class Environment {
public:
    static constexpr size_t SIZE = 26;

    Value get(char name) const;
    void set(char name, Value value);

private:
    std::array<Value, SIZE> slots_{};  // A-Z, zero at construction

    static size_t index(char name);
};

// ============================================================================
// Runtime
// ============================================================================

class Runtime {
public:
    ProgramStore program;
    Environment env;

    // ========== Execution State ==========
    PC pc;                              // Current program counter
    std::optional<PC> next_pc;          // Jump target (set by GOTO/GOSUB/RETURN)
    std::vector<PC> call_stack;         // GOSUB return addresses

    // Statement of the immediate-mode line being executed
    std::optional<Stmt> direct_stmt;

    // Statement at a PC, nullptr if there is none
    Stmt* current_statement();

    // Discard the execution state (program and variables are kept)
    void reset();
};

} // namespace tinybasic

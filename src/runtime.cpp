#include "tinybasic/runtime.hpp"
#include <stdexcept>

namespace tinybasic {

// ============================================================================
// ProgramStore
// ============================================================================

void ProgramStore::insert_or_replace(int line_num, Stmt stmt, std::string source_text) {
    if (source_text.empty()) {
        source_text = std::to_string(line_num) + " " + to_string(stmt);
    }
    lines_[line_num] = Entry{std::move(stmt), std::move(source_text)};
}

bool ProgramStore::erase(int line_num) {
    return lines_.erase(line_num) > 0;
}

void ProgramStore::clear() {
    lines_.clear();
}

Stmt* ProgramStore::get(int line_num) {
    auto it = lines_.find(line_num);
    return (it != lines_.end()) ? &it->second.statement : nullptr;
}

bool ProgramStore::contains(int line_num) const {
    return lines_.find(line_num) != lines_.end();
}

std::optional<int> ProgramStore::first_line() const {
    if (lines_.empty()) {
        return std::nullopt;
    }
    return lines_.begin()->first;
}

std::optional<int> ProgramStore::next_line_after(int line_num) const {
    auto it = lines_.upper_bound(line_num);
    if (it == lines_.end()) {
        return std::nullopt;
    }
    return it->first;
}

PC ProgramStore::first() const {
    auto line = first_line();
    return line ? PC::running_at(*line) : PC::halted();
}

PC ProgramStore::next(const PC& current) const {
    // An immediate-mode statement has no successor
    if (current.line == DIRECT_LINE) {
        return PC::halted();
    }

    auto line = next_line_after(current.line);
    return line ? PC::running_at(*line) : PC::halted();
}

std::string ProgramStore::listing(std::optional<int> from, std::optional<int> to) const {
    std::string out;
    auto it = from ? lines_.lower_bound(*from) : lines_.begin();
    for (; it != lines_.end(); ++it) {
        if (to && it->first > *to) break;
        out += it->second.source_text;
        out += '\n';
    }
    return out;
}

std::string ProgramStore::line_text(int line_num) const {
    auto it = lines_.find(line_num);
    return (it != lines_.end()) ? it->second.source_text : std::string();
}

// ============================================================================
// Environment
// ============================================================================

size_t Environment::index(char name) {
    if (name < 'A' || name > 'Z') {
        throw std::out_of_range(std::string("Invalid variable name: ") + name);
    }
    return static_cast<size_t>(name - 'A');
}

Value Environment::get(char name) const {
    return slots_[index(name)];
}

void Environment::set(char name, Value value) {
    slots_[index(name)] = value;
}

// ============================================================================
// Runtime
// ============================================================================

Stmt* Runtime::current_statement() {
    if (pc.line == DIRECT_LINE) {
        return direct_stmt ? &*direct_stmt : nullptr;
    }
    return program.get(pc.line);
}

void Runtime::reset() {
    pc = PC::halted();
    next_pc = std::nullopt;
    call_stack.clear();
}

} // namespace tinybasic

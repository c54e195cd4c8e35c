#pragma once
// I/O Handler Abstraction
// The interpreter core never touches the terminal or the file system
// directly. Hosts (console, tests, embedding) provide an IOHandler.

#include <string>
#include <optional>

namespace tinybasic {

// ============================================================================
// IOHandler - Abstract interface between the interpreter and its host
// ============================================================================

class IOHandler {
public:
    virtual ~IOHandler() = default;

    // Append text to the output surface
    virtual void write(const std::string& text) = 0;

    // Read one line of input (without trailing newline), nullopt on EOF.
    // Called by the host driver only; the interpreter receives input
    // through Interpreter::provide_input.
    virtual std::optional<std::string> read_line() = 0;

    // Advise the prompt to show before the next read_line
    virtual void set_prompt(const std::string& prompt) = 0;

    // Clear the output surface (CLS command)
    // Default implementation outputs ANSI escape sequence
    virtual void clear() {
        write("\033[2J\033[H");
    }

    // Program source for LOAD, nullopt if it cannot be obtained
    virtual std::optional<std::string> load_program(const std::string& name) = 0;

    // Store program source for SAVE; false if the host rejected it
    virtual bool save_program(const std::string& name, const std::string& text) = 0;
};

// ============================================================================
// ConsoleIO - Standard console implementation using std::cin/std::cout
// ============================================================================
// LOAD and SAVE use files relative to the working directory.

class ConsoleIO : public IOHandler {
public:
    void write(const std::string& text) override;
    std::optional<std::string> read_line() override;
    void set_prompt(const std::string& prompt) override { prompt_ = prompt; }
    std::optional<std::string> load_program(const std::string& name) override;
    bool save_program(const std::string& name, const std::string& text) override;

protected:
    std::string prompt_;
};

} // namespace tinybasic

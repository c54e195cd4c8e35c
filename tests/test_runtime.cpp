#include <iostream>
#include <string>
#include <stdexcept>
#include "tinybasic/runtime.hpp"
#include "tinybasic/parser.hpp"

using namespace tinybasic;

int tests_passed = 0;
int tests_failed = 0;

void test(const std::string& name, bool condition) {
    if (condition) {
        tests_passed++;
        std::cout << "  PASS: " << name << "\n";
    } else {
        tests_failed++;
        std::cout << "  FAIL: " << name << "\n";
    }
}

// Store a numbered source line the way the interpreter does
void store(ProgramStore& program, const std::string& source) {
    Line line = parse_line(source);
    program.insert_or_replace(*line.line_number, std::move(*line.statement), line.source_text);
}

void test_program_store() {
    std::cout << "\n=== Program Store Tests ===\n";

    ProgramStore program;
    test("Empty store", program.empty() && program.size() == 0);
    test("Empty store has no first line", !program.first_line());
    test("Empty store first PC is halted", program.first().is_halted());

    // Insert out of order
    store(program, "30 END");
    store(program, "10 PRINT 1");
    store(program, "20 PRINT 2");

    test("Lines stored", program.size() == 3);
    test("First line is smallest", program.first_line() && *program.first_line() == 10);
    test("Next line after 10", program.next_line_after(10) && *program.next_line_after(10) == 20);
    test("Next line after absent number", program.next_line_after(15) && *program.next_line_after(15) == 20);
    test("Next line after last", !program.next_line_after(30));
    test("Next line before first", program.next_line_after(0) && *program.next_line_after(0) == 10);

    test("Get existing line", program.get(20) != nullptr);
    test("Get absent line", program.get(25) == nullptr);
    test("Contains", program.contains(30) && !program.contains(40));

    // Replace keeps the count
    store(program, "20 PRINT 22");
    test("Replace keeps count", program.size() == 3);
    test("Replace changes statement", to_string(*program.get(20)) == "PRINT 22");
    test("Replace changes source", program.line_text(20) == "20 PRINT 22");

    // Iteration is ordered
    std::string order;
    for (const auto& entry : program) {
        order += std::to_string(entry.first) + ";";
    }
    test("Ordered iteration", order == "10;20;30;");

    test("Erase existing", program.erase(20) && program.size() == 2);
    test("Erase absent", !program.erase(20));
    test("Next skips erased", *program.next_line_after(10) == 30);

    program.clear();
    test("Clear empties store", program.empty() && !program.first_line());
}

void test_listing() {
    std::cout << "\n=== Listing Tests ===\n";

    ProgramStore program;
    store(program, "20 PRINT   \"B\"");
    store(program, "10 let a = 1");
    store(program, "30 END");

    test("Full listing keeps source text",
         program.listing() == "10 let a = 1\n20 PRINT   \"B\"\n30 END\n");
    test("Range listing", program.listing(15, 25) == "20 PRINT   \"B\"\n");
    test("Open-ended listing", program.listing(20) == "20 PRINT   \"B\"\n30 END\n");
    test("Listing up to", program.listing(std::nullopt, 10) == "10 let a = 1\n");
    test("Empty range listing", program.listing(40, 50).empty());

    // Without source text the canonical form is used
    program.insert_or_replace(40, make_stmt<EndStmt>());
    test("Canonical source", program.line_text(40) == "40 END");
}

void test_pc() {
    std::cout << "\n=== Program Counter Tests ===\n";

    ProgramStore program;
    store(program, "10 PRINT 1");
    store(program, "20 END");

    PC pc = program.first();
    test("First PC running at first line", pc.is_running() && pc.line == 10);

    pc = program.next(pc);
    test("Next PC", pc.is_running() && pc.line == 20);

    pc = program.next(pc);
    test("Past the end halts", pc.is_halted() && pc.reason == StopReason::END);

    pc = program.next(PC::running_at(DIRECT_LINE));
    test("Direct statement has no successor", pc.is_halted());

    test("Default PC is halted", PC().is_halted());
}

void test_environment() {
    std::cout << "\n=== Environment Tests ===\n";

    Environment env;
    bool all_zero = true;
    for (char c = 'A'; c <= 'Z'; ++c) {
        if (env.get(c) != 0) all_zero = false;
    }
    test("All variables start at zero", all_zero);

    env.set('A', 42);
    env.set('Z', -7);
    test("Set and get A", env.get('A') == 42);
    test("Set and get Z", env.get('Z') == -7);
    test("Other slots untouched", env.get('B') == 0);

    env.set('A', VALUE_MAX);
    test("Holds 32-bit maximum", env.get('A') == VALUE_MAX);

    bool threw = false;
    try {
        env.get('a');
    } catch (const std::out_of_range&) {
        threw = true;
    }
    test("Non-letter slot rejected", threw);
}

void test_runtime_reset() {
    std::cout << "\n=== Runtime Tests ===\n";

    Runtime runtime;
    store(runtime.program, "10 PRINT 1");
    runtime.env.set('C', 3);
    runtime.pc = PC::running_at(10);
    runtime.next_pc = PC::running_at(10);
    runtime.call_stack.push_back(PC::halted());

    test("Current statement from program", runtime.current_statement() == runtime.program.get(10));

    runtime.reset();
    test("Reset halts", runtime.pc.is_halted());
    test("Reset clears jump", !runtime.next_pc);
    test("Reset clears call stack", runtime.call_stack.empty());
    test("Reset keeps program", runtime.program.size() == 1);
    test("Reset keeps variables", runtime.env.get('C') == 3);

    runtime.pc = PC::running_at(DIRECT_LINE);
    test("No direct statement", runtime.current_statement() == nullptr);
    runtime.direct_stmt = make_stmt<EndStmt>();
    test("Direct statement", runtime.current_statement() == &*runtime.direct_stmt);
}

void test_values() {
    std::cout << "\n=== Value Tests ===\n";

    test("Parse plain", parse_value("7") == Value{7});
    test("Parse with blanks", parse_value("  42 \r\n") == Value{42});
    test("Parse negative", parse_value("-13") == Value{-13});
    test("Parse explicit plus", parse_value("+5") == Value{5});
    test("Parse rejects text", !parse_value("abc"));
    test("Parse rejects empty", !parse_value("   "));
    test("Parse rejects lone sign", !parse_value("-"));
    test("Parse rejects fraction", !parse_value("1.5"));
    test("Parse rejects inner blank", !parse_value("1 2"));
    test("Parse rejects out of range", !parse_value("2147483648"));
    test("Parse accepts minimum", parse_value("-2147483648") == VALUE_MIN);
    test("Narrow in range", narrow(123) == Value{123});
    test("Narrow overflow", !narrow(static_cast<long long>(VALUE_MAX) + 1));
}

int main() {
    std::cout << "TinyBasic Runtime Tests\n";
    std::cout << "=======================\n";

    test_program_store();
    test_listing();
    test_pc();
    test_environment();
    test_runtime_reset();
    test_values();

    std::cout << "\n=======================\n";
    std::cout << "Results: " << tests_passed << " passed, " << tests_failed << " failed\n";

    return tests_failed > 0 ? 1 : 0;
}

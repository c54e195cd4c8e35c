#include <iostream>
#include <string>
#include "tinybasic/lexer.hpp"
#include "tinybasic/error.hpp"

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

// Run tokenize and report whether a LexerError was raised
bool lex_fails(const std::string& source, std::string* message = nullptr) {
    try {
        tokenize(source);
    } catch (const LexerError& e) {
        if (message) *message = e.what();
        return true;
    }
    return false;
}

void test_basic_tokens() {
    std::cout << "\n=== Basic Token Tests ===\n";

    // Test numbers (use X=... to avoid line number parsing)
    auto tokens = tokenize("X=123");
    test("Integer number", tokens.size() == 4 && tokens[2].type == TokenType::NUMBER && tokens[2].value == "123");

    tokens = tokenize("X=007");
    test("Leading zeros normalized", tokens[2].type == TokenType::NUMBER && tokens[2].value == "7");

    // Test strings
    tokens = tokenize("\"Hello World\"");
    test("String literal", tokens.size() == 2 && tokens[0].type == TokenType::STRING && tokens[0].value == "Hello World");

    tokens = tokenize("\"\"");
    test("Empty string literal", tokens.size() == 2 && tokens[0].type == TokenType::STRING && tokens[0].value.empty());

    // Test operators
    tokens = tokenize("+ - * /");
    test("Arithmetic operators", tokens.size() == 5 &&
         tokens[0].type == TokenType::PLUS &&
         tokens[1].type == TokenType::MINUS &&
         tokens[2].type == TokenType::MULTIPLY &&
         tokens[3].type == TokenType::DIVIDE);

    tokens = tokenize("<> <= >= < > =");
    test("Relational operators", tokens.size() == 7 &&
         tokens[0].type == TokenType::NOT_EQUAL &&
         tokens[1].type == TokenType::LESS_EQUAL &&
         tokens[2].type == TokenType::GREATER_EQUAL &&
         tokens[3].type == TokenType::LESS_THAN &&
         tokens[4].type == TokenType::GREATER_THAN &&
         tokens[5].type == TokenType::EQUAL);

    tokens = tokenize("><");
    test("Reversed not-equal", tokens.size() == 2 && tokens[0].type == TokenType::NOT_EQUAL);

    tokens = tokenize("(A),B");
    test("Delimiters", tokens.size() == 6 &&
         tokens[0].type == TokenType::LPAREN &&
         tokens[2].type == TokenType::RPAREN &&
         tokens[3].type == TokenType::COMMA);

    tokens = tokenize("");
    test("Empty line yields only END_OF_FILE", tokens.size() == 1 && tokens[0].type == TokenType::END_OF_FILE);

    tokens = tokenize("A");
    test("Stream ends with END_OF_FILE", tokens.back().type == TokenType::END_OF_FILE);
}

void test_keywords() {
    std::cout << "\n=== Keyword Tests ===\n";

    auto tokens = tokenize("PRINT");
    test("PRINT keyword", tokens.size() == 2 && tokens[0].type == TokenType::PRINT);

    tokens = tokenize("IF THEN INPUT LET END");
    test("Statement keywords", tokens.size() == 6 &&
         tokens[0].type == TokenType::IF &&
         tokens[1].type == TokenType::THEN &&
         tokens[2].type == TokenType::INPUT &&
         tokens[3].type == TokenType::LET &&
         tokens[4].type == TokenType::END);

    tokens = tokenize("GOTO GOSUB RETURN");
    test("Branch keywords", tokens.size() == 4 &&
         tokens[0].type == TokenType::GOTO &&
         tokens[1].type == TokenType::GOSUB &&
         tokens[2].type == TokenType::RETURN);

    tokens = tokenize("LIST RUN NEW HELP LOAD SAVE CLS");
    test("Command keywords", tokens.size() == 8 &&
         tokens[0].type == TokenType::LIST &&
         tokens[1].type == TokenType::RUN &&
         tokens[2].type == TokenType::NEW &&
         tokens[3].type == TokenType::HELP &&
         tokens[4].type == TokenType::LOAD &&
         tokens[5].type == TokenType::SAVE &&
         tokens[6].type == TokenType::CLS);

    // Case insensitivity
    tokens = tokenize("Print PRINT print PrInT");
    test("Case insensitive keywords", tokens.size() == 5 &&
         tokens[0].type == TokenType::PRINT &&
         tokens[1].type == TokenType::PRINT &&
         tokens[2].type == TokenType::PRINT &&
         tokens[3].type == TokenType::PRINT);
}

void test_identifiers() {
    std::cout << "\n=== Identifier Tests ===\n";

    auto tokens = tokenize("a");
    test("Variable letter uppercased", tokens.size() == 2 &&
         tokens[0].type == TokenType::IDENTIFIER && tokens[0].value == "A");

    tokens = tokenize("ABC");
    test("Multi-letter identifier kept whole", tokens.size() == 2 &&
         tokens[0].type == TokenType::IDENTIFIER && tokens[0].value == "ABC");

    tokens = tokenize("A1");
    test("Digits end an identifier", tokens.size() == 3 &&
         tokens[0].type == TokenType::IDENTIFIER &&
         tokens[1].type == TokenType::NUMBER);
}

void test_line_numbers() {
    std::cout << "\n=== Line Number Tests ===\n";

    auto tokens = tokenize("10 PRINT X");
    test("Line number at start", tokens.size() == 4 &&
         tokens[0].type == TokenType::LINE_NUMBER && tokens[0].value == "10" &&
         tokens[1].type == TokenType::PRINT);

    tokens = tokenize("   20 END");
    test("Line number after leading blanks", tokens[0].type == TokenType::LINE_NUMBER && tokens[0].value == "20");

    tokens = tokenize("10 GOTO 20");
    test("Only the first number is a line number", tokens.size() == 4 &&
         tokens[0].type == TokenType::LINE_NUMBER &&
         tokens[2].type == TokenType::NUMBER && tokens[2].value == "20");

    tokens = tokenize("65529 END");
    test("Largest line number", tokens[0].type == TokenType::LINE_NUMBER && tokens[0].value == "65529");

    test("Line number zero rejected", lex_fails("0 END"));
    test("Line number too large rejected", lex_fails("65530 END"));
}

void test_comments() {
    std::cout << "\n=== Comment Tests ===\n";

    auto tokens = tokenize("10 REM This is a comment");
    test("REM comment", tokens.size() == 3 &&
         tokens[1].type == TokenType::REM && tokens[1].value == "This is a comment");

    tokens = tokenize("REM \"quotes\" and : symbols ! are fine");
    test("REM swallows any characters", tokens.size() == 2 &&
         tokens[0].type == TokenType::REM);

    tokens = tokenize("REM");
    test("Empty REM", tokens.size() == 2 && tokens[0].type == TokenType::REM && tokens[0].value.empty());
}

void test_columns() {
    std::cout << "\n=== Column Tests ===\n";

    auto tokens = tokenize("PRINT A+1");
    test("Keyword column", tokens[0].column == 1);
    test("Identifier column", tokens[1].column == 7);
    test("Operator column", tokens[2].column == 8);
    test("Number column", tokens[3].column == 9);
}

void test_errors() {
    std::cout << "\n=== Error Tests ===\n";

    std::string message;
    test("Unterminated string", lex_fails("PRINT \"abc", &message));
    test("Unterminated string message", message.find("Unterminated string") != std::string::npos);

    test("Unexpected character", lex_fails("PRINT A # B", &message));
    test("Unexpected character message names it", message.find("'#'") != std::string::npos);

    test("Unexpected character column", [] {
        try {
            tokenize("LET A = 1 ; 2");
        } catch (const LexerError& e) {
            return e.column == 11;
        }
        return false;
    }());

    test("Number out of range", lex_fails("X=2147483648"));
    test("Largest number accepted", !lex_fails("X=2147483647"));

    test("Source line reported", [] {
        try {
            tokenize("PRINT @", 7);
        } catch (const LexerError& e) {
            return e.line == 7 && std::string(e.what()).find("7:7") != std::string::npos;
        }
        return false;
    }());
}

int main() {
    std::cout << "TinyBasic Lexer Tests\n";
    std::cout << "=====================\n";

    test_basic_tokens();
    test_keywords();
    test_identifiers();
    test_line_numbers();
    test_comments();
    test_columns();
    test_errors();

    std::cout << "\n=====================\n";
    std::cout << "Results: " << tests_passed << " passed, " << tests_failed << " failed\n";

    return tests_failed > 0 ? 1 : 0;
}

#include <iostream>
#include <fstream>
#include <sstream>
#include <cctype>
#include <optional>
#include "tinybasic/readline.hpp"
#include "tinybasic/lexer.hpp"
#include "tinybasic/parser.hpp"
#include "tinybasic/interpreter.hpp"
#include "tinybasic/error.hpp"

// Console I/O with line editing for prompts and INPUT replies
class EditlineIO : public tinybasic::ConsoleIO {
public:
    std::optional<std::string> read_line() override {
        std::string line = tinybasic::readline_getline(prompt_.c_str());
        prompt_.clear();
        if (line == "\x04") {
            return std::nullopt;  // EOF
        }
        return line;
    }
};

void print_tokens(const std::vector<tinybasic::Token>& tokens) {
    for (const auto& tok : tokens) {
        std::cout << tinybasic::token_type_name(tok.type);
        if (!tok.value.empty()) {
            std::cout << "(" << tok.value << ")";
        }
        std::cout << " ";
    }
    std::cout << std::endl;
}

// Report the runtime error of the last run, if any; returns true if there was one
bool report_error(const tinybasic::Interpreter& interp) {
    const auto& err = interp.state().error;
    if (!err) {
        return false;
    }
    std::cerr << "?" << err->message;
    if (err->line != tinybasic::DIRECT_LINE) {
        std::cerr << " in " << err->line;
    }
    std::cerr << "\n";
    return true;
}

// Load a program, run it, and feed INPUT replies from the terminal
int run_program(const std::string& source) {
    EditlineIO io;
    tinybasic::Interpreter interp(&io);

    auto errors = interp.load_program(source);
    for (const auto& e : errors) {
        std::cerr << "?" << e.what() << "\n";
    }
    if (!errors.empty()) {
        return 1;
    }

    interp.run();
    while (interp.awaiting_input()) {
        auto reply = io.read_line();
        if (!reply) {
            interp.stop();
            break;
        }
        interp.provide_input(*reply);
    }

    return report_error(interp) ? 1 : 0;
}

void dump_lines(const std::string& source, bool parse) {
    std::istringstream in(source);
    std::string text;
    int source_line = 0;

    while (std::getline(in, text)) {
        ++source_line;
        if (!parse) {
            print_tokens(tinybasic::tokenize(text, source_line));
            continue;
        }

        tinybasic::Line line = tinybasic::parse_line(text, source_line);
        if (line.line_number) {
            std::cout << *line.line_number << " ";
        }
        if (line.statement) {
            std::cout << tinybasic::to_string(*line.statement);
        }
        std::cout << "\n";
    }
}

void run_repl() {
    std::cout << "TinyBasic Interpreter\n";
    std::cout << "Type HELP for statements, SYSTEM to exit.\n\n";

    tinybasic::readline_init();

    EditlineIO io;
    tinybasic::Interpreter interp(&io);

    while (true) {
        if (!interp.awaiting_input()) {
            io.set_prompt("Ok\n");
        }

        auto line = io.read_line();
        if (!line) {
            break;
        }

        // Replies to INPUT go straight to the suspended run
        if (interp.awaiting_input()) {
            interp.provide_input(*line);
            report_error(interp);
            continue;
        }

        // Trim leading whitespace
        size_t start = 0;
        while (start < line->size() && std::isspace(static_cast<unsigned char>((*line)[start]))) start++;
        if (start >= line->size()) continue;

        tinybasic::readline_add_history(*line);

        // Get first word (uppercase for commands)
        std::string first_word;
        for (size_t pos = start; pos < line->size() && !std::isspace(static_cast<unsigned char>((*line)[pos])); ++pos) {
            first_word += static_cast<char>(std::toupper(static_cast<unsigned char>((*line)[pos])));
        }

        if (first_word == "SYSTEM" || first_word == "QUIT" || first_word == "EXIT") {
            break;
        }

        try {
            interp.load_line(*line);
        } catch (const tinybasic::TinyBasicError& e) {
            std::cerr << "?" << e.what() << "\n";
            continue;
        }
        report_error(interp);
    }
}

int main(int argc, char* argv[]) {
    enum class Mode { TOKENIZE, PARSE, RUN };
    Mode mode = Mode::RUN;  // Default to run

    int file_arg = 1;

    // Parse flags
    while (file_arg < argc && argv[file_arg][0] == '-') {
        std::string flag = argv[file_arg];
        if (flag == "--parse") {
            mode = Mode::PARSE;
        } else if (flag == "--tokenize" || flag == "-t") {
            mode = Mode::TOKENIZE;
        } else if (flag == "--run" || flag == "-r") {
            mode = Mode::RUN;
        } else if (flag == "--help" || flag == "-h") {
            std::cout << "TinyBasic Interpreter\n\n";
            std::cout << "Usage: tinybasic [OPTIONS] [filename.bas]\n\n";
            std::cout << "Options:\n";
            std::cout << "  --run, -r       Run the program (default)\n";
            std::cout << "  --parse         Parse and show each statement\n";
            std::cout << "  --tokenize, -t  Tokenize and show tokens\n";
            std::cout << "  --help, -h      Show this help\n\n";
            std::cout << "If no file is specified, enters interactive REPL mode.\n";
            std::cout << "\nInteractive commands:\n";
            std::cout << "  NEW             Clear program\n";
            std::cout << "  RUN             Run program\n";
            std::cout << "  LIST [n[-m]]    List program lines\n";
            std::cout << "  LOAD \"file\"     Load program from file\n";
            std::cout << "  SAVE \"file\"     Save program to file\n";
            std::cout << "  HELP            Show statement syntax\n";
            std::cout << "  SYSTEM          Exit interpreter\n";
            return 0;
        } else {
            std::cerr << "Unknown option: " << flag << "\n";
            return 1;
        }
        file_arg++;
    }

    if (file_arg < argc) {
        // Load file
        std::string filename = argv[file_arg];
        std::ifstream file(filename);
        if (!file) {
            std::cerr << "Error: Could not open file: " << filename << "\n";
            return 1;
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        std::string source = buffer.str();

        try {
            switch (mode) {
                case Mode::TOKENIZE:
                    dump_lines(source, false);
                    break;
                case Mode::PARSE:
                    dump_lines(source, true);
                    break;
                case Mode::RUN:
                    return run_program(source);
            }
        } catch (const tinybasic::ParseError& e) {
            std::cerr << "?" << e.what() << "\n";
            return 1;
        } catch (const tinybasic::LexerError& e) {
            std::cerr << "?" << e.what() << "\n";
            return 1;
        }
    } else {
        // Interactive mode
        run_repl();
    }

    return 0;
}

// ConsoleIO Implementation - Standard console I/O using std::cin/std::cout

#include "tinybasic/io_handler.hpp"
#include <iostream>
#include <fstream>
#include <sstream>

namespace tinybasic {

void ConsoleIO::write(const std::string& text) {
    std::cout << text;
    std::cout.flush();
}

std::optional<std::string> ConsoleIO::read_line() {
    std::cout << prompt_;
    std::cout.flush();
    prompt_.clear();

    std::string line;
    if (!std::getline(std::cin, line)) {
        return std::nullopt;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

std::optional<std::string> ConsoleIO::load_program(const std::string& name) {
    std::ifstream file(name);
    if (!file) {
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return std::nullopt;
    }
    return buffer.str();
}

bool ConsoleIO::save_program(const std::string& name, const std::string& text) {
    std::ofstream file(name, std::ios::trunc);
    if (!file) {
        return false;
    }
    file << text;
    file.close();
    return !file.fail();
}

} // namespace tinybasic

#pragma once

#include <drgrep/search.hpp>
#include <ostream>

namespace drgrep {

namespace color {

constexpr const char* RESET = "\033[0m";
constexpr const char* RED = "\033[31m";
constexpr const char* WHITE = "\033[37m";
constexpr const char* BRIGHT_BLUE = "\033[94m";
constexpr const char* BRIGHT_YELLOW = "\033[93m";

} // namespace color

// Renders search results in drgrep's block format:
//
//     source: <path>
//     line: <n>
//     <words>
//     =================================
//
class Printer {
public:
    Printer(std::ostream& out, bool color) : out_(out), color_(color) {}

    void print(const SearchResult& result);

    static const char* separator() { return "================================="; }

private:
    void colored(const std::string& text, const char* code);

    std::ostream& out_;
    bool color_;
};

} // namespace drgrep

#pragma once

#include <drgrep/regex.hpp>
#include <string>
#include <vector>

namespace drgrep {

// One space-separated word of a matching line.
struct LinePart {
    std::string text;
    bool highlighted = false;
};

struct SearchResult {
    std::vector<LinePart> parts;
    std::string source;   // file the line came from, empty for inline content
    size_t line_no = 0;   // 1-based
};

// Split into lines on '\n', dropping a trailing '\r' from each line. A
// trailing newline does not produce a final empty line.
std::vector<std::string> split_lines(const std::string& content);

// Lines containing key; ASCII case-folded unless sensitive.
std::vector<std::string> search_lines(const std::string& key,
                                      const std::string& content,
                                      bool sensitive);

std::vector<SearchResult> search_words(const std::string& key,
                                       const std::string& source,
                                       const std::string& content,
                                       bool sensitive);

std::vector<SearchResult> search_regex(const Regex& regex,
                                       const std::string& source,
                                       const std::string& content);

} // namespace drgrep

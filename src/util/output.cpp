#include <drgrep/output.hpp>

namespace drgrep {

void Printer::colored(const std::string& text, const char* code) {
    if (color_) {
        out_ << code << text << color::RESET;
    } else {
        out_ << text;
    }
}

void Printer::print(const SearchResult& result) {
    if (!result.source.empty()) {
        colored("source: " + result.source, color::BRIGHT_BLUE);
        out_ << '\n';
    }
    colored("line: " + std::to_string(result.line_no), color::RED);
    out_ << '\n';

    for (size_t i = 0; i < result.parts.size(); i++) {
        if (i > 0) out_ << ' ';
        const auto& part = result.parts[i];
        colored(part.text, part.highlighted ? color::BRIGHT_YELLOW : color::WHITE);
    }
    out_ << '\n' << separator() << "\n\n";
}

} // namespace drgrep

#include <drgrep/search.hpp>
#include <algorithm>
#include <cctype>

namespace drgrep {

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

static bool contains(const std::string& haystack, const std::string& needle, bool sensitive) {
    if (sensitive) return haystack.find(needle) != std::string::npos;
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

template<typename Pred>
static std::vector<LinePart> split_words(const std::string& line, Pred highlight) {
    std::vector<LinePart> parts;
    size_t start = 0;
    while (true) {
        size_t sp = line.find(' ', start);
        std::string word = line.substr(start, sp == std::string::npos ? std::string::npos : sp - start);
        bool hl = highlight(word);
        parts.push_back(LinePart{std::move(word), hl});
        if (sp == std::string::npos) break;
        start = sp + 1;
    }
    return parts;
}

std::vector<std::string> split_lines(const std::string& content) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < content.size()) {
        size_t nl = content.find('\n', start);
        size_t end = nl == std::string::npos ? content.size() : nl;
        std::string line = content.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
        if (nl == std::string::npos) break;
        start = nl + 1;
    }
    return lines;
}

std::vector<std::string> search_lines(const std::string& key,
                                      const std::string& content,
                                      bool sensitive) {
    std::vector<std::string> out;
    for (auto& line : split_lines(content)) {
        if (contains(line, key, sensitive)) out.push_back(std::move(line));
    }
    return out;
}

std::vector<SearchResult> search_words(const std::string& key,
                                       const std::string& source,
                                       const std::string& content,
                                       bool sensitive) {
    std::vector<SearchResult> results;
    auto lines = split_lines(content);
    for (size_t i = 0; i < lines.size(); i++) {
        if (!contains(lines[i], key, sensitive)) continue;
        SearchResult r;
        r.parts = split_words(lines[i], [&](const std::string& w) {
            return contains(w, key, sensitive);
        });
        r.source = source;
        r.line_no = i + 1;
        results.push_back(std::move(r));
    }
    return results;
}

std::vector<SearchResult> search_regex(const Regex& regex,
                                       const std::string& source,
                                       const std::string& content) {
    std::vector<SearchResult> results;
    auto lines = split_lines(content);
    for (size_t i = 0; i < lines.size(); i++) {
        if (!regex.is_match(lines[i])) continue;
        SearchResult r;
        r.parts = split_words(lines[i], [&](const std::string& w) {
            return regex.is_match(to_lower(w));
        });
        r.source = source;
        r.line_no = i + 1;
        results.push_back(std::move(r));
    }
    return results;
}

} // namespace drgrep

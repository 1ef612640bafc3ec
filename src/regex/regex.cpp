#include <drgrep/regex.hpp>

namespace drgrep {

std::string Regex::replace_all(const std::string& text,
                               const std::string& replacement) const {
    return replace_all_with(text, [&](const Match&) { return replacement; });
}

std::string Regex::replace_all_with(
    const std::string& text,
    const std::function<std::string(const Match&)>& replacement_fn) const
{
    std::string out;
    out.reserve(text.size());

    size_t last = 0;
    for (const auto& m : find_all(text)) {
        out.append(text, last, m.start - last);
        out += replacement_fn(m);
        last = m.end;
    }
    out.append(text, last, std::string::npos);
    return out;
}

std::vector<std::string> Regex::split(const std::string& text) const {
    std::vector<std::string> parts;

    size_t last = 0;
    for (const auto& m : find_all(text)) {
        parts.push_back(text.substr(last, m.start - last));
        last = m.end;
    }
    parts.push_back(text.substr(last));
    return parts;
}

// ---- One-shot helpers ----

Result<bool> regex_is_match(const std::string& pattern, const std::string& text) {
    return Regex::compile(pattern).map([&](Regex& re) { return re.is_match(text); });
}

Result<std::optional<Match>> regex_find(const std::string& pattern,
                                        const std::string& text) {
    return Regex::compile(pattern).map([&](Regex& re) { return re.find(text); });
}

Result<std::vector<Match>> regex_find_all(const std::string& pattern,
                                          const std::string& text) {
    return Regex::compile(pattern).map([&](Regex& re) { return re.find_all(text); });
}

Result<std::string> regex_replace_all(const std::string& pattern,
                                      const std::string& text,
                                      const std::string& replacement) {
    return Regex::compile(pattern).map([&](Regex& re) {
        return re.replace_all(text, replacement);
    });
}

Result<std::vector<std::string>> regex_split(const std::string& pattern,
                                             const std::string& text) {
    return Regex::compile(pattern).map([&](Regex& re) { return re.split(text); });
}

} // namespace drgrep

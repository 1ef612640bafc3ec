#include <drgrep/glob.hpp>
#include <drgrep/utf8.hpp>

namespace drgrep {

// ---- Brace expansion ----

// Index of the '}' closing the group opened at `open`, or npos when the
// group never closes.
static size_t find_group_end(const std::string& p, size_t open) {
    int depth = 0;
    for (size_t j = open; j < p.size(); j++) {
        char c = p[j];
        if (c == '\\') {
            j++;
            continue;
        }
        if (c == '{') {
            depth++;
        } else if (c == '}') {
            depth--;
            if (depth == 0) return j;
        }
    }
    return std::string::npos;
}

// Split a group body on commas that are not inside a nested group. A
// trailing empty option is dropped ("{a,}" is just "a"); a leading one is
// kept, and "{}" still yields one empty option.
static std::vector<std::string> split_options(const std::string& body) {
    std::vector<std::string> options;
    std::string cur;
    int depth = 0;

    for (size_t i = 0; i < body.size(); i++) {
        char c = body[i];
        if (c == '\\' && i + 1 < body.size()) {
            cur.push_back(c);
            cur.push_back(body[++i]);
            continue;
        }
        if (c == '{') depth++;
        if (c == '}') depth--;
        if (c == ',' && depth == 0) {
            options.push_back(std::move(cur));
            cur.clear();
            continue;
        }
        cur.push_back(c);
    }
    if (!cur.empty() || options.empty()) {
        options.push_back(std::move(cur));
    }
    return options;
}

std::vector<std::string> expand_braces(const std::string& pattern) {
    size_t i = 0;
    while (i < pattern.size()) {
        char c = pattern[i];
        if (c == '\\') {
            i += 2;
            continue;
        }
        if (c == '{') {
            size_t close = find_group_end(pattern, i);
            if (close == std::string::npos) {
                // Unbalanced: this '{' stays a literal
                i++;
                continue;
            }

            std::string prefix = pattern.substr(0, i);
            std::string suffix = pattern.substr(close + 1);

            std::vector<std::string> result;
            for (const auto& option : split_options(pattern.substr(i + 1, close - i - 1))) {
                auto expanded = expand_braces(prefix + option + suffix);
                result.insert(result.end(), expanded.begin(), expanded.end());
            }
            return result;
        }
        i++;
    }
    return {pattern};
}

// ---- Component tokenizer ----

namespace {

void flush_literal(GlobComponents& out, std::u32string& run) {
    if (run.empty()) return;
    GlobComponent comp;
    comp.kind = GlobComponent::Kind::Literal;
    comp.literal = std::move(run);
    out.push_back(std::move(comp));
    run.clear();
}

// Parse the body of a [...] class starting just after '['. Returns the
// index after the closing ']' (or the end of input when unterminated).
size_t parse_class(const std::u32string& chars, size_t i, GlobComponent& comp) {
    comp.kind = GlobComponent::Kind::CharacterClass;
    const size_t n = chars.size();

    if (i < n && chars[i] == U'!') {
        comp.negated = true;
        i++;
    }

    while (i < n && chars[i] != U']') {
        if (i + 2 < n && chars[i + 1] == U'-' && chars[i + 2] != U']') {
            // A reversed range contributes nothing
            for (char32_t c = chars[i]; c <= chars[i + 2]; c++) {
                comp.chars.insert(c);
            }
            i += 3;
        } else {
            comp.chars.insert(chars[i]);
            i++;
        }
    }

    if (i < n) i++; // skip ']'
    return i;
}

} // namespace

GlobComponents compile_glob_components(const std::string& pattern) {
    const std::u32string chars = utf8::decode(pattern).chars;
    const size_t n = chars.size();

    GlobComponents out;
    std::u32string run;

    size_t i = 0;
    while (i < n) {
        char32_t c = chars[i];
        switch (c) {
            case U'*': {
                flush_literal(out, run);
                GlobComponent comp;
                comp.kind = GlobComponent::Kind::MultiWildcard;
                out.push_back(std::move(comp));
                i++;
                break;
            }
            case U'?': {
                flush_literal(out, run);
                GlobComponent comp;
                comp.kind = GlobComponent::Kind::SingleWildcard;
                out.push_back(std::move(comp));
                i++;
                break;
            }
            case U'[': {
                flush_literal(out, run);
                GlobComponent comp;
                i = parse_class(chars, i + 1, comp);
                out.push_back(std::move(comp));
                break;
            }
            case U'\\':
                if (i + 1 < n) {
                    run.push_back(chars[i + 1]);
                    i += 2;
                } else {
                    run.push_back(U'\\');
                    i++;
                }
                break;
            default:
                run.push_back(c);
                i++;
                break;
        }
    }
    flush_literal(out, run);
    return out;
}

// ---- Glob ----

Glob Glob::compile(const std::string& pattern) {
    if (pattern.find('{') != std::string::npos && pattern.find('}') != std::string::npos) {
        GlobAlternatives alts;
        alts.patterns = expand_braces(pattern);
        alts.compiled.reserve(alts.patterns.size());
        for (const auto& p : alts.patterns) {
            alts.compiled.push_back(compile_glob_components(p));
        }
        return Glob(pattern, std::move(alts));
    }
    return Glob(pattern, compile_glob_components(pattern));
}

std::vector<std::string> Glob::alternatives() const {
    if (auto alts = std::get_if<GlobAlternatives>(&repr_)) {
        return alts->patterns;
    }
    return {};
}

const GlobComponents& Glob::components() const {
    static const GlobComponents empty;
    if (auto comps = std::get_if<GlobComponents>(&repr_)) {
        return *comps;
    }
    return empty;
}

} // namespace drgrep

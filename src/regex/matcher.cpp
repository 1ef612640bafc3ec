#include <drgrep/regex.hpp>
#include <drgrep/utf8.hpp>

namespace drgrep {

namespace {

using Kind = PatternElement::Kind;

bool is_digit(char32_t c) {
    return c >= U'0' && c <= U'9';
}

bool is_word(char32_t c) {
    return is_digit(c) || (c >= U'a' && c <= U'z') || (c >= U'A' && c <= U'Z') || c == U'_';
}

bool is_space(char32_t c) {
    return c == U' ' || c == U'\t' || c == U'\n' || c == U'\r' || c == U'\v' || c == U'\f';
}

// Single-character test for every element that consumes exactly one char.
bool matches_char(const PatternElement& e, char32_t c) {
    switch (e.kind) {
        case Kind::Literal:    return e.literal.size() == 1 && e.literal[0] == c;
        case Kind::AnyChar:    return true;
        case Kind::Digit:      return is_digit(c) != e.negated;
        case Kind::Word:       return is_word(c) != e.negated;
        case Kind::Whitespace: return is_space(c) != e.negated;
        default:               return false;
    }
}

bool at_line_start(const std::u32string& chars, size_t pos) {
    return pos == 0 || chars[pos - 1] == U'\n';
}

bool at_line_end(const std::u32string& chars, size_t pos) {
    return pos == chars.size() || chars[pos] == U'\n';
}

// Match elements [ei, last) at pos. Quantifiers consume greedily and never
// give characters back. Returns the end position on success.
std::optional<size_t> match_here(const std::vector<PatternElement>& elems,
                                 size_t ei, size_t last,
                                 const std::u32string& chars, size_t pos) {
    if (ei == last) return pos;

    const PatternElement& e = elems[ei];
    switch (e.kind) {
        case Kind::Literal: {
            size_t len = e.literal.size();
            if (pos + len > chars.size() || chars.compare(pos, len, e.literal) != 0) {
                return std::nullopt;
            }
            return match_here(elems, ei + 1, last, chars, pos + len);
        }
        case Kind::AnyChar:
        case Kind::Digit:
        case Kind::Word:
        case Kind::Whitespace:
            if (pos >= chars.size() || !matches_char(e, chars[pos])) return std::nullopt;
            return match_here(elems, ei + 1, last, chars, pos + 1);

        case Kind::Quantified: {
            const PatternElement& inner = *e.inner;
            size_t end = pos;
            if (e.quantifier == QuantifierKind::ZeroOrOne) {
                if (end < chars.size() && matches_char(inner, chars[end])) end++;
            } else {
                while (end < chars.size() && matches_char(inner, chars[end])) end++;
                if (e.quantifier == QuantifierKind::OneOrMore && end == pos) {
                    return std::nullopt;
                }
            }
            return match_here(elems, ei + 1, last, chars, end);
        }

        // Sentinels only appear at the ends and are stripped by the caller;
        // treat a stray one as a zero-width boundary check.
        case Kind::StartAnchor:
            if (!at_line_start(chars, pos)) return std::nullopt;
            return match_here(elems, ei + 1, last, chars, pos);
        case Kind::EndAnchor:
            if (!at_line_end(chars, pos)) return std::nullopt;
            return match_here(elems, ei + 1, last, chars, pos);
    }
    return std::nullopt;
}

Match make_match(const std::string& text, const utf8::DecodedText& decoded,
                 std::pair<size_t, size_t> span) {
    Match m;
    m.start = decoded.offsets[span.first];
    m.end = decoded.offsets[span.second];
    m.text = text.substr(m.start, m.end - m.start);
    return m;
}

} // namespace

std::optional<std::pair<size_t, size_t>> Regex::search(const std::u32string& chars,
                                                       size_t from) const {
    // The empty pattern only matches the empty text
    if (elements_.empty()) {
        if (chars.empty() && from == 0) return std::make_pair(size_t{0}, size_t{0});
        return std::nullopt;
    }

    size_t first = 0;
    size_t last = elements_.size();
    bool anchored_start = elements_.front().kind == Kind::StartAnchor;
    if (anchored_start) first++;
    bool anchored_end = last > first && elements_.back().kind == Kind::EndAnchor;
    if (anchored_end) last--;

    for (size_t pos = from; pos <= chars.size(); pos++) {
        if (anchored_start && !at_line_start(chars, pos)) continue;

        auto end = match_here(elements_, first, last, chars, pos);
        if (!end) continue;
        if (anchored_end && !at_line_end(chars, *end)) continue;
        return std::make_pair(pos, *end);
    }
    return std::nullopt;
}

bool Regex::is_match(const std::string& text) const {
    return search(utf8::decode(text).chars, 0).has_value();
}

std::optional<Match> Regex::find(const std::string& text) const {
    auto decoded = utf8::decode(text);
    auto span = search(decoded.chars, 0);
    if (!span) return std::nullopt;
    return make_match(text, decoded, *span);
}

std::vector<Match> Regex::find_all(const std::string& text) const {
    auto decoded = utf8::decode(text);
    const size_t n = decoded.chars.size();

    std::vector<Match> matches;
    size_t cursor = 0;
    while (cursor <= n) {
        auto span = search(decoded.chars, cursor);
        if (!span) break;
        matches.push_back(make_match(text, decoded, *span));
        // Step past empty matches so the scan always moves forward
        cursor = span->second > span->first ? span->second : span->first + 1;
    }
    return matches;
}

} // namespace drgrep

#pragma once

#include <drgrep/result.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace drgrep {

enum class QuantifierKind {
    ZeroOrMore,  // *
    OneOrMore,   // +
    ZeroOrOne    // ?
};

// One compiled regex element. Only the fields relevant to `kind` are set.
struct PatternElement {
    enum class Kind {
        Literal,      // literal run, compared as a whole
        AnyChar,      // .
        Digit,        // \d  (\D when negated)
        Word,         // \w  (\W when negated)
        Whitespace,   // \s  (\S when negated)
        StartAnchor,  // leading ^
        EndAnchor,    // trailing $
        Quantified    // inner element followed by *, + or ?
    };

    Kind kind = Kind::Literal;
    std::u32string literal;
    bool negated = false;
    QuantifierKind quantifier = QuantifierKind::ZeroOrMore;
    std::shared_ptr<const PatternElement> inner;

    static PatternElement make_literal(std::u32string text);
    static PatternElement make(Kind kind, bool negated = false);
    static PatternElement make_quantified(PatternElement inner, QuantifierKind q);
};

// A single match. Offsets are byte offsets into the searched text.
struct Match {
    std::string text;
    size_t start = 0;
    size_t end = 0;
};

// Compile-once, match-many regex over a small dialect:
// literals, ., \d \w \s (and negations), * + ?, leading ^, trailing $.
// ^ and $ are line-relative: they also hold right after / right before '\n'.
class Regex {
public:
    static Result<Regex> compile(const std::string& pattern);

    const std::string& pattern() const { return pattern_; }
    const std::vector<PatternElement>& elements() const { return elements_; }

    bool is_match(const std::string& text) const;
    std::optional<Match> find(const std::string& text) const;
    std::vector<Match> find_all(const std::string& text) const;

    std::string replace_all(const std::string& text,
                            const std::string& replacement) const;
    std::string replace_all_with(
        const std::string& text,
        const std::function<std::string(const Match&)>& replacement_fn) const;

    // Segments between matches. A match at the very start or end of the
    // text yields an empty leading or trailing segment.
    std::vector<std::string> split(const std::string& text) const;

private:
    Regex(std::string pattern, std::vector<PatternElement> elements)
        : pattern_(std::move(pattern)), elements_(std::move(elements)) {}

    // First match starting at character index >= from, as [start, end)
    // character indices.
    std::optional<std::pair<size_t, size_t>> search(const std::u32string& chars,
                                                    size_t from) const;

    std::string pattern_;
    std::vector<PatternElement> elements_;
};

// One-shot helpers: compile `pattern`, then run the operation.
Result<bool> regex_is_match(const std::string& pattern, const std::string& text);
Result<std::optional<Match>> regex_find(const std::string& pattern,
                                        const std::string& text);
Result<std::vector<Match>> regex_find_all(const std::string& pattern,
                                          const std::string& text);
Result<std::string> regex_replace_all(const std::string& pattern,
                                      const std::string& text,
                                      const std::string& replacement);
Result<std::vector<std::string>> regex_split(const std::string& pattern,
                                             const std::string& text);

} // namespace drgrep

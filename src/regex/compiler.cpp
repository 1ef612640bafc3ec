#include <drgrep/regex.hpp>
#include <drgrep/utf8.hpp>

namespace drgrep {

// ---- Element constructors ----

PatternElement PatternElement::make_literal(std::u32string text) {
    PatternElement e;
    e.kind = Kind::Literal;
    e.literal = std::move(text);
    return e;
}

PatternElement PatternElement::make(Kind kind, bool negated) {
    PatternElement e;
    e.kind = kind;
    e.negated = negated;
    return e;
}

PatternElement PatternElement::make_quantified(PatternElement inner, QuantifierKind q) {
    PatternElement e;
    e.kind = Kind::Quantified;
    e.quantifier = q;
    e.inner = std::make_shared<const PatternElement>(std::move(inner));
    return e;
}

// ---- Compiler ----

namespace {

class RegexCompiler {
public:
    explicit RegexCompiler(const std::string& pattern)
        : pattern_(pattern), chars_(utf8::decode(pattern).chars) {}

    Result<std::vector<PatternElement>> run() {
        bool start_anchor = false;
        bool end_anchor = false;
        const size_t n = chars_.size();

        size_t i = 0;
        while (i < n) {
            char32_t c = chars_[i];

            if (c == U'\\') {
                if (i + 1 >= n) {
                    // Lone trailing backslash
                    run_.push_back(U'\\');
                    i++;
                    continue;
                }
                char32_t esc = chars_[i + 1];
                switch (esc) {
                    case U'd': push(PatternElement::Kind::Digit, false); break;
                    case U'D': push(PatternElement::Kind::Digit, true); break;
                    case U'w': push(PatternElement::Kind::Word, false); break;
                    case U'W': push(PatternElement::Kind::Word, true); break;
                    case U's': push(PatternElement::Kind::Whitespace, false); break;
                    case U'S': push(PatternElement::Kind::Whitespace, true); break;
                    default:   run_.push_back(esc); break;
                }
                i += 2;
                continue;
            }

            if (c == U'^' && i == 0) {
                start_anchor = true;
            } else if (c == U'$' && i == n - 1) {
                end_anchor = true;
            } else if (c == U'.') {
                push(PatternElement::Kind::AnyChar, false);
            } else if (c == U'*' || c == U'+' || c == U'?') {
                auto status = quantify(c, i);
                if (status.is_err()) return std::move(status).error();
            } else {
                run_.push_back(c);
            }
            i++;
        }
        flush();

        if (start_anchor) {
            elements_.insert(elements_.begin(),
                PatternElement::make(PatternElement::Kind::StartAnchor));
        }
        if (end_anchor) {
            elements_.push_back(PatternElement::make(PatternElement::Kind::EndAnchor));
        }
        return Result<std::vector<PatternElement>>::ok(std::move(elements_));
    }

private:
    void flush() {
        if (!run_.empty()) {
            elements_.push_back(PatternElement::make_literal(std::move(run_)));
            run_.clear();
        }
    }

    void push(PatternElement::Kind kind, bool negated) {
        flush();
        elements_.push_back(PatternElement::make(kind, negated));
    }

    // Wrap the element immediately before the quantifier. Within a literal
    // run that is only the run's last character.
    Status quantify(char32_t q, size_t pos) {
        QuantifierKind kind = q == U'*' ? QuantifierKind::ZeroOrMore
                            : q == U'+' ? QuantifierKind::OneOrMore
                                        : QuantifierKind::ZeroOrOne;

        if (!run_.empty()) {
            char32_t last = run_.back();
            run_.pop_back();
            flush();
            elements_.push_back(PatternElement::make_quantified(
                PatternElement::make_literal(std::u32string(1, last)), kind));
            return ok_status();
        }

        if (elements_.empty()) {
            return error("quantifier '" + utf8::encode(q) +
                         "' without preceding element", pos);
        }
        if (elements_.back().kind == PatternElement::Kind::Quantified) {
            return error("quantifier '" + utf8::encode(q) +
                         "' follows another quantifier", pos);
        }

        PatternElement inner = std::move(elements_.back());
        elements_.pop_back();
        elements_.push_back(PatternElement::make_quantified(std::move(inner), kind));
        return ok_status();
    }

    DrgrepError error(const std::string& what, size_t pos) const {
        return DrgrepError{DrgrepError::Parse,
            "regex syntax error: " + what + " at position " + std::to_string(pos),
            "in pattern '" + pattern_ + "'; escape it with '\\' to match it literally"};
    }

    const std::string& pattern_;
    std::u32string chars_;
    std::u32string run_;
    std::vector<PatternElement> elements_;
};

} // namespace

Result<Regex> Regex::compile(const std::string& pattern) {
    auto elements = RegexCompiler(pattern).run();
    if (elements.is_err()) return std::move(elements).error();
    return Result<Regex>::ok(Regex(pattern, std::move(elements).value()));
}

} // namespace drgrep

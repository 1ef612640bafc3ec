#pragma once

#include <drgrep/result.hpp>
#include <filesystem>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace drgrep {

struct GlobComponent {
    enum class Kind {
        Literal,         // exact text
        SingleWildcard,  // ?
        MultiWildcard,   // *  (any run, including empty; crosses '/')
        CharacterClass   // [abc], [a-z], [!...]
    };

    Kind kind = Kind::Literal;
    std::u32string literal;
    std::set<char32_t> chars;
    bool negated = false;
};

using GlobComponents = std::vector<GlobComponent>;

// Brace-free alternatives produced by expanding {a,b} groups, each kept
// both as source text and in compiled form.
struct GlobAlternatives {
    std::vector<std::string> patterns;
    std::vector<GlobComponents> compiled;
};

// Compiled glob: either a component sequence or, when the source holds
// balanced {...} syntax, a set of expanded alternatives. Compilation never
// fails; malformed braces and classes degrade to literals.
class Glob {
public:
    static Glob compile(const std::string& pattern);

    const std::string& pattern() const { return pattern_; }
    bool is_expanded() const { return std::holds_alternative<GlobAlternatives>(repr_); }

    // Empty for the component representation.
    std::vector<std::string> alternatives() const;
    // Empty for the expanded representation.
    const GlobComponents& components() const;

    bool matches(const std::string& candidate) const;

    // Depth-first walk of base_dir; every entry whose full path string
    // matches is returned, in directory-read order, without duplicates.
    // A symlink to a directory is tested like any entry but never
    // descended. Any directory read failure, at any depth, aborts the
    // walk with an IO error.
    Result<std::vector<std::filesystem::path>> find_files(
        const std::filesystem::path& base_dir) const;

private:
    Glob(std::string pattern, std::variant<GlobComponents, GlobAlternatives> repr)
        : pattern_(std::move(pattern)), repr_(std::move(repr)) {}

    std::string pattern_;
    std::variant<GlobComponents, GlobAlternatives> repr_;
};

// Expand every top-level {a,b,...} group, left group varying slowest:
// "a{b,c}d" -> {"abd", "acd"}. Nested groups expand recursively.
// Backslash escapes are kept in the output so each result still compiles
// to the same literals.
std::vector<std::string> expand_braces(const std::string& pattern);

// Tokenize a brace-free glob into components.
GlobComponents compile_glob_components(const std::string& pattern);

// Backtracking match of a component sequence against candidate text.
bool match_glob_components(const GlobComponents& components,
                           const std::string& candidate);

} // namespace drgrep

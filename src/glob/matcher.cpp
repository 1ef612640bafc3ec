#include <drgrep/glob.hpp>
#include <drgrep/utf8.hpp>
#include <algorithm>

namespace drgrep {

using Kind = GlobComponent::Kind;

// Recursive matcher over (component index, text position). '*' first tries
// to consume nothing, then one more character at a time.
static bool match_from(const GlobComponents& comps, size_t ci,
                       const std::u32string& text, size_t ti) {
    if (ci == comps.size()) return ti == text.size();

    if (ti == text.size()) {
        // Only trailing '*'s can absorb the empty remainder
        return std::all_of(comps.begin() + ci, comps.end(), [](const GlobComponent& c) {
            return c.kind == Kind::MultiWildcard;
        });
    }

    const GlobComponent& comp = comps[ci];
    switch (comp.kind) {
        case Kind::Literal: {
            size_t len = comp.literal.size();
            if (ti + len > text.size() || text.compare(ti, len, comp.literal) != 0) {
                return false;
            }
            return match_from(comps, ci + 1, text, ti + len);
        }
        case Kind::SingleWildcard:
            return match_from(comps, ci + 1, text, ti + 1);

        case Kind::MultiWildcard:
            if (match_from(comps, ci + 1, text, ti)) return true;
            return match_from(comps, ci, text, ti + 1);

        case Kind::CharacterClass: {
            bool member = comp.chars.count(text[ti]) > 0;
            if (member == comp.negated) return false;
            return match_from(comps, ci + 1, text, ti + 1);
        }
    }
    return false;
}

bool match_glob_components(const GlobComponents& components,
                           const std::string& candidate) {
    return match_from(components, 0, utf8::decode(candidate).chars, 0);
}

bool Glob::matches(const std::string& candidate) const {
    const std::u32string text = utf8::decode(candidate).chars;

    if (auto alts = std::get_if<GlobAlternatives>(&repr_)) {
        return std::any_of(alts->compiled.begin(), alts->compiled.end(),
            [&](const GlobComponents& comps) { return match_from(comps, 0, text, 0); });
    }
    return match_from(std::get<GlobComponents>(repr_), 0, text, 0);
}

} // namespace drgrep

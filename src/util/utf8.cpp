#include <drgrep/utf8.hpp>

namespace drgrep::utf8 {

// Malformed bytes 0x80-0xFF decode to U+DC80-U+DCFF. Lone surrogates
// never come out of well-formed input, so each raw byte keeps its identity.
static constexpr char32_t kRawByteBase = 0xDC00;

static bool is_raw_byte(char32_t cp) {
    return cp >= kRawByteBase + 0x80 && cp <= kRawByteBase + 0xFF;
}

// Decode one code point starting at text[i]. Returns the sequence length,
// or 0 when the bytes at i do not start a well-formed sequence.
static size_t decode_one(const std::string& text, size_t i, char32_t& out) {
    auto byte = [&](size_t k) { return static_cast<unsigned char>(text[k]); };
    unsigned char lead = byte(i);

    size_t len;
    char32_t cp;
    char32_t min;
    if (lead < 0x80) {
        out = lead;
        return 1;
    } else if ((lead & 0xE0) == 0xC0) {
        len = 2; cp = lead & 0x1F; min = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        len = 3; cp = lead & 0x0F; min = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        len = 4; cp = lead & 0x07; min = 0x10000;
    } else {
        return 0;
    }

    if (i + len > text.size()) return 0;
    for (size_t k = 1; k < len; k++) {
        unsigned char c = byte(i + k);
        if ((c & 0xC0) != 0x80) return 0;
        cp = (cp << 6) | (c & 0x3F);
    }
    // Reject overlong forms, surrogates and out-of-range values
    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return 0;

    out = cp;
    return len;
}

DecodedText decode(const std::string& text) {
    DecodedText out;
    out.chars.reserve(text.size());
    out.offsets.reserve(text.size() + 1);

    size_t i = 0;
    while (i < text.size()) {
        char32_t cp;
        size_t len = decode_one(text, i, cp);
        out.offsets.push_back(i);
        if (len == 0) {
            out.chars.push_back(kRawByteBase + static_cast<unsigned char>(text[i]));
            i += 1;
        } else {
            out.chars.push_back(cp);
            i += len;
        }
    }
    out.offsets.push_back(text.size());
    return out;
}

std::string encode(char32_t cp) {
    std::string out;
    if (is_raw_byte(cp)) {
        out.push_back(static_cast<char>(cp - kRawByteBase));
    } else if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    return out;
}

std::string encode(const std::u32string& chars) {
    std::string out;
    out.reserve(chars.size());
    for (char32_t c : chars) out += encode(c);
    return out;
}

bool is_valid(const std::string& bytes) {
    size_t i = 0;
    while (i < bytes.size()) {
        char32_t cp;
        size_t len = decode_one(bytes, i, cp);
        if (len == 0) return false;
        i += len;
    }
    return true;
}

} // namespace drgrep::utf8

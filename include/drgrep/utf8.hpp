#pragma once

#include <string>
#include <vector>
#include <cstddef>

namespace drgrep::utf8 {

// Text decoded to code points, with the byte offset of every character.
// offsets.size() == chars.size() + 1; the last entry is the byte length.
struct DecodedText {
    std::u32string chars;
    std::vector<size_t> offsets;
};

// Each byte of a malformed sequence decodes to its own lone surrogate,
// U+DC80 + (byte - 0x80), so distinct bad bytes stay distinct.
DecodedText decode(const std::string& text);

// Code points produced for malformed bytes encode back to the raw byte.
std::string encode(char32_t cp);
std::string encode(const std::u32string& chars);

// True when the whole buffer is well-formed UTF-8.
bool is_valid(const std::string& bytes);

} // namespace drgrep::utf8

// ============================================================================
// Scriptum - UTF-8 Helpers Implementation
// ============================================================================

#include "scriptum/utf8.hpp"

#include <cstdint>
#include <format>

namespace scriptum::utf8 {

namespace {

/// Decode one sequence starting at bytes[pos]
/// @return Number of bytes consumed, or 0 if the sequence is malformed
std::size_t decode_one(std::string_view bytes, std::size_t pos, char32_t& codepoint) noexcept {
    const auto lead = static_cast<std::uint8_t>(bytes[pos]);

    if (lead < 0x80) {
        codepoint = lead;
        return 1;
    }

    std::size_t length = 0;
    char32_t value = 0;
    char32_t minimum = 0;

    if ((lead & 0xE0) == 0xC0) {
        length = 2;
        value = lead & 0x1F;
        minimum = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        value = lead & 0x0F;
        minimum = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        value = lead & 0x07;
        minimum = 0x10000;
    } else {
        return 0;  // Continuation byte or 0xF8..0xFF as lead
    }

    if (pos + length > bytes.size()) {
        return 0;
    }

    for (std::size_t i = 1; i < length; ++i) {
        const auto next = static_cast<std::uint8_t>(bytes[pos + i]);
        if ((next & 0xC0) != 0x80) {
            return 0;
        }
        value = (value << 6) | (next & 0x3F);
    }

    // Overlong, surrogate or out of range
    if (value < minimum || (value >= 0xD800 && value <= 0xDFFF) || value > 0x10FFFF) {
        return 0;
    }

    codepoint = value;
    return length;
}

} // namespace

bool is_valid(std::string_view bytes) noexcept {
    std::size_t pos = 0;
    while (pos < bytes.size()) {
        char32_t codepoint = 0;
        const std::size_t consumed = decode_one(bytes, pos, codepoint);
        if (consumed == 0) {
            return false;
        }
        pos += consumed;
    }
    return true;
}

std::u32string decode(std::string_view bytes) {
    std::u32string codepoints;
    codepoints.reserve(bytes.size());

    std::size_t pos = 0;
    while (pos < bytes.size()) {
        char32_t codepoint = 0;
        const std::size_t consumed = decode_one(bytes, pos, codepoint);
        if (consumed == 0) {
            codepoints.push_back(REPLACEMENT_CHARACTER);
            ++pos;
        } else {
            codepoints.push_back(codepoint);
            pos += consumed;
        }
    }

    return codepoints;
}

void append(std::string& out, char32_t codepoint) {
    if (codepoint < 0x80) {
        out.push_back(static_cast<char>(codepoint));
    } else if (codepoint < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (codepoint >> 6)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else if (codepoint < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (codepoint >> 12)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (codepoint >> 18)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    }
}

std::string from_latin1(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (char byte : bytes) {
        append(out, static_cast<std::uint8_t>(byte));
    }
    return out;
}

bool is_whitespace(char32_t codepoint) noexcept {
    switch (codepoint) {
        case U'\t': case U'\n': case U'\v': case U'\f': case U'\r':
        case U'\x1C': case U'\x1D': case U'\x1E': case U'\x1F':
        case U' ':
        case U'\x85':  // Next line
        case U'\u00A0':  // No-break space
        case U'\u1680':  // Ogham space mark
        case U'\u2028': case U'\u2029':
        case U'\u202F':
        case U'\u205F':
        case U'\u3000':
            return true;
        default:
            return codepoint >= U'\u2000' && codepoint <= U'\u200A';
    }
}

bool is_blank(std::string_view bytes) {
    for (char32_t codepoint : decode(bytes)) {
        if (!is_whitespace(codepoint)) {
            return false;
        }
    }
    return true;
}

std::string format_codepoint(char32_t codepoint) {
    return std::format("U+{:04X}", static_cast<std::uint32_t>(codepoint));
}

} // namespace scriptum::utf8

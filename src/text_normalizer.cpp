// ============================================================================
// Scriptum - Text Normalizer Implementation
// ============================================================================

#include "scriptum/text_normalizer.hpp"

#include <algorithm>
#include <array>

namespace scriptum {

namespace {

/// A non-ASCII character whose full uppercase form is made of letters A-Z
struct AsciiUppercase {
    std::string_view utf8;
    std::string_view upper;
};

constexpr std::array<AsciiUppercase, 10> ASCII_UPPERCASE_FORMS = {{
    {"\xC3\x9F", "SS"},       // U+00DF LATIN SMALL LETTER SHARP S
    {"\xC4\xB1", "I"},        // U+0131 LATIN SMALL LETTER DOTLESS I
    {"\xC5\xBF", "S"},        // U+017F LATIN SMALL LETTER LONG S
    {"\xEF\xAC\x80", "FF"},   // U+FB00 LATIN SMALL LIGATURE FF
    {"\xEF\xAC\x81", "FI"},   // U+FB01 LATIN SMALL LIGATURE FI
    {"\xEF\xAC\x82", "FL"},   // U+FB02 LATIN SMALL LIGATURE FL
    {"\xEF\xAC\x83", "FFI"},  // U+FB03 LATIN SMALL LIGATURE FFI
    {"\xEF\xAC\x84", "FFL"},  // U+FB04 LATIN SMALL LIGATURE FFL
    {"\xEF\xAC\x85", "ST"},   // U+FB05 LATIN SMALL LIGATURE LONG S T
    {"\xEF\xAC\x86", "ST"},   // U+FB06 LATIN SMALL LIGATURE ST
}};

constexpr char to_upper_ascii(char c) noexcept {
    return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
}

/// Uppercase ASCII letters and expand the forms above; other bytes are copied.
/// Table entries start with a UTF-8 lead byte, so a match never begins inside
/// another character's sequence.
std::string uppercase(std::string_view text) {
    std::string upper;
    upper.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size()) {
        if (static_cast<unsigned char>(text[i]) < 0x80) {
            upper.push_back(to_upper_ascii(text[i]));
            ++i;
            continue;
        }

        const std::string_view rest = text.substr(i);
        const auto form = std::find_if(
            ASCII_UPPERCASE_FORMS.begin(), ASCII_UPPERCASE_FORMS.end(),
            [rest](const AsciiUppercase& entry) { return rest.starts_with(entry.utf8); });

        if (form != ASCII_UPPERCASE_FORMS.end()) {
            upper += form->upper;
            i += form->utf8.size();
        } else {
            upper.push_back(text[i]);
            ++i;
        }
    }

    return upper;
}

} // namespace

std::string TextNormalizer::normalize(std::string_view text) {
    std::string normalized = uppercase(text);

    // Remaining non-ASCII bytes are >= 0x80 and never land in A-Z
    std::erase_if(normalized, [](char c) { return !is_alphabet_letter(c); });
    return normalized;
}

std::string TextNormalizer::to_upper(std::string_view text) {
    return uppercase(text);
}

bool TextNormalizer::contains_letter(std::string_view text) noexcept {
    return std::any_of(text.begin(), text.end(), is_alphabet_letter);
}

} // namespace scriptum

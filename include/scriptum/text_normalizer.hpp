// ============================================================================
// Scriptum - Text Normalizer
// ============================================================================
// Reduces arbitrary text to the alphabet the classical Vigenère cipher works
// on: uppercase ASCII letters A-Z. Everything else (digits, punctuation,
// whitespace, accented letters, other scripts) is discarded.
//
// Characters whose uppercase form is plain ASCII are uppercased first, so
// they keep their letters: "ß" -> "SS", "ı" -> "I", the "ﬁ" ligature -> "FI".
//
// Example: "Ataque al amanecer!" -> "ATAQUEALAMANECER"
//          "Straße"              -> "STRASSE"
// ============================================================================

#ifndef SCRIPTUM_TEXT_NORMALIZER_HPP
#define SCRIPTUM_TEXT_NORMALIZER_HPP

#include <string>
#include <string_view>

namespace scriptum {

/// Projects text onto the A-Z alphabet
class TextNormalizer {
public:
    TextNormalizer() = delete;

    /// Uppercase the text and keep only the letters A-Z
    /// @param text Any UTF-8 text
    /// @return The letters-only projection (may be empty)
    [[nodiscard]] static std::string normalize(std::string_view text);

    /// Uppercase the text as normalize() does, leaving every other character untouched
    [[nodiscard]] static std::string to_upper(std::string_view text);

    /// Check whether a byte is one of the letters A-Z
    [[nodiscard]] static constexpr bool is_alphabet_letter(char c) noexcept {
        return c >= 'A' && c <= 'Z';
    }

    /// Check whether the text contains at least one letter A-Z
    [[nodiscard]] static bool contains_letter(std::string_view text) noexcept;
};

} // namespace scriptum

#endif // SCRIPTUM_TEXT_NORMALIZER_HPP

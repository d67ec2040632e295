// ============================================================================
// Scriptum - UTF-8 Helpers
// ============================================================================
// Minimal UTF-8 support needed by the validator and the file layer:
// - Strict validation (for deciding whether a file needs a fallback)
// - Lenient decoding to codepoints (for scanning keys)
// - Latin-1 to UTF-8 transcoding
// - Unicode whitespace classification and U+XXXX formatting
// ============================================================================

#ifndef SCRIPTUM_UTF8_HPP
#define SCRIPTUM_UTF8_HPP

#include <string>
#include <string_view>

namespace scriptum::utf8 {

/// Codepoint substituted for malformed sequences by decode()
inline constexpr char32_t REPLACEMENT_CHARACTER = U'\uFFFD';

/// Check that a byte sequence is well-formed UTF-8
/// Rejects overlong encodings, surrogates and codepoints above U+10FFFF.
[[nodiscard]] bool is_valid(std::string_view bytes) noexcept;

/// Decode UTF-8 into codepoints
/// Each malformed byte becomes REPLACEMENT_CHARACTER; decoding never fails.
[[nodiscard]] std::u32string decode(std::string_view bytes);

/// Append the UTF-8 encoding of a codepoint to out
void append(std::string& out, char32_t codepoint);

/// Interpret every byte as a Latin-1 (ISO-8859-1) character and re-encode as UTF-8
[[nodiscard]] std::string from_latin1(std::string_view bytes);

/// Whitespace as understood by Unicode (ASCII controls, NBSP, U+2000..U+200A, ...)
/// Zero-width characters such as U+200B are NOT whitespace.
[[nodiscard]] bool is_whitespace(char32_t codepoint) noexcept;

/// True if the text is empty or made of whitespace only
[[nodiscard]] bool is_blank(std::string_view bytes);

/// Format a codepoint as "U+XXXX" (at least four hex digits, uppercase)
[[nodiscard]] std::string format_codepoint(char32_t codepoint);

} // namespace scriptum::utf8

#endif // SCRIPTUM_UTF8_HPP

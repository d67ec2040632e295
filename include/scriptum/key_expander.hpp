// ============================================================================
// Scriptum - Key Expander
// ============================================================================
// Stretches a key to the length of the text it is applied to by repeating it
// and cutting the result:
//
//   text = "HOLAMUNDO", key = "AB"  ->  "ABABABABA"
// ============================================================================

#ifndef SCRIPTUM_KEY_EXPANDER_HPP
#define SCRIPTUM_KEY_EXPANDER_HPP

#include "types.hpp"
#include <string>
#include <string_view>

namespace scriptum {

/// Repeats a key to match a normalized text
class KeyExpander {
public:
    KeyExpander() = delete;

    /// Expand a key to the length of a normalized text
    /// @param normalized_text Text already reduced to A-Z
    /// @param key Raw key (normalized again here)
    /// @return Key of exactly normalized_text.size() letters, or ErrorCode::EmptyKey
    ///         if the key has no letters A-Z
    [[nodiscard]] static Result<std::string> expand(
        std::string_view normalized_text,
        std::string_view key
    );
};

} // namespace scriptum

#endif // SCRIPTUM_KEY_EXPANDER_HPP

// ============================================================================
// Scriptum - Key Expander Implementation
// ============================================================================

#include "scriptum/key_expander.hpp"
#include "scriptum/text_normalizer.hpp"

namespace scriptum {

Result<std::string> KeyExpander::expand(std::string_view normalized_text, std::string_view key) {
    const std::string normalized_key = TextNormalizer::normalize(key);
    if (normalized_key.empty()) {
        return std::unexpected(ErrorCode::EmptyKey);
    }

    const std::size_t repetitions = normalized_text.size() / normalized_key.size() + 1;

    std::string expanded;
    expanded.reserve(repetitions * normalized_key.size());
    for (std::size_t i = 0; i < repetitions; ++i) {
        expanded += normalized_key;
    }

    expanded.resize(normalized_text.size());
    return expanded;
}

} // namespace scriptum

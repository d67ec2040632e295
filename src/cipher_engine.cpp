// ============================================================================
// Scriptum - Cipher Engine Implementation
// ============================================================================

#include "scriptum/cipher_engine.hpp"
#include "scriptum/key_expander.hpp"
#include "scriptum/text_normalizer.hpp"

namespace scriptum {

CipherEngine::CipherEngine(ValidationPolicy policy)
    : validator_(std::move(policy)) {}

// ============================================================================
// Internal Implementation
// ============================================================================

DetailedResult<std::string> CipherEngine::transform(
    std::string_view text,
    std::string_view key,
    Direction direction
) {
    const std::string normalized_text = TextNormalizer::normalize(text);

    auto expanded_key = KeyExpander::expand(normalized_text, key);
    if (!expanded_key) {
        return std::unexpected(Error::from(expanded_key.error()));
    }

    std::string output(normalized_text.size(), 'A');
    for (std::size_t i = 0; i < normalized_text.size(); ++i) {
        const int letter = normalized_text[i] - 'A';
        const int shift = (*expanded_key)[i] - 'A';

        // Adding ALPHABET_SIZE keeps the difference non-negative before the modulo
        const int shifted = direction == Direction::Encrypt
            ? (letter + shift) % constants::ALPHABET_SIZE
            : (letter - shift + constants::ALPHABET_SIZE) % constants::ALPHABET_SIZE;

        output[i] = static_cast<char>('A' + shifted);
    }

    return output;
}

// ============================================================================
// Encryption / Decryption
// ============================================================================

DetailedResult<std::string> CipherEngine::encrypt(
    std::string_view plaintext,
    std::string_view key
) const {
    if (auto validation = validator_.validate(plaintext, key); !validation) {
        return std::unexpected(validation.error());
    }

    return transform(plaintext, key, Direction::Encrypt);
}

DetailedResult<Decryption> CipherEngine::decrypt(
    std::string_view ciphertext,
    std::string_view key
) const {
    if (auto validation = validator_.validate(ciphertext, key); !validation) {
        return std::unexpected(validation.error());
    }

    auto plaintext = transform(ciphertext, key, Direction::Decrypt);
    if (!plaintext) {
        return std::unexpected(plaintext.error());
    }

    Decryption decryption;
    decryption.likely_wrong_key = !TextNormalizer::contains_letter(*plaintext);
    decryption.plaintext = std::move(*plaintext);
    return decryption;
}

} // namespace scriptum

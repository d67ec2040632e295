// ============================================================================
// Scriptum - Cipher Engine
// ============================================================================
// The CipherEngine runs the full Vigenère pipeline:
//
//   raw text + raw key -> KeyValidator -> TextNormalizer + KeyExpander
//                      -> modular shift -> A-Z output
//
// Encryption:  C[i] = (P[i] + K[i]) mod 26
// Decryption:  P[i] = (C[i] - K[i]) mod 26
//
// Only letters survive: "Ataque al amanecer!" encrypts the 16 letters of
// "ATAQUEALAMANECER", and decrypting gives those 16 letters back, not the
// original spacing, case or punctuation.
// ============================================================================

#ifndef SCRIPTUM_CIPHER_ENGINE_HPP
#define SCRIPTUM_CIPHER_ENGINE_HPP

#include "key_validator.hpp"
#include "types.hpp"
#include <string>
#include <string_view>

namespace scriptum {

/// Result of a decryption
struct Decryption {
    /// Decrypted letters A-Z
    std::string plaintext;

    /// Advisory: the output contains no letters, the key is probably wrong.
    /// Never prevents the plaintext from being returned.
    bool likely_wrong_key = false;
};

/// Vigenère encryption and decryption over A-Z
class CipherEngine {
public:
    explicit CipherEngine(ValidationPolicy policy = {});

    /// Encrypt a text with a key
    /// @param plaintext Any text; only its letters are encrypted
    /// @param key Key made of letters A-Z only
    /// @return Ciphertext (A-Z, one letter per plaintext letter), or the validation error
    [[nodiscard]] DetailedResult<std::string> encrypt(
        std::string_view plaintext,
        std::string_view key
    ) const;

    /// Decrypt a ciphertext with a key
    /// @param ciphertext Text produced by encrypt() (normalized again here)
    /// @param key The key used for encryption
    /// @return The decrypted letters and the wrong-key advisory, or the validation error
    [[nodiscard]] DetailedResult<Decryption> decrypt(
        std::string_view ciphertext,
        std::string_view key
    ) const;

    [[nodiscard]] const KeyValidator& validator() const noexcept { return validator_; }

private:
    enum class Direction { Encrypt, Decrypt };

    /// Normalize, expand and shift; the caller has validated the input
    [[nodiscard]] static DetailedResult<std::string> transform(
        std::string_view text,
        std::string_view key,
        Direction direction
    );

    KeyValidator validator_;
};

} // namespace scriptum

#endif // SCRIPTUM_CIPHER_ENGINE_HPP

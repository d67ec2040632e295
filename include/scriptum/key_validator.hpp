// ============================================================================
// Scriptum - Key Validator
// ============================================================================
// The KeyValidator gates every cipher operation. Checks run in a fixed order
// and stop at the first failure:
//   1. key empty or whitespace-only
//   2. key contains invisible characters (zero-width space, BOM, ...)
//   3. key has no letters A-Z
//   4. key shorter than the policy minimum (letters only)
//   5. key contains anything other than letters A-Z
//   6. text empty or whitespace-only
//   7. text has no letters A-Z
//
// Keys are never silently stripped: "AB12CD" is rejected rather than used as
// "ABCD", so the user never encrypts with a weaker key than the one typed.
// ============================================================================

#ifndef SCRIPTUM_KEY_VALIDATOR_HPP
#define SCRIPTUM_KEY_VALIDATOR_HPP

#include "types.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace scriptum {

/// Tunable rules applied by KeyValidator
struct ValidationPolicy {
    /// Minimum number of letters in the normalized key
    std::size_t min_key_length = constants::MIN_KEY_LENGTH;

    /// Codepoints that make a key invalid outright
    std::vector<char32_t> invisible_characters = default_invisible_characters();

    /// Zero width space, non-joiner, joiner, word joiner and the byte order mark
    [[nodiscard]] static std::vector<char32_t> default_invisible_characters() {
        return {U'\u200B', U'\u200C', U'\u200D', U'\u2060', U'\uFEFF'};
    }
};

/// Outcome of validating a (text, key) pair
class ValidationResult {
public:
    /// A passing result
    [[nodiscard]] static ValidationResult valid() { return ValidationResult{}; }

    /// A failing result with the given reason and message
    [[nodiscard]] static ValidationResult invalid(ErrorCode reason, std::string message);

    [[nodiscard]] bool is_valid() const noexcept { return !error_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return is_valid(); }

    /// Reason code; ErrorCode::Success when valid
    [[nodiscard]] ErrorCode reason() const noexcept;

    /// Message for the user; empty when valid
    [[nodiscard]] const std::string& message() const noexcept;

    /// The failure as an Error (only meaningful when invalid)
    [[nodiscard]] Error error() const;

    /// Invisible codepoints found in the key, in order of appearance
    [[nodiscard]] const std::vector<char32_t>& invisible_codepoints() const noexcept {
        return invisible_codepoints_;
    }

    /// Letters-only portion of a key rejected for invalid characters
    [[nodiscard]] const std::optional<std::string>& valid_key_portion() const noexcept {
        return valid_key_portion_;
    }

private:
    friend class KeyValidator;

    ValidationResult() = default;

    std::optional<Error> error_;
    std::vector<char32_t> invisible_codepoints_;
    std::optional<std::string> valid_key_portion_;
};

/// Checks keys and texts before they reach the cipher
class KeyValidator {
public:
    explicit KeyValidator(ValidationPolicy policy = {});

    /// Validate a raw text and raw key
    /// @param text The text that will be encrypted or decrypted
    /// @param key The key as typed by the user
    /// @return Valid, or the first failing check with its message
    [[nodiscard]] ValidationResult validate(std::string_view text, std::string_view key) const;

    /// Validate only the key (checks 1-5)
    [[nodiscard]] ValidationResult validate_key(std::string_view key) const;

    [[nodiscard]] const ValidationPolicy& policy() const noexcept { return policy_; }

private:
    ValidationPolicy policy_;
};

} // namespace scriptum

#endif // SCRIPTUM_KEY_VALIDATOR_HPP

// ============================================================================
// Scriptum - Key Validator Implementation
// ============================================================================

#include "scriptum/key_validator.hpp"
#include "scriptum/text_normalizer.hpp"
#include "scriptum/utf8.hpp"

#include <algorithm>
#include <format>

namespace scriptum {

// ============================================================================
// ValidationResult
// ============================================================================

ValidationResult ValidationResult::invalid(ErrorCode reason, std::string message) {
    ValidationResult result;
    result.error_ = Error{reason, std::move(message)};
    return result;
}

ErrorCode ValidationResult::reason() const noexcept {
    return error_ ? error_->code : ErrorCode::Success;
}

const std::string& ValidationResult::message() const noexcept {
    static const std::string empty;
    return error_ ? error_->message : empty;
}

Error ValidationResult::error() const {
    return error_.value_or(Error::from(ErrorCode::InternalError));
}

// ============================================================================
// KeyValidator
// ============================================================================

KeyValidator::KeyValidator(ValidationPolicy policy)
    : policy_(std::move(policy)) {}

ValidationResult KeyValidator::validate_key(std::string_view key) const {
    // 1. Empty or whitespace-only key
    if (utf8::is_blank(key)) {
        return ValidationResult::invalid(ErrorCode::EmptyKey, "Key cannot be empty.");
    }

    // 2. Invisible characters
    std::vector<char32_t> invisible;
    for (char32_t codepoint : utf8::decode(key)) {
        if (std::find(policy_.invisible_characters.begin(),
                      policy_.invisible_characters.end(),
                      codepoint) != policy_.invisible_characters.end()) {
            invisible.push_back(codepoint);
        }
    }

    if (!invisible.empty()) {
        std::string codes;
        for (char32_t codepoint : invisible) {
            if (!codes.empty()) codes += ", ";
            codes += utf8::format_codepoint(codepoint);
        }

        auto result = ValidationResult::invalid(
            ErrorCode::InvisibleCharacters,
            std::format("Key contains invisible or illegal characters ({}). "
                        "Check it and enter it again.", codes));
        result.invisible_codepoints_ = std::move(invisible);
        return result;
    }

    // 3. Letters left after normalization
    const std::string normalized_key = TextNormalizer::normalize(key);
    if (normalized_key.empty()) {
        return ValidationResult::invalid(
            ErrorCode::KeyHasNoLetters, "Key must contain at least one letter A-Z.");
    }

    // 4. Minimum length
    if (normalized_key.size() < policy_.min_key_length) {
        return ValidationResult::invalid(
            ErrorCode::KeyTooShort,
            std::format("Key must be at least {} letters long.", policy_.min_key_length));
    }

    // 5. Anything that normalization dropped makes the key invalid
    if (normalized_key != TextNormalizer::to_upper(key)) {
        auto result = ValidationResult::invalid(
            ErrorCode::InvalidKeyCharacters,
            std::format("Key contains invalid characters (only letters A-Z are allowed).\n"
                        "Key entered: {}\n"
                        "Valid part of the key would be: {}", key, normalized_key));
        result.valid_key_portion_ = normalized_key;
        return result;
    }

    return ValidationResult::valid();
}

ValidationResult KeyValidator::validate(std::string_view text, std::string_view key) const {
    if (auto key_result = validate_key(key); !key_result) {
        return key_result;
    }

    // 6. Empty or whitespace-only text
    if (utf8::is_blank(text)) {
        return ValidationResult::invalid(ErrorCode::EmptyText, "Text cannot be empty.");
    }

    // 7. Text with nothing to encrypt
    if (!TextNormalizer::contains_letter(TextNormalizer::to_upper(text))) {
        return ValidationResult::invalid(
            ErrorCode::TextHasNoLetters, "Text must contain at least one letter A-Z.");
    }

    return ValidationResult::valid();
}

} // namespace scriptum

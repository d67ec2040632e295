// ============================================================================
// Scriptum - Common Types and Error Handling
// ============================================================================
// This header defines the foundational types used throughout Scriptum:
// - Error codes and result types using C++23 std::expected
// - Detailed errors carrying a human-readable message
// - Configuration constants
// ============================================================================

#ifndef SCRIPTUM_TYPES_HPP
#define SCRIPTUM_TYPES_HPP

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>

namespace scriptum {

// ============================================================================
// Error Codes
// ============================================================================

/// All possible error conditions in Scriptum
enum class ErrorCode {
    // Success (not typically used with std::expected, but useful for logging)
    Success = 0,

    // Validation Errors (100-199)
    EmptyKey = 100,
    InvisibleCharacters = 101,
    KeyHasNoLetters = 102,
    KeyTooShort = 103,
    InvalidKeyCharacters = 104,
    EmptyText = 105,
    TextHasNoLetters = 106,

    // File I/O Errors (400-499)
    FileNotFound = 400,
    FileReadError = 401,
    FileWriteError = 402,
    FileTooLarge = 403,
    FileDecodeError = 404,
    SameSourceAndDestination = 405,

    // General Errors (500-599)
    InvalidArgument = 500,
    DigestFailed = 501,
    InternalError = 503,
};

/// Convert an error code to a human-readable string
[[nodiscard]] constexpr std::string_view error_to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success: return "Success";

        // Validation
        case ErrorCode::EmptyKey: return "Empty key";
        case ErrorCode::InvisibleCharacters: return "Key contains invisible characters";
        case ErrorCode::KeyHasNoLetters: return "Key has no valid letters";
        case ErrorCode::KeyTooShort: return "Key too short";
        case ErrorCode::InvalidKeyCharacters: return "Key contains invalid characters";
        case ErrorCode::EmptyText: return "Empty text";
        case ErrorCode::TextHasNoLetters: return "Text has no valid letters";

        // File I/O
        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::FileReadError: return "File read error";
        case ErrorCode::FileWriteError: return "File write error";
        case ErrorCode::FileTooLarge: return "File too large";
        case ErrorCode::FileDecodeError: return "File is not valid UTF-8";
        case ErrorCode::SameSourceAndDestination: return "Output would overwrite the input file";

        // General
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::DigestFailed: return "Digest computation failed";
        case ErrorCode::InternalError: return "Internal error";

        default: return "Unknown error";
    }
}

/// True for the reason codes produced by KeyValidator
[[nodiscard]] constexpr bool is_validation_error(ErrorCode code) noexcept {
    const auto value = static_cast<int>(code);
    return value >= 100 && value < 200;
}

/// True for file I/O failures
[[nodiscard]] constexpr bool is_file_error(ErrorCode code) noexcept {
    const auto value = static_cast<int>(code);
    return value >= 400 && value < 500;
}

// ============================================================================
// Result Types (using C++23 std::expected)
// ============================================================================

/// A result type that either contains a value T or an ErrorCode
/// Usage: Result<std::string> expand(...) { ... }
///        if (auto result = expand(text, key); result) { use(*result); }
///        else { handle_error(result.error()); }
template <typename T>
using Result = std::expected<T, ErrorCode>;

/// A result type for operations that don't return a value
using VoidResult = std::expected<void, ErrorCode>;

/// An error code together with the message shown to the user
struct Error {
    ErrorCode code = ErrorCode::InternalError;
    std::string message;

    /// Build an error whose message is the generic description of the code
    [[nodiscard]] static Error from(ErrorCode code) {
        return Error{code, std::string(error_to_string(code))};
    }
};

/// A result type whose failure carries a message (validation, file batch)
template <typename T>
using DetailedResult = std::expected<T, Error>;

// ============================================================================
// Constants
// ============================================================================

namespace constants {

/// Number of letters in the cipher alphabet (A-Z)
inline constexpr int ALPHABET_SIZE = 26;

/// Minimum number of letters a key must have
inline constexpr std::size_t MIN_KEY_LENGTH = 3;

/// Maximum file size accepted by the file layer (100 MB)
inline constexpr std::size_t MAX_FILE_SIZE = 100 * 1024 * 1024;

/// Length of a SHA-256 key fingerprint in hex characters
inline constexpr std::size_t FINGERPRINT_HEX_LENGTH = 64;

} // namespace constants

} // namespace scriptum

#endif // SCRIPTUM_TYPES_HPP

// ============================================================================
// Scriptum - Key Material
// ============================================================================
// Helpers for handling keys outside the cipher itself:
// - SecureString: owns key text and wipes it with OPENSSL_cleanse on
//   destruction, so keys typed at the terminal do not linger in memory
// - KeyMaterial::fingerprint: SHA-256 of the normalized key, printed instead
//   of the key so two runs can be checked for using the same key
//
// Keys are never written to disk.
// ============================================================================

#ifndef SCRIPTUM_KEY_MATERIAL_HPP
#define SCRIPTUM_KEY_MATERIAL_HPP

#include "types.hpp"
#include <string>
#include <string_view>

namespace scriptum {

/// RAII wrapper for key text that zeros itself on destruction
class SecureString {
public:
    SecureString() = default;

    explicit SecureString(std::string value) : value_(std::move(value)) {}

    /// Copy the text out of source, then wipe and empty source
    [[nodiscard]] static SecureString take(std::string& source);

    // Move operations
    SecureString(SecureString&& other) noexcept : value_(std::move(other.value_)) {
        other.clear();
    }
    SecureString& operator=(SecureString&& other) noexcept {
        if (this != &other) {
            clear();
            value_ = std::move(other.value_);
            other.clear();
        }
        return *this;
    }

    // No copying (avoid accidental key duplication)
    SecureString(const SecureString&) = delete;
    SecureString& operator=(const SecureString&) = delete;

    ~SecureString() { clear(); }

    /// Securely clear the contents
    void clear() noexcept;

    [[nodiscard]] std::string_view view() const noexcept { return value_; }
    [[nodiscard]] std::size_t size() const noexcept { return value_.size(); }
    [[nodiscard]] bool empty() const noexcept { return value_.empty(); }

private:
    std::string value_;
};

/// Stateless key utilities backed by OpenSSL
class KeyMaterial {
public:
    KeyMaterial() = delete;

    /// Fingerprint a key
    /// @param key Raw key (normalized before hashing, so "clave" and "CLAVE" match)
    /// @return 64 lowercase hex characters of SHA-256, or an error
    [[nodiscard]] static Result<std::string> fingerprint(std::string_view key);

    /// Shortened fingerprint for display ("3f2a9c1b...")
    [[nodiscard]] static Result<std::string> short_fingerprint(std::string_view key,
                                                               std::size_t length = 16);
};

} // namespace scriptum

#endif // SCRIPTUM_KEY_MATERIAL_HPP

// ============================================================================
// Scriptum - Key Material Implementation
// ============================================================================

#include "scriptum/key_material.hpp"
#include "scriptum/text_normalizer.hpp"

// OpenSSL headers
#include <openssl/crypto.h>
#include <openssl/evp.h>

// Standard library
#include <format>
#include <memory>

namespace scriptum {

// ============================================================================
// SecureString
// ============================================================================

SecureString SecureString::take(std::string& source) {
    SecureString taken;
    taken.value_.assign(source);
    OPENSSL_cleanse(source.data(), source.size());
    source.clear();
    return taken;
}

void SecureString::clear() noexcept {
    if (!value_.empty()) {
        // OPENSSL_cleanse is not optimized away like a plain memset
        OPENSSL_cleanse(value_.data(), value_.size());
        value_.clear();
    }
}

// ============================================================================
// Fingerprints
// ============================================================================

Result<std::string> KeyMaterial::fingerprint(std::string_view key) {
    std::string normalized = TextNormalizer::normalize(key);
    if (normalized.empty()) {
        return std::unexpected(ErrorCode::KeyHasNoLetters);
    }

    struct ContextDeleter {
        void operator()(EVP_MD_CTX* ctx) const {
            if (ctx) EVP_MD_CTX_free(ctx);
        }
    };
    std::unique_ptr<EVP_MD_CTX, ContextDeleter> ctx(EVP_MD_CTX_new());

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    const bool ok = ctx
        && EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) == 1
        && EVP_DigestUpdate(ctx.get(), normalized.data(), normalized.size()) == 1
        && EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) == 1;

    OPENSSL_cleanse(normalized.data(), normalized.size());

    if (!ok) {
        return std::unexpected(ErrorCode::DigestFailed);
    }

    std::string hex;
    hex.reserve(static_cast<std::size_t>(digest_len) * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        hex += std::format("{:02x}", digest[i]);
    }

    return hex;
}

Result<std::string> KeyMaterial::short_fingerprint(std::string_view key, std::size_t length) {
    auto full = fingerprint(key);
    if (!full) {
        return std::unexpected(full.error());
    }

    if (length >= full->size()) {
        return full;
    }
    return full->substr(0, length) + "...";
}

} // namespace scriptum

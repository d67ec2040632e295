// ============================================================================
// Scriptum - File Cipher Implementation
// ============================================================================

#include "scriptum/file_cipher.hpp"

#include <format>
#include <system_error>

namespace scriptum {

namespace {

/// True if both paths name the same file (existing or not)
bool same_file(const std::filesystem::path& a, const std::filesystem::path& b) {
    std::error_code ec;
    if (std::filesystem::exists(b, ec)) {
        const bool equivalent = std::filesystem::equivalent(a, b, ec);
        if (!ec) {
            return equivalent;
        }
    }
    return std::filesystem::weakly_canonical(a, ec) == std::filesystem::weakly_canonical(b, ec);
}

Error file_error(ErrorCode code, const std::filesystem::path& path) {
    return Error{code, std::format("{}: {}", error_to_string(code), path.string())};
}

} // namespace

FileCipher::FileCipher(ValidationPolicy policy, ReadOptions read_options)
    : engine_(std::move(policy)), read_options_(read_options) {}

// ============================================================================
// Internal Implementation
// ============================================================================

DetailedResult<TextFile> FileCipher::load_input(
    const std::filesystem::path& input_path,
    const std::filesystem::path& output_path
) const {
    if (same_file(input_path, output_path)) {
        return std::unexpected(file_error(ErrorCode::SameSourceAndDestination, output_path));
    }

    auto file = read_text_file(input_path, read_options_);
    if (!file) {
        return std::unexpected(file_error(file.error(), input_path));
    }

    return std::move(*file);
}

DetailedResult<FileReport> FileCipher::store_output(
    const std::filesystem::path& input_path,
    const std::filesystem::path& output_path,
    TextEncoding source_encoding,
    std::string_view content
) {
    if (auto written = write_text_file(output_path, content); !written) {
        return std::unexpected(file_error(written.error(), output_path));
    }

    FileReport report;
    report.input_path = input_path;
    report.output_path = output_path;
    report.source_encoding = source_encoding;
    report.letters = content.size();
    return report;
}

// ============================================================================
// File Encryption / Decryption
// ============================================================================

DetailedResult<FileReport> FileCipher::encrypt_file(
    const std::filesystem::path& input_path,
    const std::filesystem::path& output_path,
    std::string_view key
) const {
    auto input = load_input(input_path, output_path);
    if (!input) {
        return std::unexpected(input.error());
    }

    auto ciphertext = engine_.encrypt(input->content, key);
    if (!ciphertext) {
        return std::unexpected(ciphertext.error());
    }

    return store_output(input_path, output_path, input->encoding, *ciphertext);
}

DetailedResult<FileReport> FileCipher::decrypt_file(
    const std::filesystem::path& input_path,
    const std::filesystem::path& output_path,
    std::string_view key
) const {
    auto input = load_input(input_path, output_path);
    if (!input) {
        return std::unexpected(input.error());
    }

    auto decryption = engine_.decrypt(input->content, key);
    if (!decryption) {
        return std::unexpected(decryption.error());
    }

    auto report = store_output(input_path, output_path, input->encoding, decryption->plaintext);
    if (report) {
        report->likely_wrong_key = decryption->likely_wrong_key;
    }
    return report;
}

} // namespace scriptum

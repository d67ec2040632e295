// ============================================================================
// Scriptum - File Cipher
// ============================================================================
// Encrypts or decrypts a whole text file into a new file:
//
//   input file -> read_text_file -> CipherEngine -> write_text_file -> output
//
// The input file is never modified; asking to write over it is an error.
// Read errors abort before the cipher runs.
// ============================================================================

#ifndef SCRIPTUM_FILE_CIPHER_HPP
#define SCRIPTUM_FILE_CIPHER_HPP

#include "cipher_engine.hpp"
#include "text_file.hpp"
#include "types.hpp"
#include <filesystem>
#include <string_view>

namespace scriptum {

/// Summary of a completed file operation
struct FileReport {
    std::filesystem::path input_path;
    std::filesystem::path output_path;
    TextEncoding source_encoding = TextEncoding::Utf8;
    std::size_t letters = 0;        // Letters written to the output
    bool likely_wrong_key = false;  // Decryption only
};

/// Batch encryption and decryption of text files
class FileCipher {
public:
    explicit FileCipher(ValidationPolicy policy = {}, ReadOptions read_options = {});

    /// Encrypt input_path into output_path
    [[nodiscard]] DetailedResult<FileReport> encrypt_file(
        const std::filesystem::path& input_path,
        const std::filesystem::path& output_path,
        std::string_view key
    ) const;

    /// Decrypt input_path into output_path
    [[nodiscard]] DetailedResult<FileReport> decrypt_file(
        const std::filesystem::path& input_path,
        const std::filesystem::path& output_path,
        std::string_view key
    ) const;

    [[nodiscard]] const CipherEngine& engine() const noexcept { return engine_; }

private:
    /// Checks shared by both directions; reads the input on success
    [[nodiscard]] DetailedResult<TextFile> load_input(
        const std::filesystem::path& input_path,
        const std::filesystem::path& output_path
    ) const;

    /// Write the output and fill in the report
    [[nodiscard]] static DetailedResult<FileReport> store_output(
        const std::filesystem::path& input_path,
        const std::filesystem::path& output_path,
        TextEncoding source_encoding,
        std::string_view content
    );

    CipherEngine engine_;
    ReadOptions read_options_;
};

} // namespace scriptum

#endif // SCRIPTUM_FILE_CIPHER_HPP

// ============================================================================
// Scriptum - Text Files Implementation
// ============================================================================

#include "scriptum/text_file.hpp"
#include "scriptum/utf8.hpp"

#include <fstream>
#include <system_error>

namespace scriptum {

Result<TextFile> read_text_file(const std::filesystem::path& path, const ReadOptions& options) {
    std::error_code ec;

    // Check if input file exists
    if (!std::filesystem::exists(path, ec) || std::filesystem::is_directory(path, ec)) {
        return std::unexpected(ErrorCode::FileNotFound);
    }

    // Check file size
    const auto file_size = std::filesystem::file_size(path, ec);
    if (ec) {
        return std::unexpected(ErrorCode::FileReadError);
    }
    if (file_size > options.max_size) {
        return std::unexpected(ErrorCode::FileTooLarge);
    }

    // Read the entire file into memory
    std::ifstream input_file(path, std::ios::binary);
    if (!input_file) {
        return std::unexpected(ErrorCode::FileReadError);
    }

    std::string bytes(static_cast<std::size_t>(file_size), '\0');
    input_file.read(bytes.data(), static_cast<std::streamsize>(file_size));

    if (!input_file) {
        return std::unexpected(ErrorCode::FileReadError);
    }

    if (utf8::is_valid(bytes)) {
        return TextFile{std::move(bytes), TextEncoding::Utf8};
    }

    if (!options.allow_latin1_fallback) {
        return std::unexpected(ErrorCode::FileDecodeError);
    }

    return TextFile{utf8::from_latin1(bytes), TextEncoding::Latin1};
}

VoidResult write_text_file(const std::filesystem::path& path, std::string_view content) {
    std::ofstream output_file(path, std::ios::binary | std::ios::trunc);
    if (!output_file) {
        return std::unexpected(ErrorCode::FileWriteError);
    }

    output_file.write(content.data(), static_cast<std::streamsize>(content.size()));
    output_file.flush();

    if (!output_file) {
        return std::unexpected(ErrorCode::FileWriteError);
    }

    return {};  // Success
}

} // namespace scriptum

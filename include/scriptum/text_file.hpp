// ============================================================================
// Scriptum - Text Files
// ============================================================================
// Reading and writing of the text files the cipher works on.
//
// Files are read as UTF-8. A file that is not valid UTF-8 is read again as
// Latin-1 (ISO-8859-1), which accepts any byte sequence; the fallback can be
// turned off to make such files an error. Content is always returned as UTF-8
// and written back as UTF-8.
// ============================================================================

#ifndef SCRIPTUM_TEXT_FILE_HPP
#define SCRIPTUM_TEXT_FILE_HPP

#include "types.hpp"
#include <filesystem>
#include <string>
#include <string_view>

namespace scriptum {

/// Encoding a file was decoded with
enum class TextEncoding {
    Utf8,
    Latin1
};

/// Human-readable name of an encoding
[[nodiscard]] constexpr std::string_view encoding_to_string(TextEncoding encoding) noexcept {
    switch (encoding) {
        case TextEncoding::Utf8: return "UTF-8";
        case TextEncoding::Latin1: return "Latin-1";
        default: return "unknown";
    }
}

/// Options for read_text_file
struct ReadOptions {
    /// Re-read files that are not valid UTF-8 as Latin-1
    bool allow_latin1_fallback = true;

    /// Files larger than this are rejected with FileTooLarge
    std::size_t max_size = constants::MAX_FILE_SIZE;
};

/// Content of a text file, converted to UTF-8
struct TextFile {
    std::string content;
    TextEncoding encoding = TextEncoding::Utf8;
};

/// Read a whole text file
/// @param path File to read
/// @param options Encoding fallback and size limit
/// @return The UTF-8 content and the encoding it was decoded from, or
///         FileNotFound / FileTooLarge / FileReadError / FileDecodeError
[[nodiscard]] Result<TextFile> read_text_file(
    const std::filesystem::path& path,
    const ReadOptions& options = {}
);

/// Write UTF-8 text to a file, replacing any previous content
/// @return Success or FileWriteError
[[nodiscard]] VoidResult write_text_file(
    const std::filesystem::path& path,
    std::string_view content
);

} // namespace scriptum

#endif // SCRIPTUM_TEXT_FILE_HPP

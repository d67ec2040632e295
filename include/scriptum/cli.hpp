// ============================================================================
// Scriptum - Command Line Interface
// ============================================================================
// A command-line tool for Vigenère encryption and decryption.
//
// Usage:
//   scriptum <command> [options] [arguments]
//
// Commands:
//   cifrar             Encrypt a text          (alias: encrypt)
//   descifrar          Decrypt a text          (alias: decrypt)
//   cifrar-archivo     Encrypt a text file     (alias: encrypt-file)
//   descifrar-archivo  Decrypt a text file     (alias: decrypt-file)
//   demo               Run the demonstration (default with no arguments)
//   help               Show help information
//   version            Show version information
// ============================================================================

#ifndef SCRIPTUM_CLI_HPP
#define SCRIPTUM_CLI_HPP

#include "scriptum/key_material.hpp"
#include "scriptum/key_validator.hpp"
#include "scriptum/text_file.hpp"
#include "scriptum/types.hpp"
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace scriptum::cli {

/// Exit codes for the CLI
enum class ExitCode : int {
    Success = 0,
    InvalidArguments = 1,
    ValidationError = 2,
    FileError = 3,
    InternalError = 5
};

/// CLI argument parser result
struct ParsedArgs {
    std::string command;
    std::vector<std::string> positional;

    // Flags
    bool help = false;
    bool verbose = false;
    bool strict_utf8 = false;  // Disable the Latin-1 fallback when reading files
    bool ask_key = false;      // Read the key from the terminal instead of the arguments

    // Options with values
    std::optional<std::size_t> min_key_length;

    // Problems found while parsing (unknown options, bad numbers)
    std::vector<std::string> errors;
};

/// Parse command line arguments
[[nodiscard]] ParsedArgs parse_args(std::span<char*> args);

/// Build the validation policy selected by the options
[[nodiscard]] ValidationPolicy make_policy(const ParsedArgs& args);

/// Build the file read options selected by the options
[[nodiscard]] ReadOptions make_read_options(const ParsedArgs& args);

/// Map a library error to the process exit code
[[nodiscard]] ExitCode exit_code_for(ErrorCode code) noexcept;

/// Main CLI entry point
[[nodiscard]] ExitCode run(std::span<char*> args);

// Command handlers
[[nodiscard]] ExitCode cmd_help(const ParsedArgs& args);
[[nodiscard]] ExitCode cmd_version();
[[nodiscard]] ExitCode cmd_encrypt(ParsedArgs& args);
[[nodiscard]] ExitCode cmd_decrypt(ParsedArgs& args);
[[nodiscard]] ExitCode cmd_encrypt_file(ParsedArgs& args);
[[nodiscard]] ExitCode cmd_decrypt_file(ParsedArgs& args);
[[nodiscard]] ExitCode cmd_demo(const ParsedArgs& args);

// Utility functions
void print_error(std::string_view message);
void print_warning(std::string_view message);
void print_success(std::string_view message);
void print_info(std::string_view message);

/// Print the short usage block to stderr
void print_usage();

/// Securely read a key from the terminal (hides input)
[[nodiscard]] SecureString read_key(std::string_view prompt);

} // namespace scriptum::cli

#endif // SCRIPTUM_CLI_HPP

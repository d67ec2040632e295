// ============================================================================
// Scriptum - Command Line Interface Implementation
// ============================================================================

#include "scriptum/cli.hpp"
#include "scriptum/scriptum.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <iostream>
#include <system_error>

#ifdef _WIN32
#include <windows.h>
#include <conio.h>
#else
#include <termios.h>
#include <unistd.h>
#endif

namespace scriptum::cli {

namespace {

// Demo material
constexpr std::string_view DEMO_TEXT = "ATAQUE AL AMANECER";
constexpr std::string_view DEMO_KEY = "CLAVE";
constexpr std::string_view DEMO_DATA_DIR = "data";
constexpr std::string_view DEMO_MESSAGE =
    "Este es un mensaje secreto para probar el cifrado Vigenere.";
constexpr std::string_view DEMO_ORIGINAL_FILE = "mensaje.txt";
constexpr std::string_view DEMO_ENCRYPTED_FILE = "mensaje_cifrado.txt";
constexpr std::string_view DEMO_DECRYPTED_FILE = "mensaje_descifrado.txt";

std::string to_lower(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lower;
}

/// "--name[=value]" or a cluster of short flags such as "-vk".
/// Anything else starting with '-' ("-5 grados", "-") is text.
bool looks_like_option(std::string_view arg) {
    if (arg.size() < 2 || arg[0] != '-') {
        return false;
    }
    if (arg[1] == '-') {
        return true;
    }
    return std::all_of(arg.begin() + 1, arg.end(), [](unsigned char c) {
        return std::isalpha(c) != 0;
    });
}

/// Key from the arguments, or from the terminal with --ask-key
/// @param key_index Position of the key among the positional arguments
/// The key is taken out of the arguments, which are left wiped.
std::optional<SecureString> acquire_key(ParsedArgs& args, std::size_t key_index) {
    if (args.ask_key) {
        return read_key("Enter key: ");
    }
    if (args.positional.size() <= key_index) {
        return std::nullopt;
    }
    return SecureString::take(args.positional[key_index]);
}

/// Number of positional arguments a command needs, the key included
std::size_t required_arguments(const ParsedArgs& args, std::size_t with_key) {
    return args.ask_key ? with_key - 1 : with_key;
}

void report_key(const ParsedArgs& args, std::string_view key) {
    if (!args.verbose) {
        return;
    }
    if (auto fp = KeyMaterial::short_fingerprint(key); fp) {
        print_info(std::format("Key fingerprint (SHA-256): {}", *fp));
    }
}

void report_file(const FileReport& report, std::string_view action) {
    if (report.source_encoding == TextEncoding::Latin1) {
        print_warning(std::format("{} is not UTF-8, read as {}",
                                  report.input_path.string(),
                                  encoding_to_string(report.source_encoding)));
    }
    print_success(std::format("{} {} letters -> {}",
                              action, report.letters, report.output_path.string()));
}

ExitCode fail(const Error& error) {
    print_error(error.message);
    return exit_code_for(error.code);
}

} // namespace

// ============================================================================
// Terminal Utilities
// ============================================================================

// Diagnostics go to stderr so stdout carries nothing but cipher output.

void print_error(std::string_view message) {
    std::cerr << "[ERROR] " << message << "\n";
}

void print_warning(std::string_view message) {
    std::cerr << "[WARN] " << message << "\n";
}

void print_success(std::string_view message) {
    std::cerr << "[OK] " << message << "\n";
}

void print_info(std::string_view message) {
    std::cerr << "[INFO] " << message << "\n";
}

void print_usage() {
    std::cerr << "Usage:\n"
                 "  scriptum cifrar \"TEXT\" \"KEY\"\n"
                 "  scriptum descifrar \"TEXT\" \"KEY\"\n"
                 "  scriptum cifrar-archivo input.txt output.txt KEY\n"
                 "  scriptum descifrar-archivo input.txt output.txt KEY\n"
                 "Use 'scriptum help' for more information.\n";
}

SecureString read_key(std::string_view prompt) {
    std::cerr << prompt << std::flush;
    std::string key;

#ifdef _WIN32
    // Windows: Use _getch() to read without echo
    char ch;
    while ((ch = static_cast<char>(_getch())) != '\r') {
        if (ch == '\b') {  // Backspace
            if (!key.empty()) {
                key.pop_back();
                std::cerr << "\b \b";  // Erase character
            }
        } else if (ch >= 32) {  // Printable characters
            key += ch;
            std::cerr << '*';
        }
    }
    std::cerr << "\n";
#else
    // Unix: Disable terminal echo when stdin is a terminal
    const bool is_terminal = isatty(STDIN_FILENO) == 1;
    struct termios old_term{}, new_term{};
    if (is_terminal) {
        tcgetattr(STDIN_FILENO, &old_term);
        new_term = old_term;
        new_term.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        tcsetattr(STDIN_FILENO, TCSANOW, &new_term);
    }

    std::getline(std::cin, key);

    if (is_terminal) {
        tcsetattr(STDIN_FILENO, TCSANOW, &old_term);
        std::cerr << "\n";
    }
#endif

    return SecureString(std::move(key));
}

// ============================================================================
// Argument Parsing
// ============================================================================

ParsedArgs parse_args(std::span<char*> args) {
    ParsedArgs result;
    bool options_ended = false;

    auto add_positional = [&result](std::string_view arg) {
        if (result.command.empty()) {
            result.command = to_lower(arg);
        } else {
            result.positional.emplace_back(arg);
        }
    };

    for (std::size_t i = 1; i < args.size(); ++i) {
        std::string_view arg = args[i];

        if (options_ended || !looks_like_option(arg)) {
            add_positional(arg);
            continue;
        }

        if (arg == "--") {
            options_ended = true;
            continue;
        }

        // Check for options
        if (arg.starts_with("--")) {
            std::string_view option = arg.substr(2);

            if (option == "help") {
                result.help = true;
            } else if (option == "verbose") {
                result.verbose = true;
            } else if (option == "strict-utf8") {
                result.strict_utf8 = true;
            } else if (option == "ask-key") {
                result.ask_key = true;
            } else if (option.starts_with("min-key-length=")) {
                std::string_view value = option.substr(15);
                std::size_t length = 0;
                auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
                if (ec != std::errc{} || ptr != value.data() + value.size() || length == 0) {
                    result.errors.push_back(std::format("Invalid minimum key length: '{}'", value));
                } else {
                    result.min_key_length = length;
                }
            } else if (option == "version") {
                add_positional("version");
            } else {
                result.errors.push_back(std::format("Unknown option: '{}'", arg));
            }
        } else {
            // Short options
            for (std::size_t j = 1; j < arg.size(); ++j) {
                switch (arg[j]) {
                    case 'h': result.help = true; break;
                    case 'v': result.verbose = true; break;
                    case 'k': result.ask_key = true; break;
                    case 'V': add_positional("version"); break;
                    default:
                        result.errors.push_back(std::format("Unknown option: '-{}'", arg[j]));
                        break;
                }
            }
        }
    }

    return result;
}

ValidationPolicy make_policy(const ParsedArgs& args) {
    ValidationPolicy policy;
    if (args.min_key_length) {
        policy.min_key_length = *args.min_key_length;
    }
    return policy;
}

ReadOptions make_read_options(const ParsedArgs& args) {
    ReadOptions options;
    options.allow_latin1_fallback = !args.strict_utf8;
    return options;
}

ExitCode exit_code_for(ErrorCode code) noexcept {
    if (code == ErrorCode::Success) {
        return ExitCode::Success;
    }
    if (is_validation_error(code)) {
        return ExitCode::ValidationError;
    }
    if (is_file_error(code)) {
        return ExitCode::FileError;
    }
    if (code == ErrorCode::InvalidArgument) {
        return ExitCode::InvalidArguments;
    }
    return ExitCode::InternalError;
}

// ============================================================================
// Help Command
// ============================================================================

ExitCode cmd_help(const ParsedArgs& args) {
    const std::string topic = args.positional.empty() ? std::string{}
                                                      : to_lower(args.positional[0]);

    if (topic == "cifrar" || topic == "encrypt" || topic == "descifrar" || topic == "decrypt") {
        std::cout << R"(
scriptum cifrar / descifrar - Encrypt or decrypt a text

USAGE:
    scriptum cifrar "TEXT" "KEY"
    scriptum descifrar "TEXT" "KEY"
    scriptum cifrar "TEXT" --ask-key
    scriptum cifrar -- "-hola" "KEY"

Only the letters A-Z of TEXT are kept (case, spaces and punctuation are
dropped). KEY must contain letters A-Z only, at least 3 of them.
A TEXT made of '-' and letters only (like -hola) reads as options; put --
before it.

OPTIONS:
    --ask-key, -k            Read KEY from the terminal without echo
    --min-key-length=<n>     Minimum number of letters in KEY (default: 3)
    --verbose, -v            Print the key fingerprint

EXAMPLES:
    scriptum cifrar "ATAQUE AL AMANECER" CLAVE
    scriptum descifrar CEALYGLLVQCYEXIT CLAVE
)";
    } else if (topic == "cifrar-archivo" || topic == "encrypt-file" ||
               topic == "descifrar-archivo" || topic == "decrypt-file") {
        std::cout << R"(
scriptum cifrar-archivo / descifrar-archivo - Encrypt or decrypt a text file

USAGE:
    scriptum cifrar-archivo <input> <output> KEY
    scriptum descifrar-archivo <input> <output> KEY

The input file is never modified; <output> must be a different file.
Files are read as UTF-8, falling back to Latin-1.

OPTIONS:
    --strict-utf8            Reject files that are not valid UTF-8
    --ask-key, -k            Read KEY from the terminal without echo
    --min-key-length=<n>     Minimum number of letters in KEY (default: 3)
    --verbose, -v            Print the key fingerprint and encoding notes

EXAMPLES:
    scriptum cifrar-archivo mensaje.txt mensaje_cifrado.txt CLAVE
    scriptum descifrar-archivo mensaje_cifrado.txt mensaje_descifrado.txt CLAVE
)";
    } else {
        std::cout << R"(
Scriptum - Vigenere cipher for the letters A-Z

USAGE:
    scriptum <command> [options] [arguments]

COMMANDS:
    cifrar              Encrypt a text            (alias: encrypt)
    descifrar           Decrypt a text            (alias: decrypt)
    cifrar-archivo      Encrypt a text file       (alias: encrypt-file)
    descifrar-archivo   Decrypt a text file       (alias: decrypt-file)
    demo [dir]          Run the demonstration (default when no command is given)
    version             Show version information
    help                Show this help message

Use 'scriptum help <command>' for more information about a command.
)";
    }

    return ExitCode::Success;
}

// ============================================================================
// Version Command
// ============================================================================

ExitCode cmd_version() {
    std::cout << std::format("Scriptum v{}\n", VERSION_STRING);
    std::cout << "Classical Vigenere cipher over the alphabet A-Z\n";
    std::cout << "\nNote: the Vigenere cipher is a teaching tool, not a secure cipher.\n";
    return ExitCode::Success;
}

// ============================================================================
// Text Commands
// ============================================================================

ExitCode cmd_encrypt(ParsedArgs& args) {
    if (args.positional.size() < required_arguments(args, 2)) {
        print_error("Missing arguments. Use: scriptum cifrar \"TEXT\" \"KEY\"");
        print_usage();
        return ExitCode::InvalidArguments;
    }

    auto key = acquire_key(args, 1);
    if (!key) {
        print_usage();
        return ExitCode::InvalidArguments;
    }

    CipherEngine engine(make_policy(args));
    auto ciphertext = engine.encrypt(args.positional[0], key->view());
    if (!ciphertext) {
        return fail(ciphertext.error());
    }

    report_key(args, key->view());
    std::cout << *ciphertext << "\n";
    return ExitCode::Success;
}

ExitCode cmd_decrypt(ParsedArgs& args) {
    if (args.positional.size() < required_arguments(args, 2)) {
        print_error("Missing arguments. Use: scriptum descifrar \"TEXT\" \"KEY\"");
        print_usage();
        return ExitCode::InvalidArguments;
    }

    auto key = acquire_key(args, 1);
    if (!key) {
        print_usage();
        return ExitCode::InvalidArguments;
    }

    CipherEngine engine(make_policy(args));
    auto decryption = engine.decrypt(args.positional[0], key->view());
    if (!decryption) {
        return fail(decryption.error());
    }

    report_key(args, key->view());
    if (decryption->likely_wrong_key) {
        print_warning("Possible wrong key: the result contains no readable letters.");
    }
    std::cout << decryption->plaintext << "\n";
    return ExitCode::Success;
}

// ============================================================================
// File Commands
// ============================================================================

ExitCode cmd_encrypt_file(ParsedArgs& args) {
    if (args.positional.size() < required_arguments(args, 3)) {
        print_error("Missing arguments. Use: scriptum cifrar-archivo <input> <output> KEY");
        print_usage();
        return ExitCode::InvalidArguments;
    }

    auto key = acquire_key(args, 2);
    if (!key) {
        print_usage();
        return ExitCode::InvalidArguments;
    }

    FileCipher cipher(make_policy(args), make_read_options(args));
    auto report = cipher.encrypt_file(args.positional[0], args.positional[1], key->view());
    if (!report) {
        return fail(report.error());
    }

    report_key(args, key->view());
    report_file(*report, "Encrypted");
    return ExitCode::Success;
}

ExitCode cmd_decrypt_file(ParsedArgs& args) {
    if (args.positional.size() < required_arguments(args, 3)) {
        print_error("Missing arguments. Use: scriptum descifrar-archivo <input> <output> KEY");
        print_usage();
        return ExitCode::InvalidArguments;
    }

    auto key = acquire_key(args, 2);
    if (!key) {
        print_usage();
        return ExitCode::InvalidArguments;
    }

    FileCipher cipher(make_policy(args), make_read_options(args));
    auto report = cipher.decrypt_file(args.positional[0], args.positional[1], key->view());
    if (!report) {
        return fail(report.error());
    }

    report_key(args, key->view());
    if (report->likely_wrong_key) {
        print_warning("Possible wrong key: the result contains no readable letters.");
    }
    report_file(*report, "Decrypted");
    return ExitCode::Success;
}

// ============================================================================
// Demo Command
// ============================================================================

ExitCode cmd_demo(const ParsedArgs& args) {
    const std::filesystem::path data_dir =
        args.positional.empty() ? std::filesystem::path(DEMO_DATA_DIR)
                                : std::filesystem::path(args.positional[0]);

    std::error_code ec;
    std::filesystem::create_directories(data_dir, ec);
    if (ec) {
        print_error(std::format("Cannot create data directory {}: {}", data_dir.string(), ec.message()));
        return ExitCode::FileError;
    }

    print_info("=== VIGENERE DEMO ===");
    print_info(std::format("Demo text  : {}", DEMO_TEXT));
    print_info(std::format("Demo key   : {}", DEMO_KEY));

    CipherEngine engine(make_policy(args));
    auto ciphertext = engine.encrypt(DEMO_TEXT, DEMO_KEY);
    if (!ciphertext) {
        return fail(ciphertext.error());
    }
    print_info(std::format("Encrypted  : {}", *ciphertext));

    auto decryption = engine.decrypt(*ciphertext, DEMO_KEY);
    if (!decryption) {
        return fail(decryption.error());
    }
    print_info(std::format("Decrypted  : {}", decryption->plaintext));

    const auto original = data_dir / DEMO_ORIGINAL_FILE;
    const auto encrypted = data_dir / DEMO_ENCRYPTED_FILE;
    const auto decrypted = data_dir / DEMO_DECRYPTED_FILE;

    // Create the sample file on first run only
    if (!std::filesystem::exists(original, ec)) {
        if (auto written = write_text_file(original, DEMO_MESSAGE); !written) {
            return fail(Error{written.error(),
                              std::format("{}: {}", error_to_string(written.error()), original.string())});
        }
        print_success(std::format("File written to {}", original.string()));
    }

    FileCipher cipher(make_policy(args), make_read_options(args));

    print_info("=== ENCRYPTING FILE ===");
    auto encrypted_report = cipher.encrypt_file(original, encrypted, DEMO_KEY);
    if (!encrypted_report) {
        return fail(encrypted_report.error());
    }
    report_file(*encrypted_report, "Encrypted");

    print_info("=== DECRYPTING FILE ===");
    auto decrypted_report = cipher.decrypt_file(encrypted, decrypted, DEMO_KEY);
    if (!decrypted_report) {
        return fail(decrypted_report.error());
    }
    report_file(*decrypted_report, "Decrypted");

    return ExitCode::Success;
}

// ============================================================================
// Main Entry Point
// ============================================================================

ExitCode run(std::span<char*> args) {
    ParsedArgs parsed = parse_args(args);

    if (!parsed.errors.empty()) {
        for (const auto& error : parsed.errors) {
            print_error(error);
        }
        print_usage();
        return ExitCode::InvalidArguments;
    }

    // Handle help flag on any command
    if (parsed.help) {
        if (!parsed.command.empty() && parsed.command != "help") {
            parsed.positional.insert(parsed.positional.begin(), parsed.command);
        }
        return cmd_help(parsed);
    }

    // Dispatch to command handlers
    const std::string& command = parsed.command;
    if (command.empty() || command == "demo") {
        return cmd_demo(parsed);
    } else if (command == "help") {
        return cmd_help(parsed);
    } else if (command == "version") {
        return cmd_version();
    } else if (command == "cifrar" || command == "encrypt") {
        return cmd_encrypt(parsed);
    } else if (command == "descifrar" || command == "decrypt") {
        return cmd_decrypt(parsed);
    } else if (command == "cifrar-archivo" || command == "encrypt-file") {
        return cmd_encrypt_file(parsed);
    } else if (command == "descifrar-archivo" || command == "decrypt-file") {
        return cmd_decrypt_file(parsed);
    } else {
        print_error(std::format("Unknown command: '{}'", command));
        print_usage();
        return ExitCode::InvalidArguments;
    }
}

} // namespace scriptum::cli

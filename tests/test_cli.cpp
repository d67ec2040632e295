// ============================================================================
// Scriptum - CLI Unit Tests
// ============================================================================

#include <gtest/gtest.h>
#include "scriptum/cli.hpp"
#include "scriptum/version.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace scriptum::tests {

namespace {

/// Owns argv storage for a simulated command line
class CommandLine {
public:
    CommandLine(std::initializer_list<std::string> args) : storage_(args) {
        storage_.insert(storage_.begin(), "scriptum");
        for (auto& arg : storage_) {
            pointers_.push_back(arg.data());
        }
    }

    [[nodiscard]] std::span<char*> span() { return pointers_; }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

std::string read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

} // namespace

// ============================================================================
// Argument Parsing
// ============================================================================

TEST(CliTest, ParseArgs_CommandAndPositionals) {
    CommandLine line{"CIFRAR", "ATAQUE AL AMANECER", "CLAVE"};
    auto parsed = cli::parse_args(line.span());

    EXPECT_EQ(parsed.command, "cifrar");  // Verb is case-insensitive
    ASSERT_EQ(parsed.positional.size(), 2u);
    EXPECT_EQ(parsed.positional[0], "ATAQUE AL AMANECER");
    EXPECT_EQ(parsed.positional[1], "CLAVE");
    EXPECT_TRUE(parsed.errors.empty());
}

TEST(CliTest, ParseArgs_Options) {
    CommandLine line{"cifrar-archivo", "-v", "--strict-utf8", "--min-key-length=5", "a.txt", "b.txt", "-k"};
    auto parsed = cli::parse_args(line.span());

    EXPECT_TRUE(parsed.verbose);
    EXPECT_TRUE(parsed.strict_utf8);
    EXPECT_TRUE(parsed.ask_key);
    ASSERT_TRUE(parsed.min_key_length.has_value());
    EXPECT_EQ(*parsed.min_key_length, 5u);
    EXPECT_EQ(parsed.positional, (std::vector<std::string>{"a.txt", "b.txt"}));
}

TEST(CliTest, ParseArgs_DoubleDashEndsOptions) {
    CommandLine line{"cifrar", "--", "-hola-", "CLAVE"};
    auto parsed = cli::parse_args(line.span());

    EXPECT_FALSE(parsed.help);
    EXPECT_EQ(parsed.positional, (std::vector<std::string>{"-hola-", "CLAVE"}));
}

TEST(CliTest, ParseArgs_DashLeadingTextIsPositional) {
    CommandLine line{"cifrar", "-5 grados bajo cero", "-", "-v", "CLAVE"};
    auto parsed = cli::parse_args(line.span());

    EXPECT_TRUE(parsed.errors.empty());
    EXPECT_TRUE(parsed.verbose);
    EXPECT_EQ(parsed.positional, (std::vector<std::string>{"-5 grados bajo cero", "-", "CLAVE"}));
}

TEST(CliTest, ParseArgs_ReportsBadOptions) {
    CommandLine line{"cifrar", "--min-key-length=abc", "--nope", "TEXT", "KEY"};
    auto parsed = cli::parse_args(line.span());

    EXPECT_EQ(parsed.errors.size(), 2u);
    EXPECT_FALSE(parsed.min_key_length.has_value());
}

TEST(CliTest, MakePolicyAndReadOptions) {
    CommandLine line{"cifrar-archivo", "--min-key-length=7", "--strict-utf8"};
    auto parsed = cli::parse_args(line.span());

    EXPECT_EQ(cli::make_policy(parsed).min_key_length, 7u);
    EXPECT_FALSE(cli::make_read_options(parsed).allow_latin1_fallback);

    CommandLine defaults{"cifrar"};
    auto parsed_defaults = cli::parse_args(defaults.span());
    EXPECT_EQ(cli::make_policy(parsed_defaults).min_key_length, constants::MIN_KEY_LENGTH);
    EXPECT_TRUE(cli::make_read_options(parsed_defaults).allow_latin1_fallback);
}

TEST(CliTest, ExitCodeMapping) {
    EXPECT_EQ(cli::exit_code_for(ErrorCode::Success), cli::ExitCode::Success);
    EXPECT_EQ(cli::exit_code_for(ErrorCode::KeyTooShort), cli::ExitCode::ValidationError);
    EXPECT_EQ(cli::exit_code_for(ErrorCode::TextHasNoLetters), cli::ExitCode::ValidationError);
    EXPECT_EQ(cli::exit_code_for(ErrorCode::FileNotFound), cli::ExitCode::FileError);
    EXPECT_EQ(cli::exit_code_for(ErrorCode::SameSourceAndDestination), cli::ExitCode::FileError);
    EXPECT_EQ(cli::exit_code_for(ErrorCode::InvalidArgument), cli::ExitCode::InvalidArguments);
    EXPECT_EQ(cli::exit_code_for(ErrorCode::DigestFailed), cli::ExitCode::InternalError);
}

// ============================================================================
// Text Commands
// ============================================================================

TEST(CliTest, Run_EncryptPrintsCiphertext) {
    CommandLine line{"cifrar", "ATAQUE AL AMANECER", "CLAVE"};

    testing::internal::CaptureStdout();
    const auto code = cli::run(line.span());
    const std::string output = testing::internal::GetCapturedStdout();

    EXPECT_EQ(code, cli::ExitCode::Success);
    EXPECT_EQ(output, "CEALYGLLVQCYEXIT\n");
}

TEST(CliTest, Run_DecryptAliasPrintsPlaintext) {
    CommandLine line{"decrypt", "CEALYGLLVQCYEXIT", "CLAVE"};

    testing::internal::CaptureStdout();
    const auto code = cli::run(line.span());
    const std::string output = testing::internal::GetCapturedStdout();

    EXPECT_EQ(code, cli::ExitCode::Success);
    EXPECT_EQ(output, "ATAQUEALAMANECER\n");
}

TEST(CliTest, Run_EncryptTextStartingWithDash) {
    CommandLine line{"cifrar", "-5 grados bajo cero", "CLAVE"};

    testing::internal::CaptureStdout();
    const auto code = cli::run(line.span());
    const std::string output = testing::internal::GetCapturedStdout();

    EXPECT_EQ(code, cli::ExitCode::Success);
    EXPECT_EQ(output, "ICAYSUMAESEPRJ\n");
}

TEST(CliTest, CmdEncrypt_WipesKeyFromArguments) {
    CommandLine line{"cifrar", "ATAQUE AL AMANECER", "CLAVE"};
    auto parsed = cli::parse_args(line.span());

    testing::internal::CaptureStdout();
    const auto code = cli::cmd_encrypt(parsed);
    const std::string output = testing::internal::GetCapturedStdout();

    EXPECT_EQ(code, cli::ExitCode::Success);
    EXPECT_EQ(output, "CEALYGLLVQCYEXIT\n");
    ASSERT_EQ(parsed.positional.size(), 2u);
    EXPECT_EQ(parsed.positional[0], "ATAQUE AL AMANECER");
    EXPECT_TRUE(parsed.positional[1].empty());
}

TEST(CliTest, Run_ValidationErrorExitsNonZero) {
    CommandLine line{"cifrar", "ATAQUE AL AMANECER", "AB12CD"};

    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    const auto code = cli::run(line.span());
    const std::string output = testing::internal::GetCapturedStdout();
    const std::string errors = testing::internal::GetCapturedStderr();

    EXPECT_EQ(code, cli::ExitCode::ValidationError);
    EXPECT_TRUE(output.empty());
    EXPECT_NE(errors.find("[ERROR] Key contains invalid characters"), std::string::npos) << errors;
}

TEST(CliTest, Run_MissingArgumentsPrintsUsage) {
    CommandLine line{"cifrar", "ATAQUE"};

    testing::internal::CaptureStderr();
    const auto code = cli::run(line.span());
    const std::string errors = testing::internal::GetCapturedStderr();

    EXPECT_EQ(code, cli::ExitCode::InvalidArguments);
    EXPECT_NE(errors.find("Usage:"), std::string::npos);
}

TEST(CliTest, Run_UnknownCommand) {
    CommandLine line{"rot13", "HOLA"};

    testing::internal::CaptureStderr();
    const auto code = cli::run(line.span());
    const std::string errors = testing::internal::GetCapturedStderr();

    EXPECT_EQ(code, cli::ExitCode::InvalidArguments);
    EXPECT_NE(errors.find("Unknown command: 'rot13'"), std::string::npos);
}

TEST(CliTest, Run_MinKeyLengthOption) {
    CommandLine line{"cifrar", "--min-key-length=6", "ATAQUE", "CLAVE"};

    testing::internal::CaptureStderr();
    const auto code = cli::run(line.span());
    const std::string errors = testing::internal::GetCapturedStderr();

    EXPECT_EQ(code, cli::ExitCode::ValidationError);
    EXPECT_NE(errors.find("at least 6 letters"), std::string::npos);
}

TEST(CliTest, Run_VerbosePrintsFingerprintNotKey) {
    CommandLine line{"cifrar", "-v", "ATAQUE", "CLAVE"};

    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    const auto code = cli::run(line.span());
    const std::string output = testing::internal::GetCapturedStdout();
    const std::string errors = testing::internal::GetCapturedStderr();

    EXPECT_EQ(code, cli::ExitCode::Success);
    EXPECT_EQ(output.find("CLAVE"), std::string::npos);
    EXPECT_NE(errors.find("61455ff103a1fce3..."), std::string::npos) << errors;
}

TEST(CliTest, Run_HelpAndVersion) {
    CommandLine help{"help"};
    testing::internal::CaptureStdout();
    EXPECT_EQ(cli::run(help.span()), cli::ExitCode::Success);
    EXPECT_NE(testing::internal::GetCapturedStdout().find("cifrar-archivo"), std::string::npos);

    CommandLine version{"--version"};
    testing::internal::CaptureStdout();
    EXPECT_EQ(cli::run(version.span()), cli::ExitCode::Success);
    EXPECT_NE(testing::internal::GetCapturedStdout().find(VERSION_STRING), std::string::npos);
}

// ============================================================================
// File Commands and Demo
// ============================================================================

class CliFileTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir;

    void SetUp() override {
        temp_dir = std::filesystem::temp_directory_path() /
                   ("scriptum_cli_" + std::string(
                       ::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::create_directories(temp_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir);
    }
};

TEST_F(CliFileTest, EncryptAndDecryptFile) {
    const auto input = temp_dir / "in.txt";
    const auto encrypted = temp_dir / "enc.txt";
    const auto decrypted = temp_dir / "dec.txt";
    {
        std::ofstream file(input, std::ios::binary);
        file << "Ataque al amanecer!";
    }

    CommandLine encrypt{"cifrar-archivo", input.string(), encrypted.string(), "CLAVE"};
    testing::internal::CaptureStderr();
    EXPECT_EQ(cli::run(encrypt.span()), cli::ExitCode::Success);
    testing::internal::GetCapturedStderr();
    EXPECT_EQ(read_file(encrypted), "CEALYGLLVQCYEXIT");

    CommandLine decrypt{"descifrar-archivo", encrypted.string(), decrypted.string(), "CLAVE"};
    testing::internal::CaptureStderr();
    EXPECT_EQ(cli::run(decrypt.span()), cli::ExitCode::Success);
    testing::internal::GetCapturedStderr();
    EXPECT_EQ(read_file(decrypted), "ATAQUEALAMANECER");
}

TEST_F(CliFileTest, MissingInputIsFileError) {
    CommandLine line{"cifrar-archivo", (temp_dir / "nope.txt").string(),
                     (temp_dir / "out.txt").string(), "CLAVE"};

    testing::internal::CaptureStderr();
    const auto code = cli::run(line.span());
    const std::string errors = testing::internal::GetCapturedStderr();

    EXPECT_EQ(code, cli::ExitCode::FileError);
    EXPECT_NE(errors.find("File not found"), std::string::npos);
}

TEST_F(CliFileTest, DemoCreatesFiles) {
    const auto data_dir = temp_dir / "data";
    CommandLine line{"demo", data_dir.string()};

    testing::internal::CaptureStderr();
    const auto code = cli::run(line.span());
    const std::string log = testing::internal::GetCapturedStderr();

    EXPECT_EQ(code, cli::ExitCode::Success);
    EXPECT_NE(log.find("CEALYGLLVQCYEXIT"), std::string::npos);
    EXPECT_EQ(read_file(data_dir / "mensaje.txt"),
              "Este es un mensaje secreto para probar el cifrado Vigenere.");
    EXPECT_EQ(read_file(data_dir / "mensaje_cifrado.txt"),
              "GDTZIUFNHIPDAEIUPCMIVZPVVCARJFCCEGGKQRVHQGIBIPPRZ");
    EXPECT_EQ(read_file(data_dir / "mensaje_descifrado.txt"),
              "ESTEESUNMENSAJESECRETOPARAPROBARELCIFRADOVIGENERE");
}

TEST_F(CliFileTest, DemoKeepsExistingMessage) {
    const auto data_dir = temp_dir / "data";
    std::filesystem::create_directories(data_dir);
    {
        std::ofstream file(data_dir / "mensaje.txt", std::ios::binary);
        file << "Hola";
    }

    CommandLine line{"demo", data_dir.string()};
    testing::internal::CaptureStderr();
    EXPECT_EQ(cli::run(line.span()), cli::ExitCode::Success);
    testing::internal::GetCapturedStderr();

    EXPECT_EQ(read_file(data_dir / "mensaje.txt"), "Hola");
    EXPECT_EQ(read_file(data_dir / "mensaje_descifrado.txt"), "HOLA");
}

} // namespace scriptum::tests

// ============================================================================
// Scriptum - Main Entry Point
// ============================================================================
// Runs the command-line interface; with no arguments it runs the demo.
// ============================================================================

#include "scriptum/cli.hpp"

int main(int argc, char* argv[]) {
    const auto exit_code = scriptum::cli::run(std::span<char*>(argv, static_cast<std::size_t>(argc)));
    return static_cast<int>(exit_code);
}

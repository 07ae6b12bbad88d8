#pragma once

#include <string>
#include <cstdint>
#include <optional>

namespace fxfer::args_parser {

struct CLIArgs
{
    std::string source;                     // первый позиционный аргумент
    std::string destination;                // второй позиционный аргумент
    bool skip_unchanged{false};             // --skip-unchanged
    bool preserve_metadata{true};           // --no-preserve-metadata
    bool progress{true};                    // --no-progress
    bool quiet{false};                      // -q, --quiet
    bool verbose{false};                    // -v, --verbose
    bool version{false};                    // --version
    std::optional<std::uint32_t> threads;   // -t, --threads=N
    std::optional<std::size_t> buffer_size; // --buffer-size=SIZE
};

/// Parses command-line arguments and returns a CLIArgs struct.
/// Returns std::nullopt after printing help or a usage error; `exit_code`
/// receives the code main should return in that case.
std::optional<CLIArgs> parse_args(int argc, char const* const* argv, int& exit_code);

} // namespace fxfer::args_parser

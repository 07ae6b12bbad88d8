#include "args_parser.hpp"

#include <CLI/CLI.hpp>

namespace fxfer::args_parser {

std::optional<CLIArgs> parse_args(int argc, char const* const* argv, int& exit_code)
{
    CLIArgs args;
    CLI::App app{"fxfer - concurrent file and directory copier"};

    app.add_option("source", args.source, "File or directory to copy");
    app.add_option("destination", args.destination, "Destination root directory");

    app.add_option("-t,--threads", args.threads, "Worker pool size (default: number of CPUs)")
        ->check(CLI::PositiveNumber);
    app.add_option("--buffer-size", args.buffer_size, "Copy buffer size in bytes")
        ->check(CLI::PositiveNumber);

    app.add_flag("--skip-unchanged", args.skip_unchanged,
                 "Skip files whose destination has the same size and is not older");
    app.add_flag("!--no-preserve-metadata", args.preserve_metadata,
                 "Do not copy modification time and permission bits");
    app.add_flag("!--no-progress", args.progress, "Disable the progress line");
    app.add_flag("-q,--quiet", args.quiet, "Only report errors");
    app.add_flag("-v,--verbose", args.verbose, "Debug logging");
    app.add_flag("--version", args.version, "Print build information and exit");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit_code = app.exit(e);
        return std::nullopt;
    }

    // source и destination обязательны, но не для --version
    if (!args.version && (args.source.empty() || args.destination.empty())) {
        exit_code = app.exit(CLI::RequiredError("source and destination"));
        return std::nullopt;
    }

    exit_code = 0;
    return args;
}

} // namespace fxfer::args_parser

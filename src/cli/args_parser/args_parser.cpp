#include "args_parser.hpp"

#include <CLI/CLI.hpp>

namespace rfetch::args_parser {

std::optional<CLIArgs> parse_args(int argc, char const* const* argv) {
    CLIArgs args{};
    CLI::App app{"rfetch-stress: fetch a URL repeatedly and watch memory and fd usage"};

    app.add_option("url", args.url, "http:// URL to fetch")
        ->required();
    app.add_option("-a,--abort", args.abort_mode, "When to abort the stream")
        ->check(CLI::IsMember({"create", "data", "end", "error", "rotate", "SIGUSR2"}));
    app.add_option("-n,--iterations", args.iterations, "Number of fetches (default 300)")
        ->check(CLI::PositiveNumber);
    app.add_option("-w,--warmup", args.warmup, "Samples ignored by the watermarks (default 20)");
    app.add_option("--hwm", args.high_water_mark, "Max bytes per data chunk")
        ->check(CLI::PositiveNumber);
    app.add_option("-c,--config", args.config_file, "YAML config file")
        ->check(CLI::ExistingFile);
    app.add_flag("-q,--quiet", args.quiet, "Print only the summary");
    app.add_flag("-v,--verbose", args.verbose, "Debug logging");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        app.exit(e);
        return std::nullopt;
    }
    return args;
}

std::optional<FaultServerArgs> parse_fault_server_args(int argc, char const* const* argv) {
    FaultServerArgs args{};
    CLI::App app{"rfetch-fault-server: HTTP server that misbehaves on purpose"};

    app.add_option("scenarios", args.scenarios_file, "YAML file with the scenarios")
        ->required()
        ->check(CLI::ExistingFile);
    app.add_option("-p,--port", args.port, "Port to listen on (0 = any free port)");
    app.add_option("--address", args.address, "Address to listen on");
    app.add_flag("-v,--verbose", args.verbose, "Log every request");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        app.exit(e);
        return std::nullopt;
    }
    return args;
}

} // namespace rfetch::args_parser

#pragma once

#include <string>
#include <cstdint>
#include <optional>



namespace rfetch::args_parser {
    struct CLIArgs
{
    std::string url;                              // позиционный аргумент
    std::optional<std::string> abort_mode;        // -a, --abort=create|data|end|error|rotate|SIGUSR2
    std::optional<std::uint32_t> iterations;      // -n, --iterations=N
    std::optional<std::uint32_t> warmup;          // -w, --warmup=N
    std::optional<std::size_t> high_water_mark;   // --hwm=BYTES
    std::optional<std::string> config_file;       // -c, --config=FILE
    bool quiet{false};                            // -q, --quiet
    bool verbose{false};                          // -v, --verbose
    bool help{false};                             // -h, --help (autogeneration CLI11)
};

    struct FaultServerArgs
{
    std::string scenarios_file;                   // позиционный аргумент, YAML
    std::uint16_t port{0};                        // -p, --port (0 = любой свободный)
    std::string address{"127.0.0.1"};             // --address
    bool verbose{false};                          // -v, --verbose
};



/// Parses rfetch-stress command-line arguments. nullopt: --help или ошибка (уже напечатано).
std::optional<CLIArgs> parse_args(int argc, char const* const* argv);

/// Parses rfetch-fault-server command-line arguments.
std::optional<FaultServerArgs> parse_fault_server_args(int argc, char const* const* argv);

} // namespace rfetch::args_parser

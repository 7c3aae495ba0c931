#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <chrono>
#include <thread>

#include "adapters/http/fault_server.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "infra/interrupt.hpp"

int main(int argc, char** argv)
{
    try {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

        rfetch::infra::install_signal_handler();

        auto args_opt = rfetch::args_parser::parse_fault_server_args(argc, argv);
        if (!args_opt) {
            return 1;
        }
        const auto& args = *args_opt;
        if (args.verbose) {
            spdlog::set_level(spdlog::level::debug);
        }

        auto scenarios = rfetch::adapters::http::load_scenarios_file(args.scenarios_file);
        if (!scenarios) {
            spdlog::error("{}", scenarios.error().message);
            return scenarios.error().to_exit_code();
        }
        for (const auto& scenario : *scenarios) {
            spdlog::info("scenario /{}: {} steps, {} bytes", scenario.name,
                         scenario.steps.size(), scenario.total_bytes());
        }

        rfetch::adapters::http::FaultServer server(std::move(*scenarios));
        if (auto started = server.start(args.port, args.address); !started) {
            spdlog::error("{}", started.error().message);
            return started.error().to_exit_code();
        }
        fmt::print("listening on http://{}:{}/\n", args.address, server.port());

        while (!rfetch::infra::is_interrupted()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        spdlog::info("Shutting down");
        server.stop();
        return 0;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}

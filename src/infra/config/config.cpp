#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <cstdlib>
#include <vector>

#include "config.hpp"
#include "../../cli/args_parser/args_parser.hpp"

namespace rfetch::infra {
    void Config::merge_with(const Config& other) {
        if (other.high_water_mark) high_water_mark = other.high_water_mark;

        if (other.retry.max_attempts) retry.max_attempts = other.retry.max_attempts;
        if (other.retry.min_delay_ms) retry.min_delay_ms = other.retry.min_delay_ms;
        if (other.retry.max_delay_ms) retry.max_delay_ms = other.retry.max_delay_ms;
        if (other.retry.factor) retry.factor = other.retry.factor;
        if (other.retry.randomize) retry.randomize = other.retry.randomize;

        if (other.iterations) iterations = other.iterations;
        if (other.warmup) warmup = other.warmup;
        if (other.abort_mode) abort_mode = other.abort_mode;

        if (other.log_level) log_level = other.log_level;
        if (other.quiet) quiet = true; // CLI может только включить
    }

    auto Config::retry_policy() const -> RetryPolicy {
        RetryPolicy policy{};
        if (retry.max_attempts) policy.max_attempts = *retry.max_attempts;
        if (retry.min_delay_ms) policy.min_delay = std::chrono::milliseconds(*retry.min_delay_ms);
        if (retry.max_delay_ms) policy.max_delay = std::chrono::milliseconds(*retry.max_delay_ms);
        if (retry.factor) policy.factor = *retry.factor;
        if (retry.randomize) policy.randomize = *retry.randomize;
        return policy;
    }

    static auto get_config_paths() -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> paths;

        // 1. Локальный файл
        paths.push_back(".rfetch.yaml");

        // 2. Глобальный файл
        const char* config_home = std::getenv("XDG_CONFIG_HOME");
        if (config_home && std::filesystem::exists(config_home)) {
            paths.push_back(std::filesystem::path(config_home) / "rfetch" / "config.yaml");
        } else {
            const char* home = std::getenv("HOME");
            if (home) {
                paths.push_back(std::filesystem::path(home) / ".config" / "rfetch" / "config.yaml");
            }
        }

        return paths;
    }

    auto config_from_yaml(const YAML::Node& config) -> Config {
        Config cfg{};

        if (config["high_water_mark"]) cfg.high_water_mark = config["high_water_mark"].as<std::size_t>();
        if (config["iterations"]) cfg.iterations = config["iterations"].as<std::uint32_t>();
        if (config["warmup"]) cfg.warmup = config["warmup"].as<std::uint32_t>();
        if (config["abort"]) cfg.abort_mode = config["abort"].as<std::string>();
        if (config["log_level"]) cfg.log_level = config["log_level"].as<std::string>();
        if (config["quiet"]) cfg.quiet = config["quiet"].as<bool>();

        if (const auto& retry = config["retry"]) {
            if (retry["max_attempts"]) cfg.retry.max_attempts = retry["max_attempts"].as<int>();
            if (retry["min_delay_ms"]) cfg.retry.min_delay_ms = retry["min_delay_ms"].as<std::uint32_t>();
            if (retry["max_delay_ms"]) cfg.retry.max_delay_ms = retry["max_delay_ms"].as<std::uint32_t>();
            if (retry["factor"]) cfg.retry.factor = retry["factor"].as<double>();
            if (retry["randomize"]) cfg.retry.randomize = retry["randomize"].as<bool>();
        }

        return cfg;
    }

    auto load_config_from_file(const std::filesystem::path& path) -> std::expected<Config, std::string> {
        try {
            YAML::Node config = YAML::LoadFile(path.string());
            auto cfg = config_from_yaml(config);
            spdlog::debug("Loaded config from {}", path.string());
            return cfg;
        } catch (const std::exception& e) {
            return std::unexpected(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
        }
    }

    auto load_config_from_file() -> std::expected<Config, std::string> {
        for (const auto& path : get_config_paths()) {
            if (!std::filesystem::exists(path)) continue;
            return load_config_from_file(path);
        }

        // Файл не найден: возвращаем пустой конфиг (не ошибка!)
        return Config{};
    }

    [[nodiscard]]
    auto config_from_cli(const rfetch::args_parser::CLIArgs& args) -> Config {
        Config cfg{};
        cfg.high_water_mark = args.high_water_mark;
        cfg.iterations = args.iterations;
        cfg.warmup = args.warmup;
        cfg.abort_mode = args.abort_mode;
        if (args.verbose) cfg.log_level = "debug";
        cfg.quiet = args.quiet;
        return cfg;
    }

} // namespace rfetch::infra

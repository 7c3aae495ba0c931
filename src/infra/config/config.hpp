#pragma once

#include <string>
#include <optional>
#include <cstdint>
#include <expected>
#include <filesystem>
#include "../retry.hpp"

namespace rfetch::args_parser {
    struct CLIArgs;
}

namespace YAML {
    class Node;
}

namespace rfetch::infra {

struct RetryConfig {
    std::optional<int> max_attempts;
    std::optional<std::uint32_t> min_delay_ms;
    std::optional<std::uint32_t> max_delay_ms;
    std::optional<double> factor;
    std::optional<bool> randomize;
};

struct Config {
    // Поток
    std::optional<std::size_t> high_water_mark;   // bytes
    RetryConfig retry;

    // Стресс-прогон
    std::optional<std::uint32_t> iterations;
    std::optional<std::uint32_t> warmup;
    std::optional<std::string> abort_mode;

    // Вывод
    std::optional<std::string> log_level;
    bool quiet = false;

    // Слияние с другим Config (например, из CLI)
    void merge_with(const Config& other);

    // RetryPolicy по умолчанию, поверх которой применены заданные поля
    [[nodiscard]] auto retry_policy() const -> RetryPolicy;
};

/// Загружает конфигурацию из файла YAML.
/// Ищет файл в порядке:
///   1. ./.rfetch.yaml
///   2. $XDG_CONFIG_HOME/rfetch/config.yaml или ~/.config/rfetch/config.yaml
/// Возвращает пустой Config, если файл не найден.
[[nodiscard]] auto load_config_from_file() -> std::expected<Config, std::string>;

/// Загружает конфигурацию из конкретного файла (файл обязан существовать)
[[nodiscard]] auto load_config_from_file(const std::filesystem::path& path)
    -> std::expected<Config, std::string>;

[[nodiscard]] auto config_from_yaml(const YAML::Node& root) -> Config;

/// Создаёт Config из CLI аргументов (структура из args_parser)
[[nodiscard]] auto config_from_cli(const rfetch::args_parser::CLIArgs& args) -> Config;

} // namespace rfetch::infra

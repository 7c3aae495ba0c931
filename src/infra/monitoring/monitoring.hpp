#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "../error_handler/error.hpp"

namespace rfetch::infra {

// Снимок памяти процесса из /proc/self/statm, в байтах
struct MemorySample {
    std::uint64_t rss = 0;
    std::uint64_t vsz = 0;
    std::uint64_t shared = 0;
};

// Открытые дескрипторы процесса: номер -> цель ссылки в /proc/self/fd
struct FdSnapshot {
    std::map<int, std::string> fds;

    [[nodiscard]] auto differs(const FdSnapshot& other) const -> bool { return fds != other.fds; }
    [[nodiscard]] auto size() const -> std::size_t { return fds.size(); }
    [[nodiscard]] auto listing() const -> std::string;
};

[[nodiscard]] auto sample_memory() -> Result<MemorySample>;
[[nodiscard]] auto snapshot_fds() -> Result<FdSnapshot>;

// Минимум и максимум метрики с номерами образцов (с нуля)
struct Watermark {
    std::uint64_t low = 0;
    std::size_t low_sample = 0;
    std::uint64_t high = 0;
    std::size_t high_sample = 0;

    void add(std::uint64_t value, std::size_t sample);
};

struct Watermarks {
    Watermark rss;
    Watermark vsz;
    Watermark shared;
};

class ResourceMonitor {
public:
    explicit ResourceMonitor(std::uint32_t warmup = 0, bool quiet = false);

    // Снять и сохранить образец памяти
    auto record() -> VoidResult;
    void record(const MemorySample& sample) { samples_.push_back(sample); }

    // Первый снимок дескрипторов сохраняется, следующие сравниваются с ним
    auto snapshot_fds_baseline() -> VoidResult;
    [[nodiscard]] auto check_fd_leaks() -> Result<bool>;

    [[nodiscard]] auto samples() const -> const std::vector<MemorySample>& { return samples_; }

    // Без первых warmup образцов; nullopt, если после них ничего не осталось
    [[nodiscard]] auto watermarks() const -> std::optional<Watermarks>;

    // Таблица образцов и водяные знаки в stdout
    void print_report() const;

private:
    const std::uint32_t warmup_;
    const bool quiet_;
    std::vector<MemorySample> samples_;
    std::optional<FdSnapshot> baseline_;
};

} // namespace rfetch::infra

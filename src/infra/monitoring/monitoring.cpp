#include "monitoring.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <string_view>
#include <system_error>
#include <unistd.h>

namespace rfetch::infra {

auto FdSnapshot::listing() const -> std::string {
    std::string out;
    for (const auto& [fd, target] : fds) {
        out += fmt::format("  {:>4} -> {}\n", fd, target);
    }
    return out;
}

auto sample_memory() -> Result<MemorySample> {
    std::ifstream statm_file("/proc/self/statm");
    std::uint64_t size = 0, resident = 0, shared = 0;
    if (!(statm_file >> size >> resident >> shared)) {
        return std::unexpected(make_error(ErrorCode::Unknown, "cannot read /proc/self/statm"));
    }

    const auto page = static_cast<std::uint64_t>(sysconf(_SC_PAGESIZE));
    return MemorySample{
        .rss = resident * page,
        .vsz = size * page,
        .shared = shared * page
    };
}

auto snapshot_fds() -> Result<FdSnapshot> {
    namespace fs = std::filesystem;

    FdSnapshot snap;
    std::error_code ec;
    fs::directory_iterator it("/proc/self/fd", ec);
    if (ec) {
        return std::unexpected(make_error(ErrorCode::Unknown,
                               fmt::format("cannot list /proc/self/fd: {}", ec.message())));
    }

    for (const auto& entry : it) {
        const auto name = entry.path().filename().string();
        int fd = -1;
        auto [ptr, perr] = std::from_chars(name.data(), name.data() + name.size(), fd);
        if (perr != std::errc{} || ptr != name.data() + name.size()) {
            continue;
        }

        // fd мог закрыться между листингом и readlink
        std::error_code link_ec;
        auto target = fs::read_symlink(entry.path(), link_ec);
        if (link_ec) {
            continue;
        }
        snap.fds.emplace(fd, target.string());
    }

    // Дескриптор, через который читался каталог
    std::erase_if(snap.fds, [](const auto& item) {
        return item.second.starts_with("/proc/") && item.second.ends_with("/fd");
    });
    return snap;
}

ResourceMonitor::ResourceMonitor(std::uint32_t warmup, bool quiet)
    : warmup_(warmup)
    , quiet_(quiet)
{}

auto ResourceMonitor::record() -> VoidResult {
    auto sample = sample_memory();
    if (!sample) {
        return std::unexpected(std::move(sample.error()));
    }
    samples_.push_back(*sample);
    return {};
}

auto ResourceMonitor::snapshot_fds_baseline() -> VoidResult {
    auto snap = snapshot_fds();
    if (!snap) {
        return std::unexpected(std::move(snap.error()));
    }
    spdlog::debug("fd baseline: {} open descriptors", snap->size());
    baseline_ = std::move(*snap);
    return {};
}

auto ResourceMonitor::check_fd_leaks() -> Result<bool> {
    if (!baseline_) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument, "no fd baseline recorded"));
    }

    auto current = snapshot_fds();
    if (!current) {
        return std::unexpected(std::move(current.error()));
    }

    if (!baseline_->differs(*current)) {
        fmt::print("no fd leaks detected\n");
        return false;
    }

    fmt::print("fds leaked!\n");
    fmt::print("after first iteration ({}):\n{}", baseline_->size(), baseline_->listing());
    fmt::print("after last iteration ({}):\n{}", current->size(), current->listing());
    return true;
}

void Watermark::add(std::uint64_t value, std::size_t sample) {
    if (value < low) {
        low = value;
        low_sample = sample;
    }
    if (value > high) {
        high = value;
        high_sample = sample;
    }
}

auto ResourceMonitor::watermarks() const -> std::optional<Watermarks> {
    if (samples_.size() <= warmup_) {
        return std::nullopt;
    }

    const auto& first = samples_[warmup_];
    Watermarks marks{
        .rss = {first.rss, warmup_, first.rss, warmup_},
        .vsz = {first.vsz, warmup_, first.vsz, warmup_},
        .shared = {first.shared, warmup_, first.shared, warmup_},
    };
    for (std::size_t i = warmup_ + 1; i < samples_.size(); ++i) {
        marks.rss.add(samples_[i].rss, i);
        marks.vsz.add(samples_[i].vsz, i);
        marks.shared.add(samples_[i].shared, i);
    }
    return marks;
}

void ResourceMonitor::print_report() const {
    if (!quiet_) {
        fmt::print("all memory samples\n");
        fmt::print("{:>3}  {:>12}  {:>12}  {:>12}\n", "#", "RSS", "VSZ", "SHARED");
        for (std::size_t i = 0; i < samples_.size(); ++i) {
            const auto& s = samples_[i];
            fmt::print("{:>3}  {:>12}  {:>12}  {:>12}\n", i, s.rss, s.vsz, s.shared);
        }
    }

    auto marks = watermarks();
    if (!marks) {
        fmt::print("not enough samples after warmup ({}) for watermarks\n", warmup_);
        return;
    }

    auto row = [](std::string_view metric, const Watermark& w) {
        fmt::print("{:<8}  {:>12} bytes (sample {:>3})  {:>12} bytes (sample {:>3})\n",
                   metric, w.low, w.low_sample + 1, w.high, w.high_sample + 1);
    };
    fmt::print("memory watermarks (ignoring first {} samples)\n", warmup_);
    fmt::print("{:<8}  {:<32}  {:<32}\n", "METRIC", "LOW", "HIGH");
    row("RSS:", marks->rss);
    row("VSZ:", marks->vsz);
    row("SHARED:", marks->shared);
}

} // namespace rfetch::infra

#include <fmt/core.h>
#include <fmt/chrono.h>

#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/interrupt.hpp"
#include "infra/monitoring/monitoring.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "adapters/http/beast_client.hpp"
#include "core/stream/reliable_stream.hpp"
#include <git_info.hpp>
#include <spdlog/spdlog.h>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <array>
#include <chrono>
#include <filesystem>
#include <functional>
#include <string_view>
#include <thread>

using GIT = rfetch::build_info::GitInfo;

constexpr auto load_from_cli = rfetch::infra::config_from_cli;
constexpr auto args_parser = rfetch::args_parser::parse_args;
constexpr auto git = rfetch::build_info::get_git_info();

constexpr std::uint32_t kDefaultIterations = 300;
constexpr std::uint32_t kDefaultWarmup = 20;
constexpr std::size_t kDefaultHighWaterMark = 10 * 1024 * 1024;

namespace {

enum class AbortWhen { None, OnCreate, OnData, AfterEnd, AfterError, OnSignal };

auto parse_abort_mode(const std::string& mode) -> AbortWhen {
    if (mode == "create") return AbortWhen::OnCreate;
    if (mode == "data") return AbortWhen::OnData;
    if (mode == "end") return AbortWhen::AfterEnd;
    if (mode == "error") return AbortWhen::AfterError;
    if (mode == "SIGUSR2") return AbortWhen::OnSignal;
    return AbortWhen::None;
}

// Порядок перебора для --abort rotate
constexpr std::array<AbortWhen, 5> kRotation{
    AbortWhen::AfterEnd, AbortWhen::AfterError, AbortWhen::OnCreate, AbortWhen::OnData, AbortWhen::None
};

auto describe(AbortWhen when) -> std::string_view {
    switch (when) {
        case AbortWhen::AfterEnd:   return "after end";
        case AbortWhen::AfterError: return "after error";
        case AbortWhen::OnCreate:   return "after create";
        case AbortWhen::OnData:     return "on data";
        case AbortWhen::OnSignal:   return "on SIGUSR2";
        case AbortWhen::None:       return "skipped";
    }
    return "skipped";
}

// Строка с ISO-8601 временем в начале, как в интерактивных утилитах
template<typename... Args>
void log_event(bool quiet, fmt::format_string<Args...> format, Args&&... args) {
    if (quiet) return;

    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
    fmt::print("{:%Y-%m-%dT%H:%M:%S}.{:03}Z: {}\n",
               fmt::gmtime(std::chrono::system_clock::to_time_t(now)), ms,
               fmt::format(format, std::forward<Args>(args)...));
}

auto
out_git_verse(const GIT& git)
-> void {
    fmt::print("Git branch: {}\n", git.branch);
    fmt::print("Git commit: {}\n", git.commit_short);
    fmt::print("Git dirty: {}\n", git.dirty ? "yes" : "no");
    fmt::print("Build timestamp (UTC): {}\n", git.timestamp);
}

struct IterationResult {
    std::uint64_t bytes = 0;
    bool interrupted = false;
};

// Одна итерация: новый поток, счёт байт, abort в заданный момент
auto run_iteration(boost::asio::io_context& io,
                   const rfetch::core::StreamOptions& base,
                   AbortWhen when,
                   bool quiet) -> IterationResult
{
    using rfetch::core::ReliableStream;

    IterationResult result;
    std::weak_ptr<ReliableStream> current;
    bool done = false;
    bool aborted = false;

    auto abort_stream = [&](std::string_view why) {
        auto stream = current.lock();
        if (!stream || done) {
            log_event(quiet, "would abort ({}), but not running", why);
            return;
        }
        log_event(quiet, "aborting ({}, read {} bytes so far)", why, result.bytes);
        aborted = true;
        done = true;
        stream->abort();
    };

    rfetch::core::CallbackConsumer::Handlers handlers{
        .on_data = [&](const rfetch::core::Chunk& chunk) {
            result.bytes += chunk.size();
            if (when == AbortWhen::OnData && !aborted) {
                abort_stream("after data");
            }
        },
        .on_end = [&](const rfetch::core::Completion& completion) {
            log_event(quiet, "event: end (read {} bytes, md5 {}, xxh64 {:016x})",
                      result.bytes, completion.md5_base64, completion.xxh64);
            if (when == AbortWhen::AfterEnd) {
                boost::asio::post(io, [&]() { abort_stream("after end"); });
            } else {
                done = true;
            }
        },
        .on_error = [&](const rfetch::infra::Error& err) {
            log_event(quiet, "event: error: {}", err.message);
            if (when == AbortWhen::AfterError) {
                boost::asio::post(io, [&]() { abort_stream("after error"); });
            } else {
                done = true;
            }
        },
    };

    auto stream = rfetch::core::open_stream(io, base, std::move(handlers));
    if (!stream) {
        log_event(false, "cannot create stream: {}", stream.error().message);
        result.interrupted = true;
        return result;
    }
    current = *stream;
    log_event(quiet, "stream created");

    if (when == AbortWhen::OnCreate) {
        abort_stream("on create");
    }

    // Сигналы проверяются опросом из цикла событий
    boost::asio::steady_timer watch(io);
    std::function<void()> arm_watch = [&]() {
        watch.expires_after(std::chrono::milliseconds(20));
        watch.async_wait([&](const boost::system::error_code& ec) {
            if (ec || done) return;
            if (rfetch::infra::is_interrupted()) {
                result.interrupted = true;
                abort_stream("interrupted");
                return;
            }
            if (rfetch::infra::consume_abort_request()) {
                if (when == AbortWhen::OnSignal) {
                    abort_stream("caught SIGUSR2");
                } else {
                    log_event(quiet, "ignoring SIGUSR2 (no --abort SIGUSR2)");
                }
            }
            if (!done) arm_watch();
        });
    };
    arm_watch();

    // Поток живёт, пока есть работа в io_context
    io.restart();
    io.run();
    return result;
}

} // namespace

int main(int argc, char** argv)
{
    try {
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%n] [%l] %v");

        rfetch::infra::install_signal_handler();

        auto args_opt = args_parser(argc, argv);
        if (!args_opt) {
            return 1; // --help или ошибка
        }
        const auto& args = *args_opt;

        // 1. Загрузить из файла
        auto config_res = args.config_file
            ? rfetch::infra::load_config_from_file(std::filesystem::path(*args.config_file))
            : rfetch::infra::load_config_from_file();
        if (!config_res) {
            spdlog::error("Config error: {}", config_res.error());
            return 1;
        }
        auto config = config_res.value();

        // 2. Переопределить из CLI
        config.merge_with(load_from_cli(args));

        if (config.log_level) {
            spdlog::set_level(spdlog::level::from_str(*config.log_level));
        }

        const auto iterations = config.iterations.value_or(kDefaultIterations);
        const auto warmup = config.warmup.value_or(kDefaultWarmup);
        if (warmup >= iterations) {
            spdlog::error("# of warmup iterations is configured too high ({} >= {})", warmup, iterations);
            return 1;
        }

        const auto abort_mode = config.abort_mode.value_or("none");
        const bool rotate = abort_mode == "rotate";
        const auto fixed_when = parse_abort_mode(abort_mode);

        auto retry_policy = config.retry_policy();
        if (auto valid = retry_policy.validate(); !valid) {
            spdlog::error("Config error: {}", valid.error().message);
            return 1;
        }

        if (!config.quiet) {
            out_git_verse(git);
        }

        auto url = rfetch::adapters::http::parse_http_url(args.url);
        if (!url) {
            spdlog::error("{}", url.error().message);
            return url.error().to_exit_code();
        }

        boost::asio::io_context io;
        auto client = std::make_shared<rfetch::adapters::http::BeastHttpClient>(io, url->host, url->port);

        rfetch::core::StreamOptions options{
            .path = url->target,
            .client = client,
            .high_water_mark = config.high_water_mark.value_or(kDefaultHighWaterMark),
            .retry_policy = retry_policy,
            .logger = spdlog::default_logger()->clone("stream"),
        };

        rfetch::infra::ResourceMonitor monitor(warmup, config.quiet);
        std::uint32_t done = 0;
        while (done < iterations) {
            auto when = fixed_when;
            if (rotate) {
                when = kRotation[done % kRotation.size()];
                log_event(config.quiet, "next abort: {}", describe(when));
            }

            auto result = run_iteration(io, options, when, config.quiet);
            if (result.interrupted || rfetch::infra::is_interrupted()) {
                spdlog::warn("Interrupted after {} iterations", done);
                return 130;
            }

            if (auto rec = monitor.record(); !rec) {
                spdlog::error("{}", rec.error().message);
                return 1;
            }
            ++done;
            const auto& sample = monitor.samples().back();
            log_event(config.quiet, "sample {}: rss {} vsz {} shared {}",
                      done, sample.rss, sample.vsz, sample.shared);

            if (done == 1) {
                // Первый снимок после первой итерации: ленивые fd уже открыты
                if (auto snap = monitor.snapshot_fds_baseline(); !snap) {
                    spdlog::error("{}", snap.error().message);
                    return 1;
                }
            } else if (done < iterations) {
                log_event(config.quiet, "starting again in 50ms");
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
        }

        log_event(config.quiet, "completed {} iterations: running final checks", done);
        auto leaked = monitor.check_fd_leaks();
        if (!leaked) {
            spdlog::error("{}", leaked.error().message);
            return 1;
        }
        monitor.print_report();

        return *leaked ? 1 : 0;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}

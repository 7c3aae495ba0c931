// Скачать один URL и посчитать байты.
//
//     rfetch-basic http://127.0.0.1:8080/bigfile

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <boost/asio/io_context.hpp>

#include "adapters/http/beast_client.hpp"
#include "core/stream/reliable_stream.hpp"

int main(int argc, char** argv)
{
    if (argc != 2) {
        fmt::print(stderr, "usage: {} URL\n", argv[0]);
        return 2;
    }

    spdlog::set_level(spdlog::level::info);

    auto url = rfetch::adapters::http::parse_http_url(argv[1]);
    if (!url) {
        spdlog::error("{}", url.error().message);
        return url.error().to_exit_code();
    }

    boost::asio::io_context io;
    std::uint64_t nbytes = 0;
    int status = 0;

    auto stream = rfetch::core::open_stream(io,
        rfetch::core::StreamOptions{
            .path = url->target,
            .client = std::make_shared<rfetch::adapters::http::BeastHttpClient>(io, url->host, url->port),
            .high_water_mark = 10 * 1024 * 1024,
        },
        rfetch::core::CallbackConsumer::Handlers{
            .on_data = [&](const rfetch::core::Chunk& chunk) { nbytes += chunk.size(); },
            .on_end = [&](const rfetch::core::Completion&) {
                fmt::print("fetched {} bytes\n", nbytes);
            },
            .on_error = [&](const rfetch::infra::Error& err) {
                spdlog::error("fetch failed: {}", err.message);
                status = err.to_exit_code();
            },
        });
    if (!stream) {
        spdlog::error("{}", stream.error().message);
        return stream.error().to_exit_code();
    }

    io.run();
    return status;
}

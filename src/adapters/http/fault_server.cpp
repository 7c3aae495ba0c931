#include "fault_server.hpp"

#include <algorithm>
#include <charconv>
#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "infra/hash/integrity_tracker.hpp"

namespace beast = boost::beast;
namespace bhttp = beast::http;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace rfetch::adapters::http {

namespace {

constexpr const char* kServerName = "rfetch-fault-server";

void write_status(tcp::socket& socket, int status, std::string_view body) {
    bhttp::response<bhttp::string_body> res{static_cast<bhttp::status>(status), 11};
    res.set(bhttp::field::server, kServerName);
    res.set(bhttp::field::connection, "close");
    res.body() = std::string(body);
    res.prepare_payload();

    beast::error_code ec;
    bhttp::write(socket, res, ec);
    if (ec) {
        spdlog::debug("test server: writing {} response: {}", status, ec.message());
    }
}

} // namespace

auto ScenarioStep::parse(std::string_view text) -> infra::Result<ScenarioStep> {
    if (text == "change_etag") {
        return ScenarioStep{.kind = Kind::ChangeEtag};
    }

    constexpr std::string_view error_prefix = "error_";
    if (text.substr(0, error_prefix.size()) == error_prefix) {
        auto code = text.substr(error_prefix.size());
        int status = 0;
        auto [ptr, ec] = std::from_chars(code.data(), code.data() + code.size(), status);
        if (ec != std::errc{} || ptr != code.data() + code.size() || status < 100 || status > 599) {
            return std::unexpected(infra::make_error(infra::ErrorCode::ConfigError,
                                   fmt::format("invalid status step: \"{}\"", text)));
        }
        return ScenarioStep{.kind = Kind::Status, .status = status};
    }

    std::uint64_t bytes = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), bytes);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ConfigError,
                               fmt::format("invalid scenario step: \"{}\"", text)));
    }
    return ScenarioStep{.kind = Kind::Data, .bytes = bytes};
}

auto Scenario::total_bytes() const -> std::uint64_t {
    std::uint64_t total = 0;
    for (const auto& step : steps) {
        if (step.kind == ScenarioStep::Kind::Data) {
            total += step.bytes;
        }
    }
    return total;
}

auto scenario_payload(std::uint64_t length) -> std::vector<std::uint8_t> {
    constexpr std::uint8_t low = 'a';
    constexpr std::uint8_t high = 'z';
    std::vector<std::uint8_t> buf(length);
    for (std::uint64_t i = 0; i < length; ++i) {
        buf[i] = static_cast<std::uint8_t>(low + (i % (high - low)));
    }
    return buf;
}

auto load_scenarios(const YAML::Node& root) -> infra::Result<std::vector<Scenario>> {
    std::vector<Scenario> out;
    try {
        const auto& list = root["scenarios"];
        if (!list || !list.IsSequence()) {
            return std::unexpected(infra::make_error(infra::ErrorCode::ConfigError,
                                   "expected a \"scenarios\" sequence"));
        }

        for (const auto& node : list) {
            Scenario scenario;
            scenario.name = node["name"].as<std::string>();

            if (const auto& md5 = node["md5"]) {
                if (md5.IsNull()) {
                    scenario.md5_mode = Md5Mode::Omit;
                } else {
                    scenario.md5_mode = Md5Mode::Override;
                    scenario.md5_override = md5.as<std::string>();
                }
            }

            for (const auto& step : node["chunks"]) {
                auto parsed = ScenarioStep::parse(step.as<std::string>());
                if (!parsed) {
                    return std::unexpected(std::move(parsed.error()));
                }
                scenario.steps.push_back(*parsed);
            }

            if (scenario.steps.empty()) {
                return std::unexpected(infra::make_error(infra::ErrorCode::ConfigError,
                                       fmt::format("scenario \"{}\" has no chunks", scenario.name)));
            }
            out.push_back(std::move(scenario));
        }
    } catch (const YAML::Exception& e) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ConfigError,
                               fmt::format("invalid scenario definition: {}", e.what())));
    }
    return out;
}

auto load_scenarios_file(const std::filesystem::path& path) -> infra::Result<std::vector<Scenario>> {
    try {
        return load_scenarios(YAML::LoadFile(path.string()));
    } catch (const YAML::Exception& e) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ConfigError,
                               fmt::format("Failed to parse {}: {}", path.string(), e.what())));
    }
}

FaultServer::FaultServer(std::vector<Scenario> scenarios)
    : acceptor_(io_)
{
    for (auto& scenario : scenarios) {
        auto name = scenario.name;
        scenarios_.emplace(std::move(name), std::move(scenario));
    }
}

FaultServer::~FaultServer() {
    stop();
}

auto FaultServer::start(std::uint16_t port, std::string_view address) -> infra::VoidResult {
    beast::error_code ec;
    auto addr = asio::ip::make_address(std::string(address), ec);
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                               fmt::format("invalid listen address {}: {}", address, ec.message())));
    }

    tcp::endpoint endpoint{addr, port};
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::NetworkFailure,
                               fmt::format("cannot listen on {}:{}: {}", address, port, ec.message())));
    }

    port_ = acceptor_.local_endpoint().port();
    spdlog::info("server listening at {}:{}", address, port_);

    do_accept_();
    running_ = true;
    thread_ = std::thread([this]() { io_.run(); });
    return {};
}

void FaultServer::stop() {
    if (!running_) {
        return;
    }
    running_ = false;

    io_.stop();
    if (thread_.joinable()) {
        thread_.join();
    }

    // поток сервера остановлен, acceptor больше ни с кем не делим
    beast::error_code ec;
    acceptor_.close(ec);
}

auto FaultServer::requests(const std::string& scenario) const -> std::uint32_t {
    std::lock_guard lock(state_mutex_);
    auto it = state_.find(scenario);
    return it == state_.end() ? 0 : it->second.requests;
}

void FaultServer::do_accept_() {
    acceptor_.async_accept([this](beast::error_code ec, tcp::socket socket) {
        if (ec) {
            if (ec != asio::error::operation_aborted) {
                spdlog::warn("test server: accept failed: {}", ec.message());
            }
            return;
        }

        // Соединения обслуживаются по одному: клиент и так делает не больше одного запроса
        handle_(socket);

        beast::error_code ignored;
        socket.shutdown(tcp::socket::shutdown_both, ignored);
        socket.close(ignored);

        do_accept_();
    });
}

void FaultServer::handle_(tcp::socket& socket) {
    beast::flat_buffer buffer;
    bhttp::request<bhttp::empty_body> req;
    beast::error_code ec;
    bhttp::read(socket, buffer, req, ec);
    if (ec) {
        spdlog::debug("test server: reading request: {}", ec.message());
        return;
    }

    auto target = std::string(req.target().data(), req.target().size());
    auto range_it = req.find(bhttp::field::range);
    const bool ranged = range_it != req.end();
    spdlog::debug("test server: request start {} (range={})", target,
                  ranged ? std::string(range_it->value().data(), range_it->value().size()) : "none");

    auto it = scenarios_.find(target.empty() ? target : target.substr(1));
    if (it == scenarios_.end()) {
        write_status(socket, 404, "no such scenario");
        return;
    }
    const auto& scenario = it->second;

    std::lock_guard lock(state_mutex_);
    auto& state = state_[scenario.name];

    if (!ranged) {
        // Первый запрос потока клиента: строим ресурс и считаем md5
        auto requests = state.requests;
        state = ScenarioState{};
        state.requests = requests;
        state.raw = scenario_payload(scenario.total_bytes());
        auto md5 = infra::IntegrityTracker::md5_base64(state.raw);
        if (!md5) {
            write_status(socket, 500, md5.error().message);
            return;
        }
        state.md5 = std::move(*md5);
    } else {
        const auto expected = fmt::format("bytes={}-", state.served);
        const auto actual = std::string(range_it->value().data(), range_it->value().size());
        if (actual != expected) {
            spdlog::error("test \"{}\": expected range header \"{}\", but got \"{}\"",
                          scenario.name, expected, actual);
            write_status(socket, 400, "client made the wrong \"Range\" request");
            return;
        }
    }

    ++state.requests;
    fetch_next_(socket, scenario, state, ranged);
}

void FaultServer::fetch_next_(tcp::socket& socket,
                              const Scenario& scenario,
                              ScenarioState& state,
                              bool ranged)
{
    if (state.next_step >= scenario.steps.size()) {
        write_status(socket, 416, "client requested past the end of the object");
        return;
    }

    const auto& step = scenario.steps[state.next_step++];
    switch (step.kind) {
        case ScenarioStep::Kind::Status:
            write_status(socket, step.status, "");
            return;

        case ScenarioStep::Kind::ChangeEtag:
            state.etag = state.etag == "etag0" ? "etag1" : "etag0";
            fetch_next_(socket, scenario, state, ranged);
            return;

        case ScenarioStep::Kind::Data:
            break;
    }

    const auto remaining = state.raw.size() - state.served;
    const auto count = std::min<std::uint64_t>(step.bytes, remaining);

    bhttp::response<bhttp::empty_body> res{ranged ? bhttp::status::partial_content : bhttp::status::ok, 11};
    res.set(bhttp::field::server, kServerName);
    res.set(bhttp::field::connection, "close");
    res.set(bhttp::field::content_length, std::to_string(remaining));
    res.set(bhttp::field::etag, state.etag);
    res.set("x-server-name", kServerName);
    res.set("x-request-id", std::to_string(++request_ids_));
    if (!ranged) {
        switch (scenario.md5_mode) {
            case Md5Mode::Correct:  res.set("content-md5", state.md5); break;
            case Md5Mode::Override: res.set("content-md5", scenario.md5_override); break;
            case Md5Mode::Omit:     break;
        }
    }

    beast::error_code ec;
    bhttp::response_serializer<bhttp::empty_body> sr{res};
    bhttp::write_header(socket, sr, ec);
    if (!ec && count > 0) {
        asio::write(socket, asio::buffer(state.raw.data() + state.served, count), ec);
    }
    if (ec) {
        spdlog::warn("test server: writing response for \"{}\": {}", scenario.name, ec.message());
        return;
    }

    state.served += count;
    spdlog::debug("test server: request completed ({} bytes, etag={}, {} of {} served)",
                  count, state.etag, state.served, state.raw.size());
}

} // namespace rfetch::adapters::http

#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <yaml-cpp/yaml.h>
#include "infra/error_handler/error.hpp"

namespace rfetch::adapters::http {

/*
 * Тестовый HTTP-сервер, который умеет плохо себя вести по сценарию.
 *
 * Сценарий - список шагов, каждый запрос клиента исполняет очередной шаг:
 *
 *     N            отдать следующие N байт ресурса (Content-Length при этом
 *                  равен всему остатку) и закрыть соединение
 *     change_etag  сменить etag (etag0 <-> etag1) и выполнить следующий шаг
 *     error_NNN    ответить статусом NNN с пустым телом
 *
 * Запрос без Range начинает сценарий заново. Запрос с Range обязан
 * запрашивать ровно "bytes=<отдано>-", иначе 400.
 */
struct ScenarioStep {
    enum class Kind { Data, ChangeEtag, Status };

    Kind kind = Kind::Data;
    std::uint64_t bytes = 0;
    int status = 0;

    [[nodiscard]] static auto parse(std::string_view text) -> infra::Result<ScenarioStep>;
};

enum class Md5Mode {
    Correct,   // настоящий content-md5 ресурса
    Omit,      // без заголовка
    Override,  // заданное значение (для проверки несовпадения)
};

struct Scenario {
    std::string name;                    // URL: /<name>
    std::vector<ScenarioStep> steps;
    Md5Mode md5_mode = Md5Mode::Correct;
    std::string md5_override;

    [[nodiscard]] auto total_bytes() const -> std::uint64_t;
};

// Содержимое ресурса сценария: 'a' + (i % 25)
[[nodiscard]] auto scenario_payload(std::uint64_t length) -> std::vector<std::uint8_t>;

[[nodiscard]] auto load_scenarios(const YAML::Node& root) -> infra::Result<std::vector<Scenario>>;
[[nodiscard]] auto load_scenarios_file(const std::filesystem::path& path)
    -> infra::Result<std::vector<Scenario>>;

class FaultServer {
public:
    explicit FaultServer(std::vector<Scenario> scenarios);
    ~FaultServer();

    FaultServer(const FaultServer&) = delete;
    FaultServer& operator=(const FaultServer&) = delete;

    // Слушать 127.0.0.1:<port> (0 - любой свободный) в отдельном потоке
    [[nodiscard]] auto start(std::uint16_t port = 0, std::string_view address = "127.0.0.1")
        -> infra::VoidResult;
    void stop();

    [[nodiscard]] auto port() const -> std::uint16_t { return port_; }
    [[nodiscard]] auto requests(const std::string& scenario) const -> std::uint32_t;

private:
    struct ScenarioState {
        std::vector<std::uint8_t> raw;
        std::string md5;
        std::string etag = "etag0";
        std::uint64_t served = 0;
        std::size_t next_step = 0;
        std::uint32_t requests = 0;
    };

    void do_accept_();
    void handle_(boost::asio::ip::tcp::socket& socket);
    void fetch_next_(boost::asio::ip::tcp::socket& socket,
                     const Scenario& scenario,
                     ScenarioState& state,
                     bool ranged);

    std::map<std::string, Scenario> scenarios_;
    std::map<std::string, ScenarioState> state_;
    mutable std::mutex state_mutex_;

    boost::asio::io_context io_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::thread thread_;
    std::uint16_t port_ = 0;
    std::atomic<std::uint64_t> request_ids_{0};
    bool running_ = false;
};

} // namespace rfetch::adapters::http

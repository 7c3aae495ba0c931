#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <spdlog/logger.h>
#include "adapters/http/http_client.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/hash/integrity_tracker.hpp"
#include "infra/retry.hpp"
#include "attempt.hpp"
#include "delivery.hpp"
#include "stream_state.hpp"

namespace rfetch::core {

struct StreamOptions {
    std::string path;
    std::shared_ptr<adapters::http::HttpClient> client;
    std::size_t high_water_mark = 0;                 // максимум байт на один on_data()
    std::optional<infra::RetryPolicy> retry_policy;  // по умолчанию: несколько повторов, несколько секунд
    std::shared_ptr<spdlog::logger> logger;          // по умолчанию: spdlog::default_logger()
};

// Метаданные первого успешного ответа; дальше не меняются
struct ExpectedMeta {
    std::optional<std::uint64_t> length;
    std::optional<std::string> etag;
    std::optional<std::string> md5;
};

/*
 * Читаемый поток HTTP-ресурса, переживающий транзиентные сбои соединения.
 *
 * Преждевременное закрытие соединения (прочитано меньше content-length)
 * всегда повторяется сразу, с Range от последнего отданного байта, без
 * задержки и без расхода бюджета повторов. Сетевые ошибки и 5xx проходят
 * через BackoffGate. 4xx, смена etag и несовпадение content-md5 фатальны.
 *
 * Однопоточный: все методы и колбэки выполняются в потоке io_context.
 */
class ReliableStream final : public PullSource,
                             public AttemptObserver,
                             public std::enable_shared_from_this<ReliableStream> {
public:
    [[nodiscard]] static auto create(boost::asio::io_context& io,
                                     StreamOptions options,
                                     std::shared_ptr<StreamConsumer> consumer)
        -> infra::Result<std::shared_ptr<ReliableStream>>;

    ~ReliableStream() override;

    ReliableStream(const ReliableStream&) = delete;
    ReliableStream& operator=(const ReliableStream&) = delete;

    // Спрос потребителя. Повторный вызов, пока предыдущий не обслужен, ничего не делает.
    void request_more() override;

    // Идемпотентно; после abort() потребитель не получает никаких уведомлений
    void abort() override;

    [[nodiscard]] auto state() const -> StreamState { return state_; }
    [[nodiscard]] auto path() const -> const std::string& { return options_.path; }
    [[nodiscard]] auto bytes_consumed() const -> std::uint64_t { return bytes_consumed_; }
    [[nodiscard]] auto resumes() const -> std::uint32_t { return resumes_; }
    [[nodiscard]] auto retries() const -> std::uint32_t { return retries_; }
    [[nodiscard]] auto expected() const -> const std::optional<ExpectedMeta>& { return expected_; }

    // AttemptObserver
    void attempt_response(Attempt& attempt, const adapters::http::Response& response) override;
    void attempt_chunk(Attempt& attempt, adapters::http::Chunk&& chunk) override;
    void attempt_end(Attempt& attempt) override;
    void attempt_failed(Attempt& attempt, infra::Error failure) override;

private:
    ReliableStream(boost::asio::io_context& io,
                   StreamOptions options,
                   std::shared_ptr<StreamConsumer> consumer,
                   infra::IntegrityTracker tracker);

    void service_demand_();
    void start_attempt_();
    void backoff_elapsed_();
    void verify_and_complete_();
    void fail_(infra::Error err);
    void teardown_();
    [[nodiscard]] auto is_active_(const Attempt& attempt) const -> bool;

    boost::asio::io_context& io_;
    StreamOptions options_;
    std::shared_ptr<StreamConsumer> consumer_;
    std::shared_ptr<spdlog::logger> log_;

    infra::IntegrityTracker tracker_;
    infra::BackoffGate gate_;
    boost::asio::steady_timer backoff_timer_;

    StreamState state_ = StreamState::Idle;
    std::shared_ptr<Attempt> active_attempt_;   // не больше одной попытки
    std::optional<ExpectedMeta> expected_;
    std::uint64_t bytes_consumed_ = 0;
    std::uint32_t resumes_ = 0;
    std::uint32_t retries_ = 0;
    bool pending_demand_ = false;
    bool torn_down_ = false;
};

// Создать поток с CallbackConsumer в режиме flowing и сразу запросить данные
[[nodiscard]] auto open_stream(boost::asio::io_context& io,
                               StreamOptions options,
                               CallbackConsumer::Handlers handlers)
    -> infra::Result<std::shared_ptr<ReliableStream>>;

} // namespace rfetch::core

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <spdlog/logger.h>
#include "adapters/http/http_client.hpp"
#include "infra/error_handler/error.hpp"

namespace rfetch::core {

class Attempt;

// Решения попытки, уже классифицированные. Что с ними делать, решает только контроллер.
class AttemptObserver {
public:
    virtual ~AttemptObserver() = default;

    // Заголовки 2xx-ответа получены; тело готово к чтению через pump()
    virtual void attempt_response(Attempt& attempt, const adapters::http::Response& response) = 0;
    virtual void attempt_chunk(Attempt& attempt, adapters::http::Chunk&& chunk) = 0;
    virtual void attempt_end(Attempt& attempt) = 0;

    // Transient (сеть, 5xx), FatalClient (4xx) или FatalProtocol (прочие статусы)
    virtual void attempt_failed(Attempt& attempt, infra::Error failure) = 0;
};

// Один цикл запрос/ответ. Сам никогда не повторяет запрос.
class Attempt : public std::enable_shared_from_this<Attempt> {
public:
    Attempt(adapters::http::HttpClient& client,
            std::string path,
            std::uint64_t range_offset,
            std::weak_ptr<AttemptObserver> observer,
            std::shared_ptr<spdlog::logger> logger);
    ~Attempt();

    Attempt(const Attempt&) = delete;
    Attempt& operator=(const Attempt&) = delete;

    void start();

    // Вытянуть один чанк; если данных нет - подписаться на readable и ждать
    void pump(std::size_t max_bytes);

    // Отменить запрос и закрыть тело ответа (ровно один раз)
    void cancel();

    [[nodiscard]] auto range_offset() const -> std::uint64_t { return range_offset_; }
    [[nodiscard]] auto has_response() const -> bool { return body_ != nullptr; }

private:
    void on_response_(infra::Result<adapters::http::Response> result);
    void on_body_end_();
    void on_body_error_(const infra::Error& err);

    adapters::http::HttpClient& client_;
    const std::string path_;
    const std::uint64_t range_offset_;
    std::weak_ptr<AttemptObserver> observer_;
    std::shared_ptr<spdlog::logger> log_;

    std::shared_ptr<adapters::http::RequestHandle> request_;
    std::shared_ptr<adapters::http::ResponseBody> body_;
    bool waiting_readable_ = false;
    bool finished_ = false;   // end/failure уже переданы наблюдателю
    bool cancelled_ = false;
};

} // namespace rfetch::core

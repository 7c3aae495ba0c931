#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include "adapters/http/http_client.hpp"
#include "infra/error_handler/error.hpp"

namespace rfetch::core {

using Chunk = adapters::http::Chunk;

struct Completion {
    std::uint64_t bytes = 0;
    std::string md5_base64;
    std::uint64_t xxh64 = 0;
};

// Сторона потребителя. На одну сессию приходит не больше одного
// терминального уведомления (on_end или on_error).
class StreamConsumer {
public:
    virtual ~StreamConsumer() = default;

    virtual void on_data(const Chunk& chunk) = 0;
    virtual void on_end(const Completion& completion) = 0;
    virtual void on_error(const infra::Error& error) = 0;
};

// Сторона источника: потребитель сам сигнализирует спрос.
// Один вызов request_more() -> не больше одного on_data().
class PullSource {
public:
    virtual ~PullSource() = default;

    virtual void request_more() = 0;
    virtual void abort() = 0;
};

class CallbackConsumer final : public StreamConsumer {
public:
    struct Handlers {
        std::function<void(const Chunk&)> on_data;
        std::function<void(const Completion&)> on_end;
        std::function<void(const infra::Error&)> on_error;
    };

    // flowing: после каждого чанка автоматически запрашивать следующий
    explicit CallbackConsumer(Handlers handlers, bool flowing = true)
        : handlers_(std::move(handlers))
        , flowing_(flowing)
    {}

    // Подключить источник; в режиме flowing сразу запрашивает первые данные
    void attach(std::weak_ptr<PullSource> source) {
        source_ = std::move(source);
        if (flowing_) {
            request_next_();
        }
    }

    void on_data(const Chunk& chunk) override {
        if (handlers_.on_data) handlers_.on_data(chunk);
        if (flowing_) request_next_();
    }

    void on_end(const Completion& completion) override {
        if (handlers_.on_end) handlers_.on_end(completion);
    }

    void on_error(const infra::Error& error) override {
        if (handlers_.on_error) handlers_.on_error(error);
    }

private:
    void request_next_() {
        if (auto source = source_.lock()) {
            source->request_more();
        }
    }

    Handlers handlers_;
    const bool flowing_;
    std::weak_ptr<PullSource> source_;
};

} // namespace rfetch::core

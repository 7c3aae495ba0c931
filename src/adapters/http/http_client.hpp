#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "infra/error_handler/error.hpp"

namespace rfetch::adapters::http {

using Chunk = std::vector<std::uint8_t>;

struct Request {
    std::string path;
    std::optional<std::uint64_t> range_start; // -> "Range: bytes=<start>-"
};

// Заголовки, важные для возобновления и проверки целостности
struct ResponseMeta {
    std::optional<std::uint64_t> content_length;
    std::optional<std::string> etag;
    std::optional<std::string> content_md5;
    std::optional<std::string> server_name;   // x-server-name
    std::optional<std::string> request_id;    // x-request-id
};

// Pull-поток тела ответа.
// Все уведомления доставляются асинхронно через executor клиента, никогда
// изнутри read() или регистрации колбэка.
class ResponseBody {
public:
    virtual ~ResponseBody() = default;

    // Следующий фрагмент (не больше max_bytes) или nullopt, если данных пока нет.
    [[nodiscard]] virtual auto read(std::size_t max_bytes) -> std::optional<Chunk> = 0;

    // Однократно: появились новые данные. На конец и ошибку не срабатывает.
    virtual void when_readable(std::function<void()> cb) = 0;

    // Конец тела: EOF достигнут и всё прочитано через read()
    virtual void on_end(std::function<void()> cb) = 0;
    virtual void on_error(std::function<void(const infra::Error&)> cb) = 0;

    // Закрыть соединение; колбэки после этого не вызываются
    virtual void destroy() = 0;
};

struct Response {
    int status_code = 0;
    std::string reason;
    ResponseMeta meta;
    std::shared_ptr<ResponseBody> body;
};

class RequestHandle {
public:
    virtual ~RequestHandle() = default;

    // Отменить запрос, пока не пришли заголовки. Обработчик ответа больше не вызывается.
    virtual void cancel() = 0;
};

using ResponseHandler = std::function<void(infra::Result<Response>)>;

// Любой HTTP-статус приходит как Response; ошибкой считается только сбой сети
// до получения заголовков (NetworkFailure).
class HttpClient {
public:
    virtual ~HttpClient() = default;

    [[nodiscard]] virtual auto get(const Request& request, ResponseHandler handler)
        -> std::shared_ptr<RequestHandle> = 0;
};

} // namespace rfetch::adapters::http

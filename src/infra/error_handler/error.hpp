#pragma once

#include <cstdlib>
#include <string>
#include <string_view>
#include <optional>
#include <source_location>
#include <expected>
#include <spdlog/spdlog.h>

namespace rfetch::infra {

enum class ErrorCode {
    // Транзиентные (можно retry через BackoffGate)
    NetworkFailure,     // DNS / connect / reset до получения заголовков
    ServerError,        // HTTP 5xx

    // Фатальные ошибки клиента
    ClientError,        // HTTP 4xx

    // Фатальные ошибки протокола
    IdentityMismatch,   // etag изменился между попытками
    ChecksumMismatch,   // content-md5 не совпал
    UnexpectedStatus,   // 1xx / 3xx и прочее

    // Не ошибка потока
    Aborted,
    Interrupted,

    // Системные
    InvalidArgument,
    ConfigError,
    Unknown,
};

// Таксономия для принятия решений на уровне сессии
enum class ErrorClass {
    Transient,
    FatalClient,
    FatalProtocol,
    UserAbort,
    Internal,
};

struct Error {
    ErrorCode code;
    std::string message;
    std::optional<int> status_code;
    std::string file;
    int line;
    std::string function;

    // Конструктор с автоматическим захватом location
    Error(ErrorCode c, std::string_view msg,
          const std::source_location& loc = std::source_location::current())
        : code(c)
        , message(msg)
        , file(loc.file_name())
        , line(static_cast<int>(loc.line()))
        , function(loc.function_name())
    {}

    Error(ErrorCode c, int status, std::string_view msg,
          const std::source_location& loc = std::source_location::current())
        : Error(c, msg, loc)
    {
        status_code = status;
    }

    [[nodiscard]] auto classification() const -> ErrorClass;
    [[nodiscard]] auto is_fatal() const -> bool;
    [[nodiscard]] auto to_exit_code() const -> int;
    [[nodiscard]] auto what() const -> const char*;

    [[nodiscard]] auto is_transient() const -> bool {
        return code == ErrorCode::NetworkFailure ||
               code == ErrorCode::ServerError;
    }
};

[[nodiscard]] auto to_string(ErrorCode code) -> std::string_view;
[[nodiscard]] auto to_string(ErrorClass cls) -> std::string_view;

// Псевдонимы для удобства
template<typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

// Вспомогательные функции-конструкторы
[[nodiscard]] auto make_error(
    ErrorCode code,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// Ошибка по HTTP-статусу: 5xx -> ServerError, 4xx -> ClientError, иначе UnexpectedStatus
[[nodiscard]] auto make_status_error(
    int status,
    std::string_view reason,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// Логирование ошибки и возврат
[[nodiscard]] auto log_and_return(Error&& err) -> Error;

} // namespace rfetch::infra

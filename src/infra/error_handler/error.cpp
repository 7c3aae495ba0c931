#include "error.hpp"
#include <fmt/core.h>

namespace rfetch::infra {

ErrorClass Error::classification() const {
    switch (code) {
        case ErrorCode::NetworkFailure:
        case ErrorCode::ServerError:
            return ErrorClass::Transient;
        case ErrorCode::ClientError:
            return ErrorClass::FatalClient;
        case ErrorCode::IdentityMismatch:
        case ErrorCode::ChecksumMismatch:
        case ErrorCode::UnexpectedStatus:
            return ErrorClass::FatalProtocol;
        case ErrorCode::Aborted:
        case ErrorCode::Interrupted:
            return ErrorClass::UserAbort;
        default:
            return ErrorClass::Internal;
    }
}

bool Error::is_fatal() const {
    switch (classification()) {
        case ErrorClass::FatalClient:
        case ErrorClass::FatalProtocol:
        case ErrorClass::Internal:
            return true;
        default:
            return false;
    }
}

int Error::to_exit_code() const {
    switch (code) {
        case ErrorCode::NetworkFailure:   return 20;
        case ErrorCode::ServerError:      return 21;
        case ErrorCode::ChecksumMismatch: return 22;
        case ErrorCode::IdentityMismatch: return 23;
        case ErrorCode::ClientError:      return 24;
        case ErrorCode::InvalidArgument:
        case ErrorCode::ConfigError:      return 2;
        case ErrorCode::Interrupted:      return 130; // SIGINT
        default:                          return EXIT_FAILURE;
    }
}

const char* Error::what() const {
    return message.c_str();
}

std::string_view to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NetworkFailure:   return "NetworkFailure";
        case ErrorCode::ServerError:      return "ServerError";
        case ErrorCode::ClientError:      return "ClientError";
        case ErrorCode::IdentityMismatch: return "IdentityMismatch";
        case ErrorCode::ChecksumMismatch: return "ChecksumMismatch";
        case ErrorCode::UnexpectedStatus: return "UnexpectedStatus";
        case ErrorCode::Aborted:          return "Aborted";
        case ErrorCode::Interrupted:      return "Interrupted";
        case ErrorCode::InvalidArgument:  return "InvalidArgument";
        case ErrorCode::ConfigError:      return "ConfigError";
        case ErrorCode::Unknown:          return "Unknown";
    }
    return "Unknown";
}

std::string_view to_string(ErrorClass cls) {
    switch (cls) {
        case ErrorClass::Transient:     return "transient";
        case ErrorClass::FatalClient:   return "fatal-client";
        case ErrorClass::FatalProtocol: return "fatal-protocol";
        case ErrorClass::UserAbort:     return "user-abort";
        case ErrorClass::Internal:      return "internal";
    }
    return "internal";
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, std::string(message), loc};
}

Error make_status_error(int status, std::string_view reason,
                        const std::source_location& loc) {
    ErrorCode code = ErrorCode::UnexpectedStatus;
    if (status >= 500) {
        code = ErrorCode::ServerError;
    } else if (status >= 400) {
        code = ErrorCode::ClientError;
    }
    return Error{code, status,
                 fmt::format("request failed with status {} ({})", status, reason),
                 loc};
}

Error log_and_return(Error&& err) {
    auto level = err.is_fatal() ? spdlog::level::err : spdlog::level::warn;
    spdlog::log(level,
        "[{}:{} in {}] {}: {}",
        err.file, err.line, err.function,
        to_string(err.code), err.message
    );
    return std::move(err);
}

} // namespace rfetch::infra

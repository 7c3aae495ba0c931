#pragma once

#include <string_view>

namespace rfetch::core {

enum class StreamState {
    Idle,              // нет активной попытки
    AwaitingResponse,  // запрос отправлен, ждём заголовки
    Streaming,         // тело ответа отдаётся потребителю
    BackingOff,        // ждём задержку перед повтором
    Completed,
    Failed,
    Aborted,
};

[[nodiscard]] constexpr auto is_terminal(StreamState s) -> bool {
    return s == StreamState::Completed ||
           s == StreamState::Failed ||
           s == StreamState::Aborted;
}

[[nodiscard]] constexpr auto to_string(StreamState s) -> std::string_view {
    switch (s) {
        case StreamState::Idle:             return "idle";
        case StreamState::AwaitingResponse: return "awaiting-response";
        case StreamState::Streaming:        return "streaming";
        case StreamState::BackingOff:       return "backing-off";
        case StreamState::Completed:        return "completed";
        case StreamState::Failed:           return "failed";
        case StreamState::Aborted:          return "aborted";
    }
    return "unknown";
}

} // namespace rfetch::core

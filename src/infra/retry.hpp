#pragma once

#include "error_handler/error.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <random>

namespace rfetch::infra {
/*

infra::BackoffGate gate{infra::RetryPolicy{ .max_attempts = 5 }};
auto decision = gate.should_retry(err);
if (decision.retry) {
    timer.expires_after(decision.delay);
    ...
}

*/
struct RetryPolicy {
    int max_attempts = 3;   // сколько повторов разрешено после первой попытки
    std::chrono::milliseconds min_delay = std::chrono::milliseconds(1000);
    std::chrono::milliseconds max_delay = std::chrono::milliseconds(10000);
    double factor = 2.0;    // exponential backoff
    bool randomize = false; // jitter в диапазоне [1, 2)

    [[nodiscard]] auto validate() const -> VoidResult;
};

struct RetryDecision {
    bool retry = false;
    std::chrono::milliseconds delay{0};
};

// Алгоритм задержек. Gate решает "можно ли", стратегия решает "когда".
class BackoffStrategy {
public:
    virtual ~BackoffStrategy() = default;

    // attempt: номер повтора, начиная с 0
    [[nodiscard]] virtual auto delay_for(int attempt) -> std::chrono::milliseconds = 0;
};

class ExponentialBackoff final : public BackoffStrategy {
public:
    explicit ExponentialBackoff(const RetryPolicy& policy);

    [[nodiscard]] auto delay_for(int attempt) -> std::chrono::milliseconds override;

private:
    RetryPolicy policy_;
    std::mt19937 rng_;
};

class BackoffGate {
public:
    explicit BackoffGate(const RetryPolicy& policy = {});
    BackoffGate(const RetryPolicy& policy, std::unique_ptr<BackoffStrategy> strategy);

    // Нетранзиентные ошибки сюда не должны попадать, но если попали - retry = false
    [[nodiscard]] auto should_retry(const Error& failure) -> RetryDecision;

    // Новый цикл соединения: бюджет повторов восстанавливается
    void rearm() { attempts_ = 0; }

    [[nodiscard]] auto attempts() const -> int { return attempts_; }
    [[nodiscard]] auto policy() const -> const RetryPolicy& { return policy_; }

private:
    RetryPolicy policy_;
    std::unique_ptr<BackoffStrategy> strategy_;
    int attempts_ = 0;
};

} // namespace rfetch::infra

#include "retry.hpp"
#include <algorithm>
#include <cmath>
#include <fmt/core.h>

namespace rfetch::infra {

auto RetryPolicy::validate() const -> VoidResult {
    if (max_attempts < 0) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                               fmt::format("retry max_attempts must be >= 0 (got {})", max_attempts)));
    }
    if (min_delay.count() <= 0 || max_delay.count() <= 0) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                               "retry delays must be positive"));
    }
    if (min_delay > max_delay) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                               fmt::format("retry min_delay ({}ms) exceeds max_delay ({}ms)",
                                           min_delay.count(), max_delay.count())));
    }
    if (factor < 1.0) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                               "retry factor must be >= 1"));
    }
    return {};
}

ExponentialBackoff::ExponentialBackoff(const RetryPolicy& policy)
    : policy_(policy)
    , rng_(std::random_device{}())
{}

auto ExponentialBackoff::delay_for(int attempt) -> std::chrono::milliseconds {
    double random = 1.0;
    if (policy_.randomize) {
        std::uniform_real_distribution<double> dist(1.0, 2.0);
        random = dist(rng_);
    }

    // Экспоненциальная задержка, ограниченная сверху max_delay
    const double raw = random * static_cast<double>(policy_.min_delay.count()) *
                       std::pow(policy_.factor, attempt);
    const double capped = std::min(raw, static_cast<double>(policy_.max_delay.count()));
    return std::chrono::milliseconds(static_cast<long long>(std::llround(capped)));
}

BackoffGate::BackoffGate(const RetryPolicy& policy)
    : BackoffGate(policy, std::make_unique<ExponentialBackoff>(policy))
{}

BackoffGate::BackoffGate(const RetryPolicy& policy, std::unique_ptr<BackoffStrategy> strategy)
    : policy_(policy)
    , strategy_(std::move(strategy))
{}

auto BackoffGate::should_retry(const Error& failure) -> RetryDecision {
    if (!failure.is_transient()) {
        return RetryDecision{};
    }
    if (attempts_ >= policy_.max_attempts) {
        return RetryDecision{};
    }

    auto delay = strategy_->delay_for(attempts_);
    ++attempts_;
    return RetryDecision{.retry = true, .delay = delay};
}

} // namespace rfetch::infra

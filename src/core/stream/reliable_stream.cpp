#include "reliable_stream.hpp"
#include <boost/asio/post.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace rfetch::core {

namespace http = adapters::http;

auto ReliableStream::create(boost::asio::io_context& io,
                            StreamOptions options,
                            std::shared_ptr<StreamConsumer> consumer)
    -> infra::Result<std::shared_ptr<ReliableStream>>
{
    if (options.path.empty()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                               "\"path\" must be a non-empty string"));
    }
    if (!options.client) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                               "\"client\" must be an HTTP client"));
    }
    if (options.high_water_mark == 0) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                               "\"high_water_mark\" must be a positive number"));
    }
    if (!consumer) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                               "consumer must not be null"));
    }
    if (options.retry_policy) {
        if (auto valid = options.retry_policy->validate(); !valid) {
            return std::unexpected(std::move(valid.error()));
        }
    }
    if (!options.logger) {
        options.logger = spdlog::default_logger();
    }

    auto tracker = infra::IntegrityTracker::create();
    if (!tracker) {
        return std::unexpected(std::move(tracker.error()));
    }

    // конструктор закрытый, make_shared до него не дотянется
    return std::shared_ptr<ReliableStream>(
        new ReliableStream(io, std::move(options), std::move(consumer), std::move(*tracker)));
}

ReliableStream::ReliableStream(boost::asio::io_context& io,
                               StreamOptions options,
                               std::shared_ptr<StreamConsumer> consumer,
                               infra::IntegrityTracker tracker)
    : io_(io)
    , options_(std::move(options))
    , consumer_(std::move(consumer))
    , log_(options_.logger)
    , tracker_(std::move(tracker))
    , gate_(options_.retry_policy.value_or(infra::RetryPolicy{}))
    , backoff_timer_(io)
{}

ReliableStream::~ReliableStream() {
    teardown_();
}

void ReliableStream::request_more() {
    switch (state_) {
        case StreamState::Aborted:
            log_->warn("ignoring request_more() called after aborted");
            return;
        case StreamState::Failed:
            log_->warn("ignoring request_more() called after error");
            return;
        case StreamState::Completed:
            log_->debug("ignoring request_more() called after end");
            return;
        default:
            break;
    }

    if (pending_demand_) {
        log_->debug("request_more(): already reading");
        return;
    }

    pending_demand_ = true;

    // Всегда асинхронно: потребитель не должен получить on_data() изнутри request_more()
    std::weak_ptr<ReliableStream> weak = weak_from_this();
    boost::asio::post(io_, [weak]() {
        if (auto self = weak.lock()) {
            self->service_demand_();
        }
    });
}

void ReliableStream::service_demand_() {
    if (is_terminal(state_) || !pending_demand_) {
        return;
    }

    switch (state_) {
        case StreamState::Idle:
            start_attempt_();
            break;
        case StreamState::Streaming:
            active_attempt_->pump(options_.high_water_mark);
            break;
        case StreamState::AwaitingResponse:
        case StreamState::BackingOff:
            // Спрос будет обслужен, когда придёт ответ
            break;
        default:
            break;
    }
}

void ReliableStream::start_attempt_() {
    if (active_attempt_) {
        log_->error("refusing to start a second attempt while one is active (offset {})",
                    active_attempt_->range_offset());
        return;
    }

    state_ = StreamState::AwaitingResponse;
    active_attempt_ = std::make_shared<Attempt>(*options_.client,
                                                options_.path,
                                                bytes_consumed_,
                                                std::weak_ptr<AttemptObserver>(shared_from_this()),
                                                log_);
    active_attempt_->start();
}

bool ReliableStream::is_active_(const Attempt& attempt) const {
    return !is_terminal(state_) && active_attempt_.get() == &attempt;
}

void ReliableStream::attempt_response(Attempt& attempt, const http::Response& response) {
    if (!is_active_(attempt)) {
        return;
    }

    const auto& meta = response.meta;

    if (expected_ && expected_->etag && *expected_->etag != meta.etag.value_or("")) {
        fail_(infra::make_error(infra::ErrorCode::IdentityMismatch,
                                "object changed while fetching (etag mismatch)"));
        return;
    }

    if (!expected_) {
        expected_ = ExpectedMeta{
            .length = meta.content_length,
            .etag = meta.etag,
            .md5 = meta.content_md5
        };
        log_->debug("response details (content-length={}, etag={}, md5={})",
                    expected_->length ? fmt::to_string(*expected_->length) : "none",
                    expected_->etag.value_or("none"),
                    expected_->md5.value_or("none"));
    }

    state_ = StreamState::Streaming;

    if (pending_demand_) {
        attempt.pump(options_.high_water_mark);
    }
}

void ReliableStream::attempt_chunk(Attempt& attempt, http::Chunk&& chunk) {
    if (!is_active_(attempt)) {
        return;
    }

    bytes_consumed_ += chunk.size();
    tracker_.update(chunk);
    pending_demand_ = false;

    log_->trace("delivering {} bytes ({} total)", chunk.size(), bytes_consumed_);

    // Потребитель может вызвать abort() изнутри on_data() и этим отпустить consumer_
    auto consumer = consumer_;
    consumer->on_data(chunk);
}

void ReliableStream::attempt_end(Attempt& attempt) {
    if (!is_active_(attempt)) {
        return;
    }

    log_->debug("read \"end\" after {} bytes", bytes_consumed_);
    auto finished = std::move(active_attempt_);
    finished->cancel();

    const auto& length = expected_->length;
    if (length && *length > bytes_consumed_) {
        // Соединение закрыто раньше времени: сразу продолжаем с нового смещения
        log_->debug("bytes read ({}) is less than expected ({}) (initiating retry)",
                    bytes_consumed_, *length);
        ++resumes_;
        gate_.rearm();
        state_ = StreamState::Idle;
        start_attempt_();
        return;
    }

    verify_and_complete_();
}

void ReliableStream::verify_and_complete_() {
    const auto& length = expected_->length;
    if (length && bytes_consumed_ > *length) {
        log_->warn("read {} bytes, more than the declared length {}", bytes_consumed_, *length);
    }

    auto digest = tracker_.finalize();
    if (!digest) {
        fail_(std::move(digest.error()));
        return;
    }

    if (expected_->md5) {
        if (*expected_->md5 != digest->md5_base64) {
            fail_(infra::make_error(infra::ErrorCode::ChecksumMismatch,
                  fmt::format("md5 mismatch: expected \"{}\", got \"{}\"",
                              *expected_->md5, digest->md5_base64)));
            return;
        }
        log_->debug("md5 matched");
    }

    state_ = StreamState::Completed;
    auto consumer = std::move(consumer_);
    teardown_();
    consumer->on_end(Completion{
        .bytes = digest->bytes,
        .md5_base64 = digest->md5_base64,
        .xxh64 = digest->xxh64
    });
}

void ReliableStream::attempt_failed(Attempt& attempt, infra::Error failure) {
    if (!is_active_(attempt)) {
        return;
    }

    auto finished = std::move(active_attempt_);
    finished->cancel();

    if (failure.is_transient()) {
        auto decision = gate_.should_retry(failure);
        if (decision.retry) {
            ++retries_;
            log_->warn("found error, will retry in {}ms (retry {}/{}): {}",
                       decision.delay.count(), gate_.attempts(),
                       gate_.policy().max_attempts, failure.message);
            state_ = StreamState::BackingOff;

            std::weak_ptr<ReliableStream> weak = weak_from_this();
            backoff_timer_.expires_after(decision.delay);
            backoff_timer_.async_wait([weak](const boost::system::error_code& ec) {
                if (ec == boost::asio::error::operation_aborted) {
                    return;
                }
                if (auto self = weak.lock()) {
                    self->backoff_elapsed_();
                }
            });
            return;
        }
    }

    fail_(std::move(failure));
}

void ReliableStream::backoff_elapsed_() {
    if (state_ != StreamState::BackingOff) {
        return;
    }
    state_ = StreamState::Idle;
    start_attempt_();
}

void ReliableStream::fail_(infra::Error err) {
    if (is_terminal(state_)) {
        return;
    }

    state_ = StreamState::Failed;
    pending_demand_ = false;
    log_->error("{} ({}): {}", infra::to_string(err.code),
                infra::to_string(err.classification()), err.message);

    auto consumer = std::move(consumer_);
    teardown_();
    if (consumer) {
        consumer->on_error(err);
    }
}

void ReliableStream::abort() {
    if (state_ == StreamState::Aborted) {
        return;
    }
    if (is_terminal(state_)) {
        log_->debug("abort() after {} ignored", to_string(state_));
        return;
    }

    state_ = StreamState::Aborted;
    pending_demand_ = false;
    log_->info("aborted");

    // Снятие запросов - асинхронно, consumer отпускаем сразу: уведомлений больше не будет
    consumer_.reset();
    boost::asio::post(io_, [self = shared_from_this()]() {
        self->teardown_();
    });
}

void ReliableStream::teardown_() {
    if (torn_down_) {
        return;
    }
    torn_down_ = true;

    backoff_timer_.cancel();
    if (active_attempt_) {
        auto attempt = std::move(active_attempt_);
        attempt->cancel();
    }
}

auto open_stream(boost::asio::io_context& io,
                 StreamOptions options,
                 CallbackConsumer::Handlers handlers)
    -> infra::Result<std::shared_ptr<ReliableStream>>
{
    auto consumer = std::make_shared<CallbackConsumer>(std::move(handlers), true);
    auto stream = ReliableStream::create(io, std::move(options), consumer);
    if (!stream) {
        return stream;
    }
    consumer->attach(*stream);
    return stream;
}

} // namespace rfetch::core

#include "attempt.hpp"
#include <fmt/core.h>

namespace rfetch::core {

namespace http = adapters::http;

Attempt::Attempt(http::HttpClient& client,
                 std::string path,
                 std::uint64_t range_offset,
                 std::weak_ptr<AttemptObserver> observer,
                 std::shared_ptr<spdlog::logger> logger)
    : client_(client)
    , path_(std::move(path))
    , range_offset_(range_offset)
    , observer_(std::move(observer))
    , log_(std::move(logger))
{}

Attempt::~Attempt() {
    cancel();
}

void Attempt::start() {
    http::Request request{.path = path_, .range_start = std::nullopt};

    // Для первого запроса Range не передаём: с Range сервер не отдаёт content-md5
    if (range_offset_ > 0) {
        request.range_start = range_offset_;
    }

    log_->debug("read: initiating request (path={}, range={})", path_,
                request.range_start ? fmt::format("bytes={}-", *request.range_start) : "none");

    std::weak_ptr<Attempt> weak = weak_from_this();
    request_ = client_.get(request, [weak](infra::Result<http::Response> result) {
        if (auto self = weak.lock()) {
            self->on_response_(std::move(result));
        }
    });
}

void Attempt::on_response_(infra::Result<http::Response> result) {
    if (cancelled_) {
        log_->debug("read: dropping response that was pending when attempt was cancelled");
        if (result && result->body) {
            result->body->destroy();
        }
        return;
    }

    auto observer = observer_.lock();
    if (!observer) {
        cancel();
        return;
    }

    if (!result) {
        finished_ = true;
        observer->attempt_failed(*this, std::move(result.error()));
        return;
    }

    auto& response = *result;
    log_->debug("response (statusCode={}, x-server-name={}, x-request-id={})",
                response.status_code,
                response.meta.server_name.value_or("-"),
                response.meta.request_id.value_or("-"));

    if (response.status_code < 200 || response.status_code >= 300) {
        if (response.body) {
            response.body->destroy();
        }
        finished_ = true;
        observer->attempt_failed(*this, infra::make_status_error(response.status_code, response.reason));
        return;
    }

    // Сервер, проигнорировавший Range, прислал бы тело с начала
    if (range_offset_ > 0 && response.status_code != 206) {
        if (response.body) {
            response.body->destroy();
        }
        finished_ = true;
        observer->attempt_failed(*this, infra::make_error(infra::ErrorCode::UnexpectedStatus,
            fmt::format("expected status 206 for range request (bytes={}-), got {}",
                        range_offset_, response.status_code)));
        return;
    }

    if (!response.body) {
        finished_ = true;
        observer->attempt_failed(*this, infra::make_error(infra::ErrorCode::NetworkFailure,
                                                          "response without body stream"));
        return;
    }

    body_ = response.body;

    std::weak_ptr<Attempt> weak = weak_from_this();
    body_->on_end([weak]() {
        if (auto self = weak.lock()) self->on_body_end_();
    });
    body_->on_error([weak](const infra::Error& err) {
        if (auto self = weak.lock()) self->on_body_error_(err);
    });

    observer->attempt_response(*this, response);
}

void Attempt::pump(std::size_t max_bytes) {
    if (cancelled_ || finished_ || !body_ || waiting_readable_) {
        return;
    }

    auto chunk = body_->read(max_bytes);
    if (!chunk) {
        log_->trace("read null; waiting for more data");
        waiting_readable_ = true;
        std::weak_ptr<Attempt> weak = weak_from_this();
        body_->when_readable([weak, max_bytes]() {
            if (auto self = weak.lock()) {
                self->log_->trace("source readable");
                self->waiting_readable_ = false;
                self->pump(max_bytes);
            }
        });
        return;
    }

    log_->trace("read {} bytes from source", chunk->size());
    if (auto observer = observer_.lock()) {
        observer->attempt_chunk(*this, std::move(*chunk));
    }
}

void Attempt::on_body_end_() {
    if (cancelled_ || finished_) {
        return;
    }
    finished_ = true;
    if (auto observer = observer_.lock()) {
        observer->attempt_end(*this);
    }
}

void Attempt::on_body_error_(const infra::Error& err) {
    if (cancelled_ || finished_) {
        return;
    }
    finished_ = true;
    if (body_) {
        body_->destroy();
    }
    if (auto observer = observer_.lock()) {
        // Ошибка тела после заголовков - сетевая, значит транзиентная
        observer->attempt_failed(*this, infra::Error{infra::ErrorCode::NetworkFailure, err.message});
    }
}

void Attempt::cancel() {
    if (cancelled_) {
        return;
    }
    cancelled_ = true;

    if (request_) {
        request_->cancel();
        request_.reset();
    }
    if (body_) {
        body_->destroy();
        body_.reset();
    }
}

} // namespace rfetch::core

#include "beast_client.hpp"

#include <array>
#include <charconv>
#include <deque>
#include <limits>
#include <optional>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core/bind_handler.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace beast = boost::beast;
namespace bhttp = beast::http;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace rfetch::adapters::http {

namespace {

auto to_std(beast::string_view sv) -> std::string {
    return std::string(sv.data(), sv.size());
}

auto field_or_none(const bhttp::fields& fields, beast::string_view name)
    -> std::optional<std::string>
{
    auto it = fields.find(name);
    if (it == fields.end()) {
        return std::nullopt;
    }
    return to_std(it->value());
}

// Закрытие соединения посреди тела: не ошибка тела, короткое чтение
// обнаружит контроллер по content-length.
auto is_premature_close(const beast::error_code& ec) -> bool {
    return ec == bhttp::error::partial_message ||
           ec == bhttp::error::end_of_stream ||
           ec == asio::error::eof ||
           ec == asio::error::connection_reset;
}

// Один запрос и его ответ. Одновременно RequestHandle (до заголовков)
// и ResponseBody (после).
class Exchange final : public RequestHandle,
                       public ResponseBody,
                       public std::enable_shared_from_this<Exchange> {
public:
    Exchange(asio::io_context& io,
             const std::string& host,
             const std::string& port,
             const BeastClientOptions& options,
             ResponseHandler handler)
        : io_(io)
        , resolver_(io)
        , stream_(io)
        , host_(host)
        , port_(port)
        , options_(options)
        , handler_(std::move(handler))
    {}

    void run(const Request& request) {
        req_.version(11);
        req_.method(bhttp::verb::get);
        req_.target(request.path);
        req_.set(bhttp::field::host, host_);
        req_.set(bhttp::field::user_agent, options_.user_agent);
        req_.set(bhttp::field::connection, "close");
        if (request.range_start) {
            req_.set(bhttp::field::range, fmt::format("bytes={}-", *request.range_start));
        }

        resolver_.async_resolve(
            host_, port_,
            beast::bind_front_handler(&Exchange::on_resolve, shared_from_this()));
    }

    // RequestHandle
    void cancel() override { close_(); }

    // ResponseBody
    auto read(std::size_t max_bytes) -> std::optional<Chunk> override {
        if (closed_ || backlog_.empty()) {
            read_more_();
            return std::nullopt;
        }

        Chunk out;
        auto& front = backlog_.front();
        if (front.size() <= max_bytes) {
            out = std::move(front);
            backlog_.pop_front();
        } else {
            out.assign(front.begin(), front.begin() + static_cast<std::ptrdiff_t>(max_bytes));
            front.erase(front.begin(), front.begin() + static_cast<std::ptrdiff_t>(max_bytes));
        }
        backlog_bytes_ -= out.size();

        read_more_();
        maybe_notify_();
        return out;
    }

    void when_readable(std::function<void()> cb) override {
        readable_cb_ = std::move(cb);
        if (!backlog_.empty()) {
            post_(std::exchange(readable_cb_, nullptr));
        }
    }

    void on_end(std::function<void()> cb) override {
        end_cb_ = std::move(cb);
        maybe_notify_();
    }

    void on_error(std::function<void(const infra::Error&)> cb) override {
        error_cb_ = std::move(cb);
        maybe_notify_();
    }

    void destroy() override { close_(); }

private:
    void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) return fail_request_("resolve", ec);

        stream_.expires_after(options_.timeout);
        stream_.async_connect(
            results,
            beast::bind_front_handler(&Exchange::on_connect, shared_from_this()));
    }

    void on_connect(beast::error_code ec, tcp::endpoint /*unused*/) {
        if (ec) return fail_request_("connect", ec);

        stream_.expires_after(options_.timeout);
        bhttp::async_write(
            stream_, req_,
            beast::bind_front_handler(&Exchange::on_write, shared_from_this()));
    }

    void on_write(beast::error_code ec, std::size_t /*bytes*/) {
        if (ec) return fail_request_("write", ec);

        parser_.emplace();
        parser_->body_limit((std::numeric_limits<std::uint64_t>::max)());
        stream_.expires_after(options_.timeout);
        bhttp::async_read_header(
            stream_, buf_, *parser_,
            beast::bind_front_handler(&Exchange::on_header, shared_from_this()));
    }

    void on_header(beast::error_code ec, std::size_t /*bytes*/) {
        if (ec) return fail_request_("read header", ec);
        if (closed_) return;

        const auto& msg = parser_->get();

        Response response;
        response.status_code = static_cast<int>(msg.result_int());
        response.reason = to_std(msg.reason());
        if (auto len = parser_->content_length()) {
            response.meta.content_length = *len;
        }
        response.meta.etag = field_or_none(msg.base(), "etag");
        response.meta.content_md5 = field_or_none(msg.base(), "content-md5");
        response.meta.server_name = field_or_none(msg.base(), "x-server-name");
        response.meta.request_id = field_or_none(msg.base(), "x-request-id");
        response.body = shared_from_this();

        if (parser_->is_done()) {
            eof_ = true;
        } else {
            read_more_();
        }

        post_([handler = std::move(handler_), response = std::move(response)]() mutable {
            handler(std::move(response));
        });
    }

    void read_more_() {
        if (reading_ || eof_ || closed_ || error_ || !parser_) {
            return;
        }
        if (backlog_bytes_ >= options_.max_buffered) {
            return; // backpressure: ждём, пока потребитель заберёт данные
        }

        reading_ = true;
        parser_->get().body().data = read_buf_.data();
        parser_->get().body().size = read_buf_.size();
        stream_.expires_after(options_.timeout);
        bhttp::async_read_some(
            stream_, buf_, *parser_,
            beast::bind_front_handler(&Exchange::on_body, shared_from_this()));
    }

    void on_body(beast::error_code ec, std::size_t /*bytes*/) {
        reading_ = false;
        if (closed_) return;

        if (ec == bhttp::error::need_buffer) {
            ec = {};
        }

        const std::size_t n = read_buf_.size() - parser_->get().body().size;
        if (n > 0) {
            backlog_.emplace_back(read_buf_.begin(), read_buf_.begin() + static_cast<std::ptrdiff_t>(n));
            backlog_bytes_ += n;
            if (readable_cb_) {
                post_(std::exchange(readable_cb_, nullptr));
            }
        }

        if (ec) {
            if (is_premature_close(ec)) {
                spdlog::debug("http: connection closed mid-body ({})", ec.message());
                eof_ = true;
            } else {
                error_ = infra::make_error(infra::ErrorCode::NetworkFailure,
                                           fmt::format("reading response body: {}", ec.message()));
            }
        } else if (parser_->is_done()) {
            eof_ = true;
        }

        maybe_notify_();
        read_more_();
    }

    void maybe_notify_() {
        if (closed_) return;

        if (error_ && error_cb_ && !finish_notified_) {
            finish_notified_ = true;
            auto err = *error_;
            post_([cb = std::move(error_cb_), err = std::move(err)]() { cb(err); });
            return;
        }
        if (eof_ && backlog_.empty() && end_cb_ && !finish_notified_) {
            finish_notified_ = true;
            post_(std::move(end_cb_));
        }
    }

    void fail_request_(std::string_view what, const beast::error_code& ec) {
        if (closed_ || !handler_) return;

        auto err = infra::make_error(infra::ErrorCode::NetworkFailure,
                                     fmt::format("{} {}:{}: {}", what, host_, port_, ec.message()));
        // Не через post_(): соединение закрывается сразу, а ошибку надо доставить
        asio::post(io_, [handler = std::move(handler_), err = std::move(err)]() mutable {
            handler(std::unexpected(std::move(err)));
        });
        close_();
    }

    // Колбэки не вызываются после close_()
    template<typename F>
    void post_(F&& fn) {
        std::weak_ptr<Exchange> weak = weak_from_this();
        asio::post(io_, [weak, fn = std::forward<F>(fn)]() mutable {
            auto self = weak.lock();
            if (!self || self->closed_) {
                return;
            }
            fn();
        });
    }

    void close_() {
        if (closed_) return;
        closed_ = true;

        readable_cb_ = nullptr;
        end_cb_ = nullptr;
        error_cb_ = nullptr;

        resolver_.cancel();
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
        stream_.close();
    }

    asio::io_context& io_;
    tcp::resolver resolver_;
    beast::tcp_stream stream_;
    beast::flat_buffer buf_;
    std::string host_;
    std::string port_;
    BeastClientOptions options_;
    ResponseHandler handler_;

    bhttp::request<bhttp::empty_body> req_;
    std::optional<bhttp::response_parser<bhttp::buffer_body>> parser_;
    std::array<std::uint8_t, 64 * 1024> read_buf_{};

    std::deque<Chunk> backlog_;
    std::size_t backlog_bytes_ = 0;
    std::optional<infra::Error> error_;

    std::function<void()> readable_cb_;
    std::function<void()> end_cb_;
    std::function<void(const infra::Error&)> error_cb_;

    bool reading_ = false;
    bool eof_ = false;
    bool finish_notified_ = false;
    bool closed_ = false;
};

} // namespace

auto parse_http_url(std::string_view url) -> infra::Result<HttpUrl> {
    constexpr std::string_view scheme = "http://";
    if (url.substr(0, 8) == "https://") {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                               fmt::format("https is not supported by this client: {}", url)));
    }
    if (url.substr(0, scheme.size()) != scheme) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                               fmt::format("expected \"http\" protocol: {}", url)));
    }

    auto rest = url.substr(scheme.size());
    auto slash = rest.find('/');
    auto authority = rest.substr(0, slash);
    HttpUrl out;
    out.target = slash == std::string_view::npos ? "/" : std::string(rest.substr(slash));

    if (authority.empty()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                               fmt::format("missing host in URL: {}", url)));
    }

    auto colon = authority.rfind(':');
    if (colon == std::string_view::npos) {
        out.host = std::string(authority);
        out.port = "80";
    } else {
        out.host = std::string(authority.substr(0, colon));
        out.port = std::string(authority.substr(colon + 1));
        unsigned port = 0;
        auto [ptr, ec] = std::from_chars(out.port.data(), out.port.data() + out.port.size(), port);
        if (ec != std::errc{} || ptr != out.port.data() + out.port.size() || port == 0 || port > 65535) {
            return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                                   fmt::format("invalid port in URL: {}", url)));
        }
    }
    return out;
}

BeastHttpClient::BeastHttpClient(asio::io_context& io,
                                 std::string host,
                                 std::string port,
                                 BeastClientOptions options)
    : io_(io)
    , host_(std::move(host))
    , port_(std::move(port))
    , options_(std::move(options))
{}

auto BeastHttpClient::from_url(asio::io_context& io,
                               std::string_view base_url,
                               BeastClientOptions options)
    -> infra::Result<std::shared_ptr<BeastHttpClient>>
{
    auto url = parse_http_url(base_url);
    if (!url) {
        return std::unexpected(std::move(url.error()));
    }
    return std::make_shared<BeastHttpClient>(io, url->host, url->port, std::move(options));
}

auto BeastHttpClient::get(const Request& request, ResponseHandler handler)
    -> std::shared_ptr<RequestHandle>
{
    auto exchange = std::make_shared<Exchange>(io_, host_, port_, options_, std::move(handler));
    exchange->run(request);
    return exchange;
}

} // namespace rfetch::adapters::http

#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <boost/asio/io_context.hpp>
#include "http_client.hpp"

namespace rfetch::adapters::http {

struct HttpUrl {
    std::string host;
    std::string port;    // "80", если не указан
    std::string target;  // путь с query, "/" по умолчанию
};

// Только http://host[:port][/path]; https отдаётся на откуп другому клиенту
[[nodiscard]] auto parse_http_url(std::string_view url) -> infra::Result<HttpUrl>;

struct BeastClientOptions {
    std::chrono::seconds timeout{30};
    std::size_t max_buffered = 1024 * 1024;  // сколько тела держать непрочитанным, прежде чем перестать читать сокет
    std::string user_agent = "rfetch/1.0";
};

// HTTP/1.1 клиент на Boost.Beast: одно соединение на запрос, Connection: close.
class BeastHttpClient final : public HttpClient {
public:
    BeastHttpClient(boost::asio::io_context& io,
                    std::string host,
                    std::string port,
                    BeastClientOptions options = {});

    [[nodiscard]] static auto from_url(boost::asio::io_context& io,
                                       std::string_view base_url,
                                       BeastClientOptions options = {})
        -> infra::Result<std::shared_ptr<BeastHttpClient>>;

    [[nodiscard]] auto get(const Request& request, ResponseHandler handler)
        -> std::shared_ptr<RequestHandle> override;

    [[nodiscard]] auto host() const -> const std::string& { return host_; }
    [[nodiscard]] auto port() const -> const std::string& { return port_; }

private:
    boost::asio::io_context& io_;
    std::string host_;
    std::string port_;
    BeastClientOptions options_;
};

} // namespace rfetch::adapters::http

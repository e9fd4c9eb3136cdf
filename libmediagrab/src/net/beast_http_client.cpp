#include "../../include/beast_http_client.hpp"
#include "../../include/logger.hpp"
#include "../../include/url.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/ssl.h>

#include <functional>
#include <memory>
#include <limits>
#include <optional>

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace mediagrab {

namespace {

constexpr std::uint32_t kHeaderLimit = 64 * 1024;

bool is_redirect(const int status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

/**
 * @brief One request/response exchange, redirects included.
 *
 * All socket operations are asynchronous and driven by a private io_context,
 * which is what makes the tcp_stream timeouts and the stop callback effective
 * for an otherwise blocking API.
 */
class BeastResponseStream final : public IResponseStream {
public:
    BeastResponseStream(std::shared_ptr<ssl::context> tls, HttpRequest request)
        : tls_(std::move(tls)), request_(std::move(request)), resolver_(ioc_) {
        stop_cb_.emplace(request_.stop, std::function<void()>([this] {
            asio::post(ioc_, [this] { abort_io(); });
        }));
    }

    ~BeastResponseStream() override {
        stop_cb_.reset();
        close();
    }

    void start();

    [[nodiscard]] const HttpResponseHead& head() const override { return head_; }

protected:
    std::size_t read_some(std::span<char> buffer) override;

private:
    void connect(const Url& url);
    void send(const Url& url, http::verb verb);
    void read_head();
    void close();
    void abort_io();
    void drive();
    void check(const beast::error_code& ec, std::string_view what, TransportError::Reason reason) const;
    void arm_timer();

    template <typename F>
    void with_stream(F&& f) {
        if (tls_stream_) f(*tls_stream_);
        else f(*plain_stream_);
    }

    std::shared_ptr<ssl::context> tls_; ///< Shared so a response may outlive its client
    HttpRequest request_;
    asio::io_context ioc_;
    tcp::resolver resolver_;
    std::optional<beast::tcp_stream> plain_stream_;
    std::optional<beast::ssl_stream<beast::tcp_stream>> tls_stream_;
    beast::flat_buffer buffer_;
    std::optional<http::response_parser<http::buffer_body>> parser_;
    HttpResponseHead head_;
    bool finished_ = false;
    std::optional<std::stop_callback<std::function<void()>>> stop_cb_;
};

void BeastResponseStream::drive() {
    ioc_.restart();
    ioc_.run();
}

void BeastResponseStream::arm_timer() {
    if (tls_stream_) beast::get_lowest_layer(*tls_stream_).expires_after(request_.timeout);
    else if (plain_stream_) plain_stream_->expires_after(request_.timeout);
}

void BeastResponseStream::abort_io() {
    resolver_.cancel();
    if (tls_stream_) beast::get_lowest_layer(*tls_stream_).cancel();
    if (plain_stream_) plain_stream_->cancel();
}

void BeastResponseStream::check(const beast::error_code& ec,
                                const std::string_view what,
                                const TransportError::Reason reason) const {
    if (request_.stop.stop_requested()) {
        throw TransportError(TransportError::Reason::Cancelled, "request cancelled");
    }
    if (!ec) return;
    if (ec == beast::error::timeout) {
        throw TransportError(TransportError::Reason::Timeout,
                             std::string(what) + " timed out after " +
                             std::to_string(request_.timeout.count()) + " ms");
    }
    throw TransportError(reason, std::string(what) + ": " + ec.message());
}

void BeastResponseStream::close() {
    beast::error_code ignored;
    if (tls_stream_) {
        beast::get_lowest_layer(*tls_stream_).socket().shutdown(tcp::socket::shutdown_both, ignored);
        beast::get_lowest_layer(*tls_stream_).close();
        tls_stream_.reset();
    }
    if (plain_stream_) {
        plain_stream_->socket().shutdown(tcp::socket::shutdown_both, ignored);
        plain_stream_->close();
        plain_stream_.reset();
    }
    buffer_.clear();
}

void BeastResponseStream::connect(const Url& url) {
    check({}, "connect", TransportError::Reason::Connect);

    beast::error_code ec;
    bool timed_out = false;
    tcp::resolver::results_type endpoints;
    asio::steady_timer deadline(ioc_);
    deadline.expires_after(request_.timeout);
    deadline.async_wait([&](const beast::error_code& e) {
        if (!e) {
            timed_out = true;
            resolver_.cancel();
        }
    });
    resolver_.async_resolve(url.host(), std::to_string(url.port()),
        [&](const beast::error_code& e, tcp::resolver::results_type results) {
            ec = e;
            endpoints = std::move(results);
            deadline.cancel();
        });
    drive();
    if (timed_out) ec = beast::error::timeout;
    check(ec, "resolve " + url.host(), TransportError::Reason::Resolve);

    if (url.is_https()) {
        tls_stream_.emplace(ioc_, *tls_);
        if (!SSL_set_tlsext_host_name(tls_stream_->native_handle(), url.host().c_str())) {
            throw TransportError(TransportError::Reason::Tls, "cannot set SNI host name " + url.host());
        }
        tls_stream_->set_verify_callback(ssl::host_name_verification(url.host()));
    } else {
        plain_stream_.emplace(ioc_);
    }

    arm_timer();
    with_stream([&](auto& stream) {
        beast::get_lowest_layer(stream).async_connect(endpoints,
            [&](const beast::error_code& e, const tcp::endpoint&) { ec = e; });
    });
    drive();
    check(ec, "connect to " + url.host(), TransportError::Reason::Connect);

    if (tls_stream_) {
        arm_timer();
        tls_stream_->async_handshake(ssl::stream_base::client,
            [&](const beast::error_code& e) { ec = e; });
        drive();
        check(ec, "TLS handshake with " + url.host(), TransportError::Reason::Tls);
    }
}

void BeastResponseStream::send(const Url& url, const http::verb verb) {
    http::request<http::empty_body> req{verb, url.target(), 11};
    req.set(http::field::host, url.host_header());
    req.set(http::field::accept, "*/*");
    req.set(http::field::accept_encoding, "identity");
    req.set(http::field::connection, "close");
    for (const auto& [name, value] : request_.headers) {
        req.set(name, value);
    }

    beast::error_code ec;
    arm_timer();
    with_stream([&](auto& stream) {
        http::async_write(stream, req, [&](const beast::error_code& e, std::size_t) { ec = e; });
    });
    drive();
    check(ec, "send request", TransportError::Reason::Io);
}

void BeastResponseStream::read_head() {
    parser_.emplace();
    parser_->header_limit(kHeaderLimit);
    parser_->body_limit((std::numeric_limits<std::uint64_t>::max)());
    if (request_.method == "HEAD") parser_->skip(true);

    beast::error_code ec;
    arm_timer();
    with_stream([&](auto& stream) {
        http::async_read_header(stream, buffer_, *parser_,
            [&](const beast::error_code& e, std::size_t) { ec = e; });
    });
    drive();
    check(ec, "read response header", TransportError::Reason::Protocol);
}

void BeastResponseStream::start() {
    auto url = Url::parse(request_.url);
    if (!url) {
        throw TransportError(TransportError::Reason::Protocol, "not an absolute http(s) URL: " + request_.url);
    }
    const http::verb verb = http::string_to_verb(request_.method);
    if (verb == http::verb::unknown) {
        throw TransportError(TransportError::Reason::Protocol, "unsupported method " + request_.method);
    }

    for (int hop = 0;; ++hop) {
        connect(*url);
        send(*url, verb);
        read_head();

        const auto& res = parser_->get();
        const int status = static_cast<int>(res.result_int());
        const auto location = res.find(http::field::location);
        if (is_redirect(status) && location != res.end() && !location->value().empty()) {
            if (hop >= request_.max_redirects) {
                throw TransportError(TransportError::Reason::Protocol,
                                     "too many redirects (" + std::to_string(request_.max_redirects) + ")");
            }
            auto next = url->resolve(std::string_view(location->value().data(), location->value().size()));
            if (!next) {
                throw TransportError(TransportError::Reason::Protocol,
                                     "invalid redirect target " + std::string(location->value()));
            }
            Logger::log(LogLevel::Debug,
                        std::to_string(status) + " redirect to " + Logger::clip(next->to_string()),
                        "http");
            close();
            url = std::move(next);
            continue;
        }

        head_.status = status;
        head_.final_url = url->to_string();
        for (const auto& field : res) {
            head_.headers.emplace_back(std::string(field.name_string()), std::string(field.value()));
        }
        if (const auto length = parser_->content_length()) {
            head_.content_length = *length;
        }
        finished_ = request_.method == "HEAD" || parser_->is_done();
        return;
    }
}

std::size_t BeastResponseStream::read_some(const std::span<char> buffer) {
    if (finished_ || !parser_) return 0;

    for (;;) {
        auto& body = parser_->get().body();
        body.data = buffer.data();
        body.size = buffer.size();

        beast::error_code ec;
        arm_timer();
        with_stream([&](auto& stream) {
            http::async_read(stream, buffer_, *parser_,
                [&](const beast::error_code& e, std::size_t) { ec = e; });
        });
        drive();
        if (ec == http::error::need_buffer) ec = {};
        check(ec, "read response body", TransportError::Reason::Io);

        const std::size_t got = buffer.size() - body.size;
        if (parser_->is_done()) {
            finished_ = true;
            close();
        }
        if (got > 0 || finished_) return got;
    }
}

} // namespace

struct BeastHttpClient::Impl {
    std::shared_ptr<ssl::context> tls = std::make_shared<ssl::context>(ssl::context::tls_client);
};

BeastHttpClient::BeastHttpClient() : impl_(std::make_unique<Impl>()) {
    impl_->tls->set_default_verify_paths();
    impl_->tls->set_verify_mode(ssl::verify_peer);
}

BeastHttpClient::~BeastHttpClient() = default;

std::unique_ptr<IResponseStream> BeastHttpClient::open(const HttpRequest& request) {
    Logger::log(LogLevel::Debug, request.method + " " + Logger::clip(request.url), "http");
    auto stream = std::make_unique<BeastResponseStream>(impl_->tls, request);
    stream->start();
    Logger::log(LogLevel::Debug,
                "HTTP " + std::to_string(stream->head().status) + " from " + Logger::clip(stream->head().final_url),
                "http");
    return stream;
}

} // namespace mediagrab

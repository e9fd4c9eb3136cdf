/**
 * @file http_client.hpp
 * @brief Blocking HTTP client interface used by every network-backed provider.
 */

#ifndef MEDIAGRAB_HTTP_CLIENT_HPP
#define MEDIAGRAB_HTTP_CLIENT_HPP

#include "payload.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mediagrab {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief One outgoing request. Redirects are followed by the client.
 */
struct HttpRequest {
    std::string method = "GET";
    std::string url;
    HeaderList headers;
    std::chrono::milliseconds timeout{30000}; ///< Applies to every single network operation
    int max_redirects = 10;
    std::stop_token stop;
};

/**
 * @brief Status line and headers of the final (post-redirect) response.
 */
struct HttpResponseHead {
    int status = 0;
    std::string final_url;
    HeaderList headers;
    std::optional<std::uint64_t> content_length;

    /// @return First value of header @p name (case-insensitive).
    [[nodiscard]] std::optional<std::string> header(std::string_view name) const;

    [[nodiscard]] bool ok() const noexcept { return status >= 200 && status < 300; }
};

/**
 * @brief Failure below the HTTP semantics: DNS, connect, TLS, timeout, I/O.
 *
 * Providers translate it into a FetchError with their own ProviderId.
 */
class TransportError : public std::runtime_error {
public:
    enum class Reason { Resolve, Connect, Tls, Timeout, Cancelled, Protocol, Io };

    TransportError(const Reason reason, const std::string& message)
        : std::runtime_error(message), reason_(reason) {}

    [[nodiscard]] Reason reason() const noexcept { return reason_; }

private:
    Reason reason_;
};

/**
 * @brief An open response whose body has not been read yet.
 *
 * Body reads go through the PayloadSource interface and throw
 * TransportError on failures.
 */
class IResponseStream : public PayloadSource {
public:
    [[nodiscard]] virtual const HttpResponseHead& head() const = 0;
};

/**
 * @brief Abstract HTTP client.
 */
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    /**
     * @brief Send a request, follow redirects and return once the final
     * response headers are available.
     * @throws TransportError when no response could be obtained.
     */
    virtual std::unique_ptr<IResponseStream> open(const HttpRequest& request) = 0;
};

/**
 * @brief Drains a (small, textual) response body into a string.
 * @throws TransportError when the body exceeds @p max_bytes.
 */
std::string read_text(IResponseStream& response, std::size_t max_bytes = 8 * 1024 * 1024);

} // namespace mediagrab

#endif // MEDIAGRAB_HTTP_CLIENT_HPP

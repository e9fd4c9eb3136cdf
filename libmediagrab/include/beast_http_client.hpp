/**
 * @file beast_http_client.hpp
 * @brief IHttpClient implementation on Boost.Beast with OpenSSL for TLS.
 */

#ifndef MEDIAGRAB_BEAST_HTTP_CLIENT_HPP
#define MEDIAGRAB_BEAST_HTTP_CLIENT_HPP

#include "http_client.hpp"
#include <memory>

namespace mediagrab {

/**
 * @brief HTTP/1.1 client with certificate and host name verification.
 *
 * Each open() uses its own connection and io_context, so one client can be
 * shared by several providers. Every network operation is bounded by
 * HttpRequest::timeout and aborted as soon as HttpRequest::stop is requested.
 * Content encodings are refused ("Accept-Encoding: identity") so bodies can
 * be streamed as they arrive.
 */
class BeastHttpClient final : public IHttpClient {
public:
    BeastHttpClient();
    ~BeastHttpClient() override;

    BeastHttpClient(const BeastHttpClient&) = delete;
    BeastHttpClient& operator=(const BeastHttpClient&) = delete;

    std::unique_ptr<IResponseStream> open(const HttpRequest& request) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mediagrab

#endif // MEDIAGRAB_BEAST_HTTP_CLIENT_HPP

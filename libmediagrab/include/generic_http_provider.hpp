/**
 * @file generic_http_provider.hpp
 * @brief Direct download of whatever the URL serves.
 */

#ifndef MEDIAGRAB_GENERIC_HTTP_PROVIDER_HPP
#define MEDIAGRAB_GENERIC_HTTP_PROVIDER_HPP

#include "provider.hpp"
#include "url.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mediagrab {

/**
 * @brief Extracts the filename of a Content-Disposition header.
 *
 * Accepts `filename*=UTF-8''...` and `filename=...` (quoted or not), and
 * percent-decodes the value. Names without a dot, or ending in one, are
 * rejected.
 */
[[nodiscard]] std::optional<std::string> filename_from_content_disposition(std::string_view header);

/**
 * @brief Percent-decoded last path segment of @p url, if it contains a dot.
 */
[[nodiscard]] std::optional<std::string> filename_from_url_path(const Url& url);

/**
 * @brief GETs the URL, following redirects, and streams the body.
 *
 * Also the terminal fallback for every other provider, and the second half
 * of providers that first have to find the real media URL.
 */
class GenericHttpProvider final : public IProvider {
public:
    explicit GenericHttpProvider(std::shared_ptr<IHttpClient> http) : http_(std::move(http)) {}

    [[nodiscard]] ProviderId id() const noexcept override { return ProviderId::GenericHttp; }
    [[nodiscard]] std::string_view get_name() const noexcept override { return "Generic HTTP"; }

    [[nodiscard]] bool handles_domain(std::string_view) const noexcept override { return true; }
    [[nodiscard]] bool requires_credential() const noexcept override { return false; }
    [[nodiscard]] bool supports_streaming_probe() const noexcept override { return true; }

    RetrievedPayload fetch(const MediaRequest& request, const FetchContext& context) override;

    /// HEAD request: Content-Length and filename.
    std::optional<ProbeResult> probe(const MediaRequest& request, const FetchContext& context) override;

    /**
     * @brief Turns an already open response into a payload.
     *
     * @param response Open response, headers read, body untouched.
     * @param owner Provider reported in the payload and in errors.
     * @param source_url URL the caller asked for, used for the filename fallback.
     * @throws FetchError(NetworkError) on a non-2xx status,
     *         FetchError(PayloadTooLarge) when Content-Length exceeds the limit.
     */
    static RetrievedPayload take_over(std::unique_ptr<IResponseStream> response,
                                      ProviderId owner,
                                      const Url& source_url,
                                      const FetchContext& context);

private:
    std::shared_ptr<IHttpClient> http_;
};

} // namespace mediagrab

#endif // MEDIAGRAB_GENERIC_HTTP_PROVIDER_HPP

/**
 * @file short_video_provider.hpp
 * @brief TikTok-style links resolved through a third-party JSON API (tikwm).
 */

#ifndef MEDIAGRAB_SHORT_VIDEO_PROVIDER_HPP
#define MEDIAGRAB_SHORT_VIDEO_PROVIDER_HPP

#include "provider.hpp"
#include <memory>
#include <string>

namespace mediagrab {

///< Default API endpoint; the link is appended as the "url" query parameter.
inline constexpr std::string_view kDefaultShortVideoApi = "https://www.tikwm.com/api/";

/**
 * @brief What the API returned for a video.
 */
struct ShortVideoInfo {
    std::string play_url;
    std::string title = "tiktok_video";
    std::string author = "user";
};

/**
 * @brief Parses the API envelope `{code, msg, data: {play, title, author: {unique_id}}}`.
 *
 * @throws FetchError(ParsingError, recoverable) for non-JSON or malformed bodies,
 *         FetchError(ProviderRejected) when code != 0 or data.play is missing.
 */
[[nodiscard]] ShortVideoInfo parse_short_video_response(std::string_view body);

class ShortVideoProvider final : public IProvider {
public:
    ShortVideoProvider(std::shared_ptr<IHttpClient> http, std::string api_endpoint)
        : http_(std::move(http)), api_endpoint_(std::move(api_endpoint)) {}

    [[nodiscard]] ProviderId id() const noexcept override { return ProviderId::ShortVideoApi; }
    [[nodiscard]] std::string_view get_name() const noexcept override { return "Short-Video API"; }

    [[nodiscard]] bool handles_domain(std::string_view host) const noexcept override;
    [[nodiscard]] bool requires_credential() const noexcept override { return false; }
    [[nodiscard]] bool supports_streaming_probe() const noexcept override { return false; }

    RetrievedPayload fetch(const MediaRequest& request, const FetchContext& context) override;

private:
    std::shared_ptr<IHttpClient> http_;
    std::string api_endpoint_;
};

} // namespace mediagrab

#endif // MEDIAGRAB_SHORT_VIDEO_PROVIDER_HPP

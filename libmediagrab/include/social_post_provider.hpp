/**
 * @file social_post_provider.hpp
 * @brief Instagram posts, reels and IGTV entries.
 */

#ifndef MEDIAGRAB_SOCIAL_POST_PROVIDER_HPP
#define MEDIAGRAB_SOCIAL_POST_PROVIDER_HPP

#include "post_metadata_source.hpp"
#include "provider.hpp"
#include "url.hpp"
#include <memory>
#include <optional>
#include <string>

namespace mediagrab {

/**
 * @brief Shortcode of a post URL ("/p/<code>", "/reel/<code>", "/tv/<code>").
 */
[[nodiscard]] std::optional<std::string> post_shortcode(const Url& url);

/**
 * @brief Media URL to download for a post, following the video/photo preference order.
 */
[[nodiscard]] std::optional<std::string> select_post_media(const PostMetadata& post);

/**
 * @brief "owner_shortcode_YYYYMMDD.ext", the date taken from the post (UTC).
 */
[[nodiscard]] std::string post_filename(const PostMetadata& post);

class SocialPostProvider final : public IProvider {
public:
    SocialPostProvider(std::shared_ptr<IHttpClient> http, std::unique_ptr<IPostMetadataSource> source)
        : http_(std::move(http)), source_(std::move(source)) {}

    [[nodiscard]] ProviderId id() const noexcept override { return ProviderId::SocialPost; }
    [[nodiscard]] std::string_view get_name() const noexcept override { return "Social Post Extractor"; }

    [[nodiscard]] bool handles_domain(std::string_view host) const noexcept override;
    [[nodiscard]] bool requires_credential() const noexcept override { return true; }
    [[nodiscard]] bool supports_streaming_probe() const noexcept override { return false; }
    [[nodiscard]] int transient_retries() const noexcept override { return 1; }

    RetrievedPayload fetch(const MediaRequest& request, const FetchContext& context) override;

private:
    std::shared_ptr<IHttpClient> http_;
    std::unique_ptr<IPostMetadataSource> source_;
};

} // namespace mediagrab

#endif // MEDIAGRAB_SOCIAL_POST_PROVIDER_HPP

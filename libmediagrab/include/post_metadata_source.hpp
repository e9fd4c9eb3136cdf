/**
 * @file post_metadata_source.hpp
 * @brief Where the Social Post provider learns what a post contains.
 */

#ifndef MEDIAGRAB_POST_METADATA_SOURCE_HPP
#define MEDIAGRAB_POST_METADATA_SOURCE_HPP

#include "provider.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mediagrab {

/**
 * @brief Media description of one post.
 */
struct PostMetadata {
    std::string shortcode;
    std::string owner = "instagram";
    bool is_video = false;
    std::optional<std::string> video_url;
    std::optional<std::string> image_url;
    std::optional<std::string> display_url;
    std::optional<std::int64_t> taken_at; ///< Unix time (UTC)
};

/**
 * @brief Resolves a shortcode into post metadata.
 */
class IPostMetadataSource {
public:
    virtual ~IPostMetadataSource() = default;

    /**
     * @throws FetchError: LoginRequired for private posts or login walls,
     *         NotFound, ProviderUnavailable (429/5xx), NetworkError, ParsingError.
     */
    virtual PostMetadata lookup(const std::string& shortcode, const FetchContext& context) = 0;
};

/**
 * @brief Maps an HTTP status of the metadata endpoint to an error kind.
 * @return std::nullopt for 2xx.
 */
[[nodiscard]] std::optional<ErrorKind> classify_instagram_status(int status) noexcept;

/**
 * @brief Parses the web JSON of a post.
 *
 * Understands both the `items[0]` shape and the older
 * `graphql.shortcode_media` shape; carousels yield their first item.
 * @throws FetchError(LoginRequired) when the document asks for a login,
 *         FetchError(ParsingError) when the body is not a usable JSON document.
 */
[[nodiscard]] PostMetadata parse_instagram_post(std::string_view body, const std::string& shortcode);

/**
 * @brief IPostMetadataSource backed by Instagram's web JSON endpoint.
 *
 * The cookie jar, when configured, is sent along so posts visible to the
 * logged-in account can be resolved.
 */
class InstagramWebSource final : public IPostMetadataSource {
public:
    explicit InstagramWebSource(std::shared_ptr<IHttpClient> http) : http_(std::move(http)) {}

    PostMetadata lookup(const std::string& shortcode, const FetchContext& context) override;

private:
    std::shared_ptr<IHttpClient> http_;
};

} // namespace mediagrab

#endif // MEDIAGRAB_POST_METADATA_SOURCE_HPP

/**
 * @file url_classifier.hpp
 * @brief Maps a raw URL to the ordered list of providers that may serve it.
 */

#ifndef MEDIAGRAB_URL_CLASSIFIER_HPP
#define MEDIAGRAB_URL_CLASSIFIER_HPP

#include "media_types.hpp"
#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace mediagrab {

///< Sites handed to the video extractor; matched as the host or one of its parents.
inline constexpr std::array<std::string_view, 28> kExtractorDomains = {
    "youtube.com", "youtu.be", "youtube-nocookie.com",
    "facebook.com", "fb.watch",
    "twitter.com", "x.com",
    "vimeo.com", "dailymotion.com", "dai.ly",
    "soundcloud.com", "twitch.tv", "bandcamp.com",
    "bilibili.com", "b23.tv",
    "reddit.com", "redd.it",
    "streamable.com", "rumble.com", "mixcloud.com",
    "vk.com", "ok.ru", "odysee.com", "nicovideo.jp",
    "ted.com", "kick.com", "threads.net", "bsky.app",
};

constexpr int kPrimaryPriority = 100;
constexpr int kFallbackPriority = 0;

/**
 * @brief True if @p host (normalized) belongs to an extractor site.
 *
 * Also accepts country variants of YouTube ("youtube.de").
 */
[[nodiscard]] bool is_extractor_domain(std::string_view host) noexcept;

/**
 * @brief Ordered candidates for @p raw_url, highest priority first.
 *
 * Rules, first match wins:
 *  1. drive.google.com          -> GoogleDrive only
 *  2. instagram.com             -> SocialPost only
 *  3. tiktok.com                -> ShortVideoApi, then GenericHttp
 *  4. an extractor domain       -> VideoExtractor, then GenericHttp
 *  5. anything else             -> GenericHttp
 *
 * @throws FetchError(InvalidURL) unless @p raw_url is an absolute http(s) URL with a host.
 */
[[nodiscard]] std::vector<ProviderCandidate> classify(const std::string& raw_url);

} // namespace mediagrab

#endif // MEDIAGRAB_URL_CLASSIFIER_HPP

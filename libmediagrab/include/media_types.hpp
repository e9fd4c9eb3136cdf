/**
 * @file media_types.hpp
 * @brief Small value types exchanged between the classifier, the providers
 * and the orchestrator.
 */

#ifndef MEDIAGRAB_MEDIA_TYPES_HPP
#define MEDIAGRAB_MEDIA_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace mediagrab {

/**
 * @brief Identifies one retrieval strategy.
 */
enum class ProviderId {
    GenericHttp,    ///< Direct GET of the URL
    GoogleDrive,    ///< Drive share link rewritten to a direct export
    ShortVideoApi,  ///< TikTok-style links resolved through a JSON API
    SocialPost,     ///< Instagram-style posts resolved through post metadata
    VideoExtractor  ///< yt-dlp for the long tail of video/audio sites
};

/// @return Stable, human-readable provider name (e.g. "GoogleDrive").
[[nodiscard]] std::string_view to_string(ProviderId id) noexcept;

/**
 * @brief One user request: the raw URL, immutable once built.
 */
class MediaRequest {
public:
    explicit MediaRequest(std::string raw_url) : raw_url_(std::move(raw_url)) {}

    [[nodiscard]] const std::string& raw_url() const noexcept { return raw_url_; }

private:
    std::string raw_url_;
};

/**
 * @brief A provider selected by the classifier, with its priority.
 *
 * Higher priority is tried first.
 */
struct ProviderCandidate {
    ProviderId provider;
    int priority = 0;

    bool operator==(const ProviderCandidate&) const = default;
};

/**
 * @brief Result of a pre-flight probe, used only for display.
 */
struct ProbeResult {
    std::optional<std::uint64_t> size_bytes;   ///< Estimated transfer size, if known
    std::optional<std::string> suggested_name; ///< Sanitized filename hint, if known
    std::optional<ProviderId> provider;        ///< Provider that answered the probe
};

} // namespace mediagrab

#endif // MEDIAGRAB_MEDIA_TYPES_HPP

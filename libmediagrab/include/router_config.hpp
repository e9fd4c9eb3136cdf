/**
 * @file router_config.hpp
 * @brief Settings of a routing pass, shared by the orchestrator and the providers.
 */

#ifndef MEDIAGRAB_ROUTER_CONFIG_HPP
#define MEDIAGRAB_ROUTER_CONFIG_HPP

#include "cookie_jar.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace mediagrab {

///< Default limit for a single artifact (2 GiB).
inline constexpr std::uint64_t kDefaultMaxPayloadBytes = 2ULL * 1024 * 1024 * 1024;

///< Browser-like agent; several hosts refuse obvious bots.
inline constexpr const char* kDefaultUserAgent =
    "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/124.0 Safari/537.36";

struct RouterConfig {
    std::chrono::milliseconds network_timeout{std::chrono::seconds(30)};   ///< Per network operation
    std::chrono::milliseconds extractor_timeout{std::chrono::minutes(30)}; ///< Whole yt-dlp run
    std::chrono::milliseconds retry_backoff{std::chrono::milliseconds(1500)};
    std::uint64_t max_payload_bytes = kDefaultMaxPayloadBytes;           ///< 0 disables the limit
    std::string yt_dlp_path = "yt-dlp";
    std::string short_video_api = "https://www.tikwm.com/api/";
    std::string user_agent = kDefaultUserAgent;
    std::shared_ptr<const CookieJar> cookies;                            ///< Optional credential blob
};

} // namespace mediagrab

#endif // MEDIAGRAB_ROUTER_CONFIG_HPP

#include "../../include/url_classifier.hpp"
#include "../../include/error_report.hpp"
#include "../../include/logger.hpp"
#include "../../include/url.hpp"
#include <algorithm>

namespace mediagrab {

bool is_extractor_domain(const std::string_view host) noexcept {
    if (host.starts_with("youtube.")) return true;
    return std::ranges::any_of(kExtractorDomains, [host](const std::string_view domain) {
        return host == domain ||
               (host.size() > domain.size() && host.ends_with(domain) &&
                host[host.size() - domain.size() - 1] == '.');
    });
}

std::vector<ProviderCandidate> classify(const std::string& raw_url) {
    const auto url = Url::parse(raw_url);
    if (!url) {
        throw FetchError(ErrorKind::InvalidURL, std::nullopt,
                         "not a valid http(s) link: " + raw_url);
    }
    const std::string host = url->bare_host();

    std::vector<ProviderCandidate> candidates;
    if (host.find("drive.google.com") != std::string::npos) {
        candidates.push_back({ProviderId::GoogleDrive, kPrimaryPriority});
    } else if (host.find("instagram.com") != std::string::npos) {
        candidates.push_back({ProviderId::SocialPost, kPrimaryPriority});
    } else if (host.find("tiktok.com") != std::string::npos) {
        candidates.push_back({ProviderId::ShortVideoApi, kPrimaryPriority});
        candidates.push_back({ProviderId::GenericHttp, kFallbackPriority});
    } else if (is_extractor_domain(host)) {
        candidates.push_back({ProviderId::VideoExtractor, kPrimaryPriority});
        candidates.push_back({ProviderId::GenericHttp, kFallbackPriority});
    } else {
        candidates.push_back({ProviderId::GenericHttp, kFallbackPriority});
    }

    Logger::log(LogLevel::Debug, host + " -> " + std::string(to_string(candidates.front().provider)) +
                (candidates.size() > 1 ? " (+" + std::to_string(candidates.size() - 1) + " fallback)" : std::string()),
                "classifier");
    return candidates;
}

} // namespace mediagrab

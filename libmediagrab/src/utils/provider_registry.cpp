#include "../../include/provider_registry.hpp"
#include "../../include/generic_http_provider.hpp"
#include "../../include/google_drive_provider.hpp"
#include "../../include/post_metadata_source.hpp"
#include "../../include/short_video_provider.hpp"
#include "../../include/social_post_provider.hpp"
#include "../../include/video_extractor_provider.hpp"
#include <algorithm>

namespace mediagrab {

ProviderRegistry ProviderRegistry::with_defaults(const std::shared_ptr<IHttpClient>& http,
                                                 const std::shared_ptr<IProcessRunner>& runner,
                                                 const RouterConfig& config) {
    ProviderRegistry registry;
    registry.add(std::make_unique<GoogleDriveProvider>(http));
    registry.add(std::make_unique<SocialPostProvider>(http, std::make_unique<InstagramWebSource>(http)));
    registry.add(std::make_unique<ShortVideoProvider>(http, config.short_video_api));
    registry.add(std::make_unique<VideoExtractorProvider>(runner, config.yt_dlp_path));
    registry.add(std::make_unique<GenericHttpProvider>(http));
    return registry;
}

void ProviderRegistry::add(std::unique_ptr<IProvider> provider) {
    if (!provider) {
        return;
    }
    const auto existing = std::ranges::find_if(providers_, [&](const auto& p) { return p->id() == provider->id(); });
    if (existing != providers_.end()) {
        *existing = std::move(provider);
    } else {
        providers_.push_back(std::move(provider));
    }
}

IProvider* ProviderRegistry::find(const ProviderId id) const {
    const auto it = std::ranges::find_if(providers_, [id](const auto& p) { return p->id() == id; });
    return it == providers_.end() ? nullptr : it->get();
}

std::vector<IProvider*> ProviderRegistry::find_by_domain(const std::string_view host) const {
    std::vector<IProvider*> result;
    for (const auto& provider : providers_) {
        if (provider->handles_domain(host)) {
            result.push_back(provider.get());
        }
    }
    return result;
}

} // namespace mediagrab

/**
 * @file provider_registry.hpp
 * @brief Defines the registry owning the IProvider instances.
 */

#ifndef MEDIAGRAB_PROVIDER_REGISTRY_HPP
#define MEDIAGRAB_PROVIDER_REGISTRY_HPP

#include "http_client.hpp"
#include "process_runner.hpp"
#include "provider.hpp"
#include "router_config.hpp"
#include <memory>
#include <string_view>
#include <vector>

namespace mediagrab {

/**
 * @brief Registry of the available providers.
 *
 * @details The ProviderRegistry owns and manages the lifetime of the
 * concrete IProvider implementations and resolves the ProviderId values
 * produced by the classifier. It is instantiated once per MediaGrabber and
 * passed to a FallbackOrchestrator.
 */
class ProviderRegistry {
public:
    ProviderRegistry() = default;

    /**
     * @brief Construct and register the five built-in providers.
     * @param http Client shared by the network-backed providers.
     * @param runner Runner used by the video extractor.
     * @param config Supplies the yt-dlp path and the short-video API endpoint.
     */
    static ProviderRegistry with_defaults(const std::shared_ptr<IHttpClient>& http,
                                          const std::shared_ptr<IProcessRunner>& runner,
                                          const RouterConfig& config);

    /**
     * @brief Register a provider, replacing any previous one with the same id.
     * A null pointer is ignored.
     */
    void add(std::unique_ptr<IProvider> provider);

    /// @return Non-owning pointer to the provider with @p id, or nullptr.
    [[nodiscard]] IProvider* find(ProviderId id) const;

    /// @return Providers whose handles_domain() accepts @p host.
    [[nodiscard]] std::vector<IProvider*> find_by_domain(std::string_view host) const;

    /**
     * @brief Access all registered providers.
     */
    [[nodiscard]] const std::vector<std::unique_ptr<IProvider>>& all() const { return providers_; }

private:
    ///< Owned instances of all registered providers.
    std::vector<std::unique_ptr<IProvider>> providers_;
};

} // namespace mediagrab

#endif // MEDIAGRAB_PROVIDER_REGISTRY_HPP

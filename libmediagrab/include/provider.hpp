/**
 * @file provider.hpp
 * @brief Interface implemented by every retrieval strategy.
 */

#ifndef MEDIAGRAB_PROVIDER_HPP
#define MEDIAGRAB_PROVIDER_HPP

#include "cookie_jar.hpp"
#include "error_report.hpp"
#include "http_client.hpp"
#include "media_types.hpp"
#include "payload.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

/**
 * @namespace mediagrab
 * @brief The main namespace for the mediagrab library.
 *
 * @details This namespace encapsulates all core functionality of mediagrab:
 * the URL classifier, the abstract IProvider interface with its concrete
 * retrieval strategies, the FallbackOrchestrator, result normalization and
 * the transport helpers the providers are built on.
 */
namespace mediagrab {

/**
 * @brief Per-call settings handed to a provider.
 *
 * Built by the orchestrator from its configuration; providers never look up
 * credentials or limits by themselves.
 */
struct FetchContext {
    std::stop_token stop;
    const CookieJar* credential = nullptr;                     ///< May be null
    std::chrono::milliseconds network_timeout{std::chrono::seconds(30)};
    std::chrono::milliseconds extractor_timeout{std::chrono::minutes(30)};
    std::uint64_t max_payload_bytes = 0;                       ///< 0 means unlimited
    std::string user_agent;
};

/**
 * @brief Interface for a retrieval strategy.
 *
 * Each implementation knows how to turn one class of URLs into a
 * RetrievedPayload. Providers are stateless regarding the request being
 * served: all per-request state lives inside fetch(). The ProviderRegistry
 * owns provider instances.
 */
class IProvider {
public:
    virtual ~IProvider() = default;

    // --- self-description ---

    /// @return The identifier reported in payloads and errors.
    [[nodiscard]] virtual ProviderId id() const noexcept = 0;

    /// @return Human-readable name of the provider (e.g. "Google Drive").
    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    // --- capabilities ---

    /// @return True if the provider is specialized for @p host (normalized, without "www.").
    [[nodiscard]] virtual bool handles_domain(std::string_view host) const noexcept = 0;

    /// @return True if the provider makes use of the credential blob.
    [[nodiscard]] virtual bool requires_credential() const noexcept = 0;

    /// @return True if probe() can estimate size and name without a full transfer.
    [[nodiscard]] virtual bool supports_streaming_probe() const noexcept = 0;

    /// @return How often the orchestrator may re-run this provider after ProviderUnavailable.
    [[nodiscard]] virtual int transient_retries() const noexcept { return 0; }

    // --- operations ---

    /**
     * @brief Retrieve the media the request points at.
     * @throws FetchError with the most specific ErrorKind available.
     */
    virtual RetrievedPayload fetch(const MediaRequest& request, const FetchContext& context) = 0;

    /**
     * @brief Estimate size and filename without downloading.
     * @return std::nullopt when nothing could be learned; never throws for
     * upstream failures.
     */
    virtual std::optional<ProbeResult> probe(const MediaRequest& request, const FetchContext& context) {
        (void)request;
        (void)context;
        return std::nullopt;
    }
};

// --- helpers shared by the HTTP based providers ---

/**
 * @brief Builds a request carrying the context's timeout, stop token and user agent.
 */
HttpRequest make_http_request(std::string url, const FetchContext& context, std::string method = "GET");

/**
 * @brief Translates a transport failure into the provider's FetchError.
 *
 * Cancellation becomes ErrorKind::Cancelled, everything else NetworkError.
 */
FetchError transport_failure(const TransportError& error, ProviderId provider, std::string_view what);

/**
 * @brief Throws PayloadTooLarge when an announced size exceeds the configured maximum.
 */
void enforce_size_limit(std::optional<std::uint64_t> announced, const FetchContext& context, ProviderId provider);

/**
 * @brief Throws Cancelled if a stop was requested.
 */
void throw_if_cancelled(const FetchContext& context, ProviderId provider);

} // namespace mediagrab

#endif // MEDIAGRAB_PROVIDER_HPP

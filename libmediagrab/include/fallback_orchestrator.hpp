/**
 * @file fallback_orchestrator.hpp
 * @brief Drives the candidate providers of a URL until one succeeds.
 */

#ifndef MEDIAGRAB_FALLBACK_ORCHESTRATOR_HPP
#define MEDIAGRAB_FALLBACK_ORCHESTRATOR_HPP

#include "event_bus.hpp"
#include "payload.hpp"
#include "provider_registry.hpp"
#include "router_config.hpp"
#include <stop_token>

namespace mediagrab {

/**
 * @brief Runs one routing pass: classify, then try the candidates in order.
 *
 * @details Candidates are tried strictly one after the other. A failure
 * marked recoverable moves on to the next candidate; a non-recoverable one
 * ends the pass immediately and is rethrown unchanged. When every candidate
 * failed recoverably the last report is rethrown. ProviderUnavailable
 * failures re-run the same provider up to its transient_retries(), after a
 * backoff that a stop request cuts short.
 *
 * Progress is published on the EventBus (see events.hpp).
 */
class FallbackOrchestrator {
public:
    /**
     * @param registry Providers to resolve candidates with; must outlive the orchestrator.
     * @param config Timeouts, limits and credential forwarded to the providers.
     * @param bus EventBus used to publish progress and results.
     */
    FallbackOrchestrator(const ProviderRegistry& registry, RouterConfig config, EventBus& bus);

    /**
     * @brief Retrieve the artifact for @p request.
     * @throws FetchError carrying the terminal (or last recoverable) ErrorReport.
     */
    MediaArtifact route(const MediaRequest& request, std::stop_token stop = {});

    /**
     * @brief First successful probe among the candidates.
     *
     * Probe failures are never fatal: an empty ProbeResult means nothing
     * could be estimated.
     * @throws FetchError(InvalidURL) for malformed URLs.
     */
    ProbeResult probe(const MediaRequest& request, std::stop_token stop = {});

    /// @return The per-call context handed to providers.
    [[nodiscard]] FetchContext make_context(std::stop_token stop) const;

private:
    [[noreturn]] void fail(const ErrorReport& report, std::chrono::steady_clock::time_point started);

    const ProviderRegistry& registry_;
    RouterConfig config_;
    EventBus& bus_;
};

} // namespace mediagrab

#endif // MEDIAGRAB_FALLBACK_ORCHESTRATOR_HPP

/**
 * @file events.hpp
 * @brief Events published by the FallbackOrchestrator while routing a URL.
 */

#ifndef MEDIAGRAB_EVENTS_HPP
#define MEDIAGRAB_EVENTS_HPP

#include "error_report.hpp"
#include "media_types.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mediagrab {

// --- Classification ---

/**
 * @brief Emitted when a routing pass begins.
 */
struct RouteStartEvent {
    std::string url; ///< Raw URL as supplied
};

/**
 * @brief Emitted once the classifier has produced the candidate list.
 */
struct CandidatesResolvedEvent {
    std::string url;
    std::vector<ProviderCandidate> candidates; ///< In attempt order
};

// --- Attempts ---

/**
 * @brief Emitted right before a provider is invoked.
 */
struct ProviderAttemptEvent {
    ProviderId provider;
    std::size_t index = 0;   ///< Position in the candidate list
    int attempt = 1;         ///< 1 for the first try, more on transient retries
};

/**
 * @brief Emitted when a provider fails, whatever happens next.
 */
struct ProviderFailedEvent {
    ErrorReport report;
    bool falling_back = false; ///< True if another candidate will be tried
};

/**
 * @brief Emitted when a provider is re-run after a transient failure.
 */
struct ProviderRetryEvent {
    ProviderId provider;
    int attempt = 2;
    std::chrono::milliseconds delay{0};
};

// --- Outcome ---

/**
 * @brief Emitted when a routing pass produced an artifact.
 */
struct RouteCompleteEvent {
    ProviderId provider;
    std::string filename;
    std::string mime_type;
    std::optional<std::uint64_t> size_bytes;
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Emitted when a routing pass ended with an error.
 */
struct RouteFailedEvent {
    ErrorReport report;
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Emitted after a probe, successful or not.
 */
struct ProbeCompleteEvent {
    std::string url;
    ProbeResult result;
};

} // namespace mediagrab

#endif // MEDIAGRAB_EVENTS_HPP

#include "../../include/fallback_orchestrator.hpp"
#include "../../include/events.hpp"
#include "../../include/logger.hpp"
#include "../../include/result_assembler.hpp"
#include "../../include/url_classifier.hpp"

#include <algorithm>
#include <condition_variable>
#include <mutex>

namespace mediagrab {

namespace {

constexpr std::string_view kTag = "orchestrator";

std::chrono::milliseconds elapsed_since(const std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
}

// sleeps for `delay` unless a stop is requested first
void interruptible_sleep(const std::chrono::milliseconds delay, const std::stop_token& stop) {
    std::mutex mtx;
    std::condition_variable_any cv;
    std::unique_lock lock(mtx);
    cv.wait_for(lock, stop, delay, [] { return false; });
}

} // namespace

FallbackOrchestrator::FallbackOrchestrator(const ProviderRegistry& registry, RouterConfig config, EventBus& bus)
    : registry_(registry), config_(std::move(config)), bus_(bus) {}

FetchContext FallbackOrchestrator::make_context(std::stop_token stop) const {
    FetchContext context;
    context.stop = std::move(stop);
    context.credential = config_.cookies.get();
    context.network_timeout = config_.network_timeout;
    context.extractor_timeout = config_.extractor_timeout;
    context.max_payload_bytes = config_.max_payload_bytes;
    context.user_agent = config_.user_agent;
    return context;
}

void FallbackOrchestrator::fail(const ErrorReport& report, const std::chrono::steady_clock::time_point started) {
    Logger::log(report.kind == ErrorKind::Cancelled ? LogLevel::Warning : LogLevel::Error, report.describe(), kTag);
    bus_.publish(RouteFailedEvent{report, elapsed_since(started)});
    throw FetchError(report);
}

MediaArtifact FallbackOrchestrator::route(const MediaRequest& request, std::stop_token stop) {
    const auto started = std::chrono::steady_clock::now();
    bus_.publish(RouteStartEvent{request.raw_url()});

    std::vector<ProviderCandidate> candidates;
    try {
        candidates = classify(request.raw_url());
    } catch (const FetchError& e) {
        fail(e.report(), started);
    }
    std::ranges::stable_sort(candidates, std::ranges::greater{}, &ProviderCandidate::priority);
    bus_.publish(CandidatesResolvedEvent{request.raw_url(), candidates});

    const FetchContext context = make_context(std::move(stop));
    std::optional<ErrorReport> last;

    for (std::size_t i = 0; i < candidates.size(); ++i) {
        IProvider* provider = registry_.find(candidates[i].provider);
        if (!provider) {
            Logger::log(LogLevel::Warning,
                        "no provider registered for " + std::string(to_string(candidates[i].provider)), kTag);
            last = ErrorReport::make(ErrorKind::ProviderUnavailable, candidates[i].provider, "provider not registered");
            continue;
        }

        ErrorReport report;
        for (int attempt = 1;; ++attempt) {
            if (context.stop.stop_requested()) {
                fail(ErrorReport::make(ErrorKind::Cancelled, provider->id(), "cancelled by caller"), started);
            }

            bus_.publish(ProviderAttemptEvent{provider->id(), i, attempt});
            Logger::log(LogLevel::Info, "trying " + std::string(provider->get_name()) +
                        (attempt > 1 ? " (attempt " + std::to_string(attempt) + ")" : std::string()), kTag);
            try {
                MediaArtifact artifact = assemble_artifact(provider->fetch(request, context));
                Logger::log(LogLevel::Info, std::string(provider->get_name()) + " produced '" + artifact.filename +
                            "' (" + artifact.mime_type + ")", kTag);
                bus_.publish(RouteCompleteEvent{artifact.provider, artifact.filename, artifact.mime_type,
                                                artifact.size_bytes, elapsed_since(started)});
                return artifact;
            } catch (const std::exception& e) {
                report = report_from(e, provider->id());
            }

            if (report.kind != ErrorKind::ProviderUnavailable || attempt > provider->transient_retries()) break;

            const auto delay = config_.retry_backoff * attempt;
            Logger::log(LogLevel::Warning, report.describe() + ", retrying in " +
                        std::to_string(delay.count()) + " ms", kTag);
            bus_.publish(ProviderRetryEvent{provider->id(), attempt + 1, delay});
            interruptible_sleep(delay, context.stop);
        }

        const bool falling_back = report.recoverable && i + 1 < candidates.size();
        bus_.publish(ProviderFailedEvent{report, falling_back});
        if (!report.recoverable) {
            fail(report, started);
        }
        if (falling_back) {
            Logger::log(LogLevel::Warning, report.describe() + ", falling back to " +
                        std::string(to_string(candidates[i + 1].provider)), kTag);
        }
        last = std::move(report);
    }

    fail(last.value_or(ErrorReport::make(ErrorKind::Unknown, std::nullopt, "no provider could be tried")), started);
}

ProbeResult FallbackOrchestrator::probe(const MediaRequest& request, std::stop_token stop) {
    auto candidates = classify(request.raw_url());
    std::ranges::stable_sort(candidates, std::ranges::greater{}, &ProviderCandidate::priority);
    const FetchContext context = make_context(std::move(stop));

    ProbeResult result;
    for (const auto& candidate : candidates) {
        if (context.stop.stop_requested()) break;
        IProvider* provider = registry_.find(candidate.provider);
        if (!provider || !provider->supports_streaming_probe()) continue;
        try {
            if (auto probed = provider->probe(request, context)) {
                result = std::move(*probed);
                if (!result.provider) result.provider = provider->id();
                break;
            }
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Debug, std::string(provider->get_name()) + " probe failed: " + e.what(), kTag);
        }
    }
    bus_.publish(ProbeCompleteEvent{request.raw_url(), result});
    return result;
}

} // namespace mediagrab

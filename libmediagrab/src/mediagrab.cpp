/**
 * @file mediagrab.cpp
 * @brief Implementation of the public MediaGrabber API.
 */

#include "../include/mediagrab.hpp"

#include "../include/beast_http_client.hpp"
#include "../include/event_bus.hpp"
#include "../include/events.hpp"
#include "../include/fallback_orchestrator.hpp"
#include "../include/log_sink.hpp"
#include "../include/logger.hpp"
#include "../include/process_runner.hpp"
#include "../include/router_config.hpp"

#include <atomic>
#include <mutex>
#include <stop_token>

namespace mediagrab {

// bridge sink to redirect static logs to the instance observer
class BridgeLogSink final : public ILogSink {
    const std::atomic<GrabObserver*>& observer_;
public:
    explicit BridgeLogSink(const std::atomic<GrabObserver*>& obs) : observer_(obs) {}

    void log(const LogLevel level, const std::string_view message, const std::string_view tag) override {
        if (auto* observer = observer_.load()) {
            observer->onLog(static_cast<int>(level), std::string(message), std::string(tag));
        }
    }
};

struct MediaGrabber::Impl {
    std::shared_ptr<IHttpClient> http;
    std::shared_ptr<IProcessRunner> runner;
    std::optional<ProviderRegistry> injected;
    RouterConfig config;
    EventBus eventBus;

    std::atomic<GrabObserver*> observer = nullptr;
    const ILogSink* bridge = nullptr;

    std::mutex stopMtx;
    std::stop_source current;

    Impl() {
        setupEventBridging();
    }

    ~Impl() {
        if (bridge) Logger::remove_sink(bridge);
    }

    void setupEventBridging() {
        eventBus.subscribe<ProviderAttemptEvent>([this](const ProviderAttemptEvent& e) {
            if (auto* obs = observer.load()) obs->onAttempt(e.provider, e.attempt);
        });

        eventBus.subscribe<ProviderFailedEvent>([this](const ProviderFailedEvent& e) {
            if (auto* obs = observer.load(); obs && e.falling_back) obs->onFallback(e.report);
        });

        eventBus.subscribe<RouteCompleteEvent>([this](const RouteCompleteEvent& e) {
            if (auto* obs = observer.load()) obs->onComplete(e.provider, e.filename, e.mime_type, e.size_bytes);
        });

        eventBus.subscribe<RouteFailedEvent>([this](const RouteFailedEvent& e) {
            if (auto* obs = observer.load()) obs->onError(e.report);
        });
    }

    std::stop_token begin() {
        std::lock_guard lock(stopMtx);
        current = std::stop_source();
        return current.get_token();
    }

    template <typename F>
    auto withOrchestrator(F&& f) {
        if (injected) {
            FallbackOrchestrator orchestrator(*injected, config, eventBus);
            return f(orchestrator);
        }
        const ProviderRegistry registry = ProviderRegistry::with_defaults(http, runner, config);
        FallbackOrchestrator orchestrator(registry, config, eventBus);
        return f(orchestrator);
    }
};

MediaGrabber::MediaGrabber() : impl_(std::make_unique<Impl>()) {
    impl_->http = std::make_shared<BeastHttpClient>();
    impl_->runner = std::make_shared<PosixProcessRunner>();
}

MediaGrabber::MediaGrabber(ProviderRegistry registry) : impl_(std::make_unique<Impl>()) {
    impl_->injected.emplace(std::move(registry));
}

MediaGrabber::~MediaGrabber() {
    if (impl_) stop();
}

MediaGrabber::MediaGrabber(MediaGrabber&&) noexcept = default;
MediaGrabber& MediaGrabber::operator=(MediaGrabber&&) noexcept = default;

MediaGrabber& MediaGrabber::networkTimeout(const std::chrono::milliseconds val) {
    impl_->config.network_timeout = val;
    return *this;
}

MediaGrabber& MediaGrabber::extractorTimeout(const std::chrono::milliseconds val) {
    impl_->config.extractor_timeout = val;
    return *this;
}

MediaGrabber& MediaGrabber::maxPayloadBytes(const std::uint64_t val) {
    impl_->config.max_payload_bytes = val;
    return *this;
}

MediaGrabber& MediaGrabber::ytDlpPath(const std::string& path) {
    impl_->config.yt_dlp_path = path;
    return *this;
}

MediaGrabber& MediaGrabber::shortVideoApi(const std::string& url) {
    impl_->config.short_video_api = url;
    return *this;
}

MediaGrabber& MediaGrabber::userAgent(const std::string& agent) {
    impl_->config.user_agent = agent;
    return *this;
}

MediaGrabber& MediaGrabber::cookies(std::shared_ptr<const CookieJar> jar) {
    impl_->config.cookies = std::move(jar);
    return *this;
}

MediaGrabber& MediaGrabber::cookieFile(const std::filesystem::path& path) {
    if (auto jar = CookieJar::load_if_present(path)) {
        impl_->config.cookies = std::make_shared<const CookieJar>(std::move(*jar));
    } else {
        Logger::log(LogLevel::Warning,
                    "cookie file " + path.string() + " not found, downloads requiring authentication will likely fail",
                    "mediagrab");
    }
    return *this;
}

void MediaGrabber::setObserver(GrabObserver* observer) {
    impl_->observer.store(observer);
    // inject bridge sink once an observer is present
    if (observer && !impl_->bridge) {
        auto sink = std::make_unique<BridgeLogSink>(impl_->observer);
        impl_->bridge = sink.get();
        Logger::add_sink(std::move(sink));
    }
}

MediaArtifact MediaGrabber::grab(const std::string& url) {
    const std::stop_token stop = impl_->begin();
    return impl_->withOrchestrator([&](FallbackOrchestrator& orchestrator) {
        return orchestrator.route(MediaRequest(url), stop);
    });
}

ProbeResult MediaGrabber::probe(const std::string& url) {
    const std::stop_token stop = impl_->begin();
    return impl_->withOrchestrator([&](FallbackOrchestrator& orchestrator) {
        return orchestrator.probe(MediaRequest(url), stop);
    });
}

void MediaGrabber::stop() {
    std::lock_guard lock(impl_->stopMtx);
    impl_->current.request_stop();
}

} // namespace mediagrab

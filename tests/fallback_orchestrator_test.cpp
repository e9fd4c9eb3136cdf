#include <gtest/gtest.h>
#include "fakes.hpp"
#include "../libmediagrab/include/events.hpp"
#include "../libmediagrab/include/fallback_orchestrator.hpp"
#include "../libmediagrab/include/social_post_provider.hpp"

#include <chrono>

using namespace mediagrab;
using namespace mediagrab::test;

class FallbackOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.retry_backoff = std::chrono::milliseconds(1);
        bus.subscribe<ProviderAttemptEvent>([this](const ProviderAttemptEvent& e) { attempts.push_back(e); });
        bus.subscribe<ProviderFailedEvent>([this](const ProviderFailedEvent& e) { failures.push_back(e); });
        bus.subscribe<ProviderRetryEvent>([this](const ProviderRetryEvent&) { ++retries; });
        bus.subscribe<RouteCompleteEvent>([this](const RouteCompleteEvent&) { ++completed; });
        bus.subscribe<RouteFailedEvent>([this](const RouteFailedEvent& e) { route_failures.push_back(e.report); });
    }

    // registers a fake and keeps a handle for assertions
    FakeProvider& add(const ProviderId id, const int retries = 0) {
        auto provider = std::make_unique<FakeProvider>(id, retries);
        FakeProvider& ref = *provider;
        registry.add(std::move(provider));
        return ref;
    }

    ErrorReport route_expecting_failure(const std::string& url, std::stop_token stop = {}) {
        FallbackOrchestrator orchestrator(registry, config, bus);
        try {
            (void)orchestrator.route(MediaRequest(url), std::move(stop));
        } catch (const FetchError& e) {
            return e.report();
        }
        ADD_FAILURE() << "route() succeeded for " << url;
        return {};
    }

    ProviderRegistry registry;
    RouterConfig config;
    EventBus bus;

    std::vector<ProviderAttemptEvent> attempts;
    std::vector<ProviderFailedEvent> failures;
    std::vector<ErrorReport> route_failures;
    int retries = 0;
    int completed = 0;
};

TEST_F(FallbackOrchestratorTest, UnsupportedExtractorFallsBackToGeneric) {
    FakeProvider& extractor = add(ProviderId::VideoExtractor).fail_with(ErrorKind::UnsupportedURL);
    FakeProvider& generic = add(ProviderId::GenericHttp).succeed_with("clip.mp4", "bytes", "video/mp4");

    FallbackOrchestrator orchestrator(registry, config, bus);
    MediaArtifact artifact = orchestrator.route(MediaRequest("https://www.youtube.com/watch?v=abc"));

    EXPECT_EQ(artifact.provider, ProviderId::GenericHttp);
    EXPECT_EQ(artifact.filename, "clip.mp4");
    EXPECT_EQ(artifact.read_all(), "bytes");
    EXPECT_EQ(extractor.calls, 1);
    EXPECT_EQ(generic.calls, 1);
    ASSERT_EQ(attempts.size(), 2u);
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_TRUE(failures[0].falling_back);
    EXPECT_EQ(completed, 1);
}

TEST_F(FallbackOrchestratorTest, LoginRequiredStopsImmediately) {
    FakeProvider& social = add(ProviderId::SocialPost).fail_with(ErrorKind::LoginRequired, "private");
    FakeProvider& generic = add(ProviderId::GenericHttp).succeed_with("x.jpg", "x");

    const ErrorReport report = route_expecting_failure("https://www.instagram.com/p/ABC/");
    EXPECT_EQ(report.kind, ErrorKind::LoginRequired);
    EXPECT_EQ(report.provider, ProviderId::SocialPost);
    EXPECT_EQ(social.calls, 1);
    EXPECT_EQ(generic.calls, 0);
    ASSERT_EQ(route_failures.size(), 1u);
}

TEST_F(FallbackOrchestratorTest, NonRecoverableFailureSkipsRemainingCandidates) {
    FakeProvider& extractor = add(ProviderId::VideoExtractor).fail_with(ErrorKind::NotFound, "removed");
    FakeProvider& generic = add(ProviderId::GenericHttp).succeed_with("page.html", "<html>");

    const ErrorReport report = route_expecting_failure("https://vimeo.com/123");
    EXPECT_EQ(report.kind, ErrorKind::NotFound);
    EXPECT_EQ(extractor.calls, 1);
    EXPECT_EQ(generic.calls, 0);
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_FALSE(failures[0].falling_back);
}

TEST_F(FallbackOrchestratorTest, RecoverableOverrideAllowsFallback) {
    add(ProviderId::VideoExtractor).fail_with(
        ErrorReport::make(ErrorKind::AccessDenied, ProviderId::VideoExtractor, "403 without cookies", true));
    FakeProvider& generic = add(ProviderId::GenericHttp).succeed_with("a.mp4", "a", "video/mp4");

    FallbackOrchestrator orchestrator(registry, config, bus);
    const MediaArtifact artifact = orchestrator.route(MediaRequest("https://twitter.com/u/status/1"));
    EXPECT_EQ(artifact.provider, ProviderId::GenericHttp);
    EXPECT_EQ(generic.calls, 1);
}

TEST_F(FallbackOrchestratorTest, LastRecoverableReportIsReturned) {
    add(ProviderId::VideoExtractor).fail_with(ErrorKind::UnsupportedURL);
    add(ProviderId::GenericHttp).fail_with(ErrorKind::NetworkError, "HTTP status 500");

    const ErrorReport report = route_expecting_failure("https://youtu.be/abc");
    EXPECT_EQ(report.kind, ErrorKind::NetworkError);
    EXPECT_EQ(report.provider, ProviderId::GenericHttp);
    EXPECT_EQ(report.human_message, "HTTP status 500");
}

TEST_F(FallbackOrchestratorTest, TransientFailureIsRetriedOnce) {
    FakeProvider& api = add(ProviderId::ShortVideoApi, 1)
        .fail_with(ErrorKind::ProviderUnavailable, "rate limited")
        .succeed_with("user_title.mp4", "v", "video/mp4");
    FakeProvider& generic = add(ProviderId::GenericHttp);

    FallbackOrchestrator orchestrator(registry, config, bus);
    const MediaArtifact artifact = orchestrator.route(MediaRequest("https://www.tiktok.com/@user/video/1"));
    EXPECT_EQ(artifact.provider, ProviderId::ShortVideoApi);
    EXPECT_EQ(api.calls, 2);
    EXPECT_EQ(generic.calls, 0);
    EXPECT_EQ(retries, 1);
    ASSERT_EQ(attempts.size(), 2u);
    EXPECT_EQ(attempts[1].attempt, 2);
}

TEST_F(FallbackOrchestratorTest, ExhaustedRetriesFallBack) {
    FakeProvider& api = add(ProviderId::ShortVideoApi, 1).fail_with(ErrorKind::ProviderUnavailable);
    FakeProvider& generic = add(ProviderId::GenericHttp).succeed_with("v.mp4", "v", "video/mp4");

    FallbackOrchestrator orchestrator(registry, config, bus);
    const MediaArtifact artifact = orchestrator.route(MediaRequest("https://www.tiktok.com/@user/video/1"));
    EXPECT_EQ(artifact.provider, ProviderId::GenericHttp);
    EXPECT_EQ(api.calls, 2);
    EXPECT_EQ(generic.calls, 1);
}

TEST_F(FallbackOrchestratorTest, ProviderWithoutRetriesIsNotRetried) {
    FakeProvider& extractor = add(ProviderId::VideoExtractor).fail_with(ErrorKind::ProviderUnavailable);
    add(ProviderId::GenericHttp).succeed_with("v.mp4", "v", "video/mp4");

    FallbackOrchestrator orchestrator(registry, config, bus);
    (void)orchestrator.route(MediaRequest("https://soundcloud.com/a/b"));
    EXPECT_EQ(extractor.calls, 1);
    EXPECT_EQ(retries, 0);
}

TEST_F(FallbackOrchestratorTest, InvalidUrlNeverReachesProviders) {
    FakeProvider& generic = add(ProviderId::GenericHttp).succeed_with("x", "x");

    const ErrorReport report = route_expecting_failure("example.com/file.mp4");
    EXPECT_EQ(report.kind, ErrorKind::InvalidURL);
    EXPECT_FALSE(report.provider.has_value());
    EXPECT_EQ(generic.calls, 0);
    ASSERT_EQ(route_failures.size(), 1u);
    EXPECT_EQ(route_failures[0].kind, ErrorKind::InvalidURL);
}

TEST_F(FallbackOrchestratorTest, StopBeforeStartCancels) {
    FakeProvider& generic = add(ProviderId::GenericHttp).succeed_with("x", "x");
    std::stop_source source;
    source.request_stop();

    const ErrorReport report = route_expecting_failure("https://example.com/a.bin", source.get_token());
    EXPECT_EQ(report.kind, ErrorKind::Cancelled);
    EXPECT_FALSE(report.recoverable);
    EXPECT_EQ(generic.calls, 0);
}

TEST_F(FallbackOrchestratorTest, StopInterruptsRetryBackoff) {
    config.retry_backoff = std::chrono::seconds(30);
    std::stop_source source;
    FakeProvider& api = add(ProviderId::ShortVideoApi, 1).fail_with(ErrorKind::ProviderUnavailable);
    api.on_fetch = [&source] { source.request_stop(); };
    FakeProvider& generic = add(ProviderId::GenericHttp).succeed_with("x", "x");

    const auto start = std::chrono::steady_clock::now();
    const ErrorReport report = route_expecting_failure("https://www.tiktok.com/@a/video/1", source.get_token());
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
    EXPECT_EQ(report.kind, ErrorKind::Cancelled);
    EXPECT_EQ(api.calls, 1);
    EXPECT_EQ(generic.calls, 0);
}

TEST_F(FallbackOrchestratorTest, UnregisteredCandidateIsSkipped) {
    FakeProvider& generic = add(ProviderId::GenericHttp).succeed_with("v.mp4", "v", "video/mp4");

    FallbackOrchestrator orchestrator(registry, config, bus);
    const MediaArtifact artifact = orchestrator.route(MediaRequest("https://www.dailymotion.com/video/x1"));
    EXPECT_EQ(artifact.provider, ProviderId::GenericHttp);
    EXPECT_EQ(generic.calls, 1);
}

TEST_F(FallbackOrchestratorTest, CredentialIsHandedToProviders) {
    config.cookies = std::make_shared<const CookieJar>(
        CookieJar::parse(".example.com\tTRUE\t/\tTRUE\t0\tsid\tabc\n"));
    FakeProvider& generic = add(ProviderId::GenericHttp).succeed_with("a.bin", "a");

    FallbackOrchestrator orchestrator(registry, config, bus);
    (void)orchestrator.route(MediaRequest("https://example.com/a.bin"));
    EXPECT_EQ(generic.last_credential, config.cookies.get());
}

TEST_F(FallbackOrchestratorTest, InstagramLinkWithoutPostIsParsingError) {
    auto http = std::make_shared<FakeHttpClient>();
    auto source = std::make_unique<FakePostSource>(PostMetadata{});
    FakePostSource& source_ref = *source;
    registry.add(std::make_unique<SocialPostProvider>(http, std::move(source)));

    const ErrorReport report = route_expecting_failure("https://www.instagram.com/explore/tags/cats/");
    EXPECT_EQ(report.kind, ErrorKind::ParsingError);
    EXPECT_EQ(report.provider, ProviderId::SocialPost);
    EXPECT_TRUE(source_ref.requested.empty());
    EXPECT_TRUE(http->requests.empty());
}

TEST_F(FallbackOrchestratorTest, ProbeUsesFirstProvider) {
    ProbeResult hint;
    hint.size_bytes = 1234;
    hint.suggested_name = "video.mp4";
    add(ProviderId::VideoExtractor).probe_with(hint);
    add(ProviderId::GenericHttp);

    FallbackOrchestrator orchestrator(registry, config, bus);
    const ProbeResult result = orchestrator.probe(MediaRequest("https://vimeo.com/1"));
    EXPECT_EQ(result.size_bytes, 1234u);
    EXPECT_EQ(result.suggested_name, "video.mp4");
    EXPECT_EQ(result.provider, ProviderId::VideoExtractor);
}

TEST_F(FallbackOrchestratorTest, ProbeWithoutCapableProviderIsEmpty) {
    add(ProviderId::GoogleDrive);

    FallbackOrchestrator orchestrator(registry, config, bus);
    const ProbeResult result = orchestrator.probe(MediaRequest("https://drive.google.com/file/d/X/view"));
    EXPECT_FALSE(result.size_bytes.has_value());
    EXPECT_FALSE(result.suggested_name.has_value());
    EXPECT_FALSE(result.provider.has_value());
}

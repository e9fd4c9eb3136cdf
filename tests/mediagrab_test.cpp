#include <gtest/gtest.h>
#include "fakes.hpp"
#include "../libmediagrab/include/logger.hpp"
#include "../libmediagrab/include/mediagrab.hpp"

using namespace mediagrab;
using namespace mediagrab::test;

namespace {

class RecordingObserver final : public GrabObserver {
public:
    void onAttempt(const ProviderId provider, int) override { attempts.push_back(provider); }
    void onFallback(const ErrorReport& report) override { fallbacks.push_back(report.kind); }
    void onComplete(const ProviderId provider, const std::string& filename, const std::string&,
                    std::optional<std::uint64_t>) override {
        completed = provider;
        completed_name = filename;
    }
    void onError(const ErrorReport& report) override { error = report.kind; }
    void onLog(int, const std::string&, const std::string& tag) override { tags.push_back(tag); }

    std::vector<ProviderId> attempts;
    std::vector<ErrorKind> fallbacks;
    std::optional<ProviderId> completed;
    std::string completed_name;
    std::optional<ErrorKind> error;
    std::vector<std::string> tags;
};

} // namespace

class MediaGrabberTest : public ::testing::Test {
protected:
    void TearDown() override { Logger::clear_sinks(); }
};

TEST_F(MediaGrabberTest, GrabReportsProgressToObserver) {
    ProviderRegistry registry;
    registry.add(std::make_unique<FakeProvider>(ProviderId::VideoExtractor));
    static_cast<FakeProvider*>(registry.find(ProviderId::VideoExtractor))->fail_with(ErrorKind::UnsupportedURL);
    auto generic = std::make_unique<FakeProvider>(ProviderId::GenericHttp);
    generic->succeed_with("song", "ID3data", "audio/mpeg");
    registry.add(std::move(generic));

    MediaGrabber grabber(std::move(registry));
    RecordingObserver observer;
    grabber.setObserver(&observer);

    MediaArtifact artifact = grabber.grab("https://soundcloud.com/artist/song");
    EXPECT_EQ(artifact.filename, "song.mp3");
    EXPECT_EQ(artifact.mime_type, "audio/mpeg");
    EXPECT_EQ(artifact.read_all(), "ID3data");

    EXPECT_EQ(observer.attempts, (std::vector<ProviderId>{ProviderId::VideoExtractor, ProviderId::GenericHttp}));
    EXPECT_EQ(observer.fallbacks, std::vector<ErrorKind>{ErrorKind::UnsupportedURL});
    EXPECT_EQ(observer.completed, ProviderId::GenericHttp);
    EXPECT_EQ(observer.completed_name, "song.mp3");
    EXPECT_FALSE(observer.error.has_value());
    EXPECT_NE(std::ranges::find(observer.tags, "orchestrator"), observer.tags.end());
}

TEST_F(MediaGrabberTest, GrabFailureThrowsAndNotifies) {
    ProviderRegistry registry;
    auto social = std::make_unique<FakeProvider>(ProviderId::SocialPost);
    social->fail_with(ErrorKind::LoginRequired, "cookies needed");
    registry.add(std::move(social));

    MediaGrabber grabber(std::move(registry));
    RecordingObserver observer;
    grabber.setObserver(&observer);

    try {
        (void)grabber.grab("https://www.instagram.com/p/ABC/");
        FAIL() << "grab succeeded";
    } catch (const FetchError& e) {
        EXPECT_EQ(e.report().kind, ErrorKind::LoginRequired);
        EXPECT_EQ(e.report().human_message, "cookies needed");
    }
    EXPECT_EQ(observer.error, ErrorKind::LoginRequired);
}

TEST_F(MediaGrabberTest, CookiesReachProviders) {
    ProviderRegistry registry;
    registry.add(std::make_unique<FakeProvider>(ProviderId::GenericHttp));
    auto* generic = static_cast<FakeProvider*>(registry.find(ProviderId::GenericHttp));
    generic->succeed_with("a.bin", "a");

    auto jar = std::make_shared<const CookieJar>(CookieJar::parse("example.com\tFALSE\t/\tFALSE\t0\tk\tv\n"));
    MediaGrabber grabber(std::move(registry));
    grabber.cookies(jar).networkTimeout(std::chrono::seconds(5));

    (void)grabber.grab("https://example.com/a.bin");
    EXPECT_EQ(generic->last_credential, jar.get());
}

TEST_F(MediaGrabberTest, MissingCookieFileIsTolerated) {
    MediaGrabber grabber{ProviderRegistry{}};
    EXPECT_NO_THROW(grabber.cookieFile("/nonexistent/cookies.txt"));
}

TEST_F(MediaGrabberTest, ProbeReturnsProviderHint) {
    ProviderRegistry registry;
    auto extractor = std::make_unique<FakeProvider>(ProviderId::VideoExtractor);
    ProbeResult hint;
    hint.size_bytes = 99;
    hint.suggested_name = "talk.mp4";
    extractor->probe_with(hint);
    registry.add(std::move(extractor));

    MediaGrabber grabber(std::move(registry));
    const ProbeResult result = grabber.probe("https://www.ted.com/talks/x");
    EXPECT_EQ(result.size_bytes, 99u);
    EXPECT_EQ(result.suggested_name, "talk.mp4");
}

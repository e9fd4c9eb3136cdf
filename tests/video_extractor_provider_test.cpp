#include <gtest/gtest.h>
#include "fakes.hpp"
#include "../libmediagrab/include/cookie_jar.hpp"
#include "../libmediagrab/include/video_extractor_provider.hpp"

#include <fstream>

using namespace mediagrab;
using namespace mediagrab::test;

namespace {

void write_file(const std::filesystem::path& path, const std::string& data) {
    std::ofstream out(path, std::ios::binary);
    out << data;
}

ProcessResult exited(const int code, std::string err = {}, std::string out = {}) {
    ProcessResult r;
    r.exit_code = code;
    r.err = std::move(err);
    r.out = std::move(out);
    return r;
}

} // namespace

TEST(ExtractorFailureTest, ClassifiesDiagnostics) {
    EXPECT_EQ(classify_extractor_failure("ERROR: Unsupported URL: https://x", false).kind, ErrorKind::UnsupportedURL);
    EXPECT_TRUE(classify_extractor_failure("ERROR: Unsupported URL: https://x", false).recoverable);
    EXPECT_EQ(classify_extractor_failure("ERROR: Sign in to confirm your age", false).kind, ErrorKind::LoginRequired);
    EXPECT_EQ(classify_extractor_failure("ERROR: Private video", true).kind, ErrorKind::LoginRequired);
    EXPECT_EQ(classify_extractor_failure("ERROR: Video unavailable", false).kind, ErrorKind::NotFound);
    EXPECT_EQ(classify_extractor_failure("ERROR: HTTP Error 404: Not Found", false).kind, ErrorKind::NotFound);
    EXPECT_EQ(classify_extractor_failure("ERROR: HTTP Error 429: Too Many Requests", false).kind,
              ErrorKind::ProviderUnavailable);
    EXPECT_EQ(classify_extractor_failure("something odd", false).kind, ErrorKind::Unknown);
    EXPECT_FALSE(classify_extractor_failure("something odd", false).recoverable);
}

TEST(ExtractorFailureTest, ForbiddenIsRecoverableOnlyWithoutCookies) {
    const auto anonymous = classify_extractor_failure("ERROR: HTTP Error 403: Forbidden", false);
    EXPECT_EQ(anonymous.kind, ErrorKind::AccessDenied);
    EXPECT_TRUE(anonymous.recoverable);

    const auto with_cookies = classify_extractor_failure("ERROR: HTTP Error 403: Forbidden", true);
    EXPECT_EQ(with_cookies.kind, ErrorKind::AccessDenied);
    EXPECT_FALSE(with_cookies.recoverable);
}

TEST(ExtractorFailureTest, MessageUsesLastErrorLine) {
    const auto report = classify_extractor_failure(
        "[youtube] abc: Downloading webpage\nERROR: first\nWARNING: noise\nERROR: Video unavailable\n", false);
    EXPECT_EQ(report.human_message, "ERROR: Video unavailable");
}

TEST(ExtractorInfoTest, ReadsSizeAndName) {
    const auto info = parse_extractor_info(R"({"title":"My: Video","ext":"webm","filesize_approx":5000})");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->size_bytes, 5000u);
    EXPECT_EQ(info->suggested_name, "My_ Video.webm");
}

TEST(ExtractorInfoTest, SumsRequestedFormats) {
    const auto info = parse_extractor_info(
        R"({"title":"t","requested_formats":[{"filesize":100},{"filesize_approx":50},{"filesize":null}]})");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->size_bytes, 150u);
    EXPECT_EQ(info->suggested_name, "t.mp4");
}

TEST(ExtractorInfoTest, InvalidJsonIsEmpty) {
    EXPECT_FALSE(parse_extractor_info("not json").has_value());
}

class VideoExtractorProviderTest : public ::testing::Test {
protected:
    FetchContext context;
};

TEST_F(VideoExtractorProviderTest, PicksProducedFileAndPassesOptions) {
    std::filesystem::path seen_dir;
    auto runner = std::make_shared<FakeProcessRunner>(
        [&](const std::vector<std::string>& argv, const ProcessOptions& options) {
            EXPECT_EQ(options.timeout, context.extractor_timeout);
            seen_dir = FakeProcessRunner::output_dir(argv);
            write_file(seen_dir / "Great Song.mp4", std::string(1000, 'v'));
            write_file(seen_dir / "Great Song.f137.mp4.part", std::string(5000, 'p'));
            write_file(seen_dir / "Great Song.jpg", std::string(10, 'j'));
            return exited(0);
        });
    context.max_payload_bytes = 1 << 20;
    context.user_agent = "ua";
    VideoExtractorProvider provider(runner, "/opt/yt-dlp");

    RetrievedPayload payload = provider.fetch(MediaRequest("https://youtu.be/abc"), context);

    ASSERT_EQ(runner->calls.size(), 1u);
    const auto& argv = runner->calls[0];
    EXPECT_EQ(argv.front(), "/opt/yt-dlp");
    EXPECT_EQ(FakeProcessRunner::arg_after(argv, "-f"), std::string(kExtractorFormat));
    EXPECT_EQ(FakeProcessRunner::arg_after(argv, "--merge-output-format"), "mp4");
    EXPECT_EQ(FakeProcessRunner::arg_after(argv, "--max-filesize"), std::to_string(1 << 20));
    EXPECT_EQ(FakeProcessRunner::arg_after(argv, "--user-agent"), "ua");
    EXPECT_FALSE(FakeProcessRunner::arg_after(argv, "--cookies").has_value());
    EXPECT_EQ(argv.back(), "https://youtu.be/abc");
    EXPECT_EQ(argv[argv.size() - 2], "--");

    EXPECT_EQ(payload.source_provider, ProviderId::VideoExtractor);
    EXPECT_EQ(payload.suggested_name, "Great Song.mp4");
    EXPECT_EQ(payload.size_bytes, 1000u);

    MediaArtifact artifact;
    artifact.body = std::move(payload.body);
    EXPECT_EQ(artifact.read_all().size(), 1000u);

    // the work directory is gone once fetch returns
    EXPECT_FALSE(std::filesystem::exists(seen_dir));
}

TEST_F(VideoExtractorProviderTest, CookieCopyIsHandedOver) {
    const CookieJar jar = CookieJar::parse(".youtube.com\tTRUE\t/\tTRUE\t0\tSID\tsecret\n");
    context.credential = &jar;
    std::string copied;
    auto runner = std::make_shared<FakeProcessRunner>(
        [&](const std::vector<std::string>& argv, const ProcessOptions&) {
            const auto path = FakeProcessRunner::arg_after(argv, "--cookies");
            if (path) {
                std::ifstream in(*path);
                copied.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
            }
            write_file(FakeProcessRunner::output_dir(argv) / "v.mp4", "v");
            return exited(0);
        });
    VideoExtractorProvider provider(runner, "yt-dlp");
    (void)provider.fetch(MediaRequest("https://www.youtube.com/watch?v=1"), context);
    EXPECT_NE(copied.find("SID\tsecret"), std::string::npos);
}

TEST_F(VideoExtractorProviderTest, FailureIsClassified) {
    auto runner = std::make_shared<FakeProcessRunner>(
        [](const std::vector<std::string>&, const ProcessOptions&) {
            return exited(1, "ERROR: Unsupported URL: https://example.org/page");
        });
    VideoExtractorProvider provider(runner, "yt-dlp");
    try {
        (void)provider.fetch(MediaRequest("https://example.org/page"), context);
        FAIL() << "fetch succeeded";
    } catch (const FetchError& e) {
        EXPECT_EQ(e.report().kind, ErrorKind::UnsupportedURL);
        EXPECT_EQ(e.report().provider, ProviderId::VideoExtractor);
    }
}

TEST_F(VideoExtractorProviderTest, SkippedOversizeDownloadIsPayloadTooLarge) {
    auto runner = std::make_shared<FakeProcessRunner>(
        [](const std::vector<std::string>&, const ProcessOptions&) {
            return exited(0, {},
                          "[youtube] abc: Downloading webpage\n"
                          "[download] File is larger than max-filesize (734003200 bytes > 1048576 bytes). Aborting.\n");
        });
    context.max_payload_bytes = 1 << 20;
    VideoExtractorProvider provider(runner, "yt-dlp");
    try {
        (void)provider.fetch(MediaRequest("https://youtu.be/abc"), context);
        FAIL() << "fetch succeeded";
    } catch (const FetchError& e) {
        EXPECT_EQ(e.report().kind, ErrorKind::PayloadTooLarge);
        EXPECT_FALSE(e.report().recoverable);
        EXPECT_NE(e.report().human_message.find("1048576"), std::string::npos);
    }
}

TEST_F(VideoExtractorProviderTest, SuccessWithoutFileIsNoArtifact) {
    auto runner = std::make_shared<FakeProcessRunner>(
        [](const std::vector<std::string>& argv, const ProcessOptions&) {
            write_file(FakeProcessRunner::output_dir(argv) / "v.mp4.part", "partial");
            return exited(0);
        });
    VideoExtractorProvider provider(runner, "yt-dlp");
    try {
        (void)provider.fetch(MediaRequest("https://vimeo.com/1"), context);
        FAIL() << "fetch succeeded";
    } catch (const FetchError& e) {
        EXPECT_EQ(e.report().kind, ErrorKind::NoArtifactProduced);
    }
}

TEST_F(VideoExtractorProviderTest, MissingExecutableIsUnavailable) {
    auto runner = std::make_shared<FakeProcessRunner>(
        [](const std::vector<std::string>&, const ProcessOptions&) -> ProcessResult {
            throw SpawnError("cannot start yt-dlp: No such file or directory", true);
        });
    VideoExtractorProvider provider(runner, "yt-dlp");
    try {
        (void)provider.fetch(MediaRequest("https://vimeo.com/1"), context);
        FAIL() << "fetch succeeded";
    } catch (const FetchError& e) {
        EXPECT_EQ(e.report().kind, ErrorKind::ProviderUnavailable);
        EXPECT_TRUE(e.report().recoverable);
    }
}

TEST_F(VideoExtractorProviderTest, TimeoutAndCancellation) {
    ProcessResult timed_out;
    timed_out.timed_out = true;
    ProcessResult cancelled;
    cancelled.cancelled = true;
    std::vector<ProcessResult> results = {timed_out, cancelled};
    std::size_t next = 0;
    auto runner = std::make_shared<FakeProcessRunner>(
        [&](const std::vector<std::string>&, const ProcessOptions&) { return results.at(next++); });
    VideoExtractorProvider provider(runner, "yt-dlp");

    const auto kind_of = [&] {
        try {
            (void)provider.fetch(MediaRequest("https://vimeo.com/1"), context);
        } catch (const FetchError& e) {
            return e.report().kind;
        }
        return ErrorKind::Unknown;
    };
    EXPECT_EQ(kind_of(), ErrorKind::NetworkError);
    EXPECT_EQ(kind_of(), ErrorKind::Cancelled);
}

TEST_F(VideoExtractorProviderTest, ProbeParsesJsonDump) {
    auto runner = std::make_shared<FakeProcessRunner>(
        [](const std::vector<std::string>& argv, const ProcessOptions&) {
            EXPECT_NE(std::ranges::find(argv, "-J"), argv.end());
            EXPECT_NE(std::ranges::find(argv, "--skip-download"), argv.end());
            return exited(0, {}, R"({"title":"Clip","ext":"mp4","filesize":42})");
        });
    VideoExtractorProvider provider(runner, "yt-dlp");
    const auto result = provider.probe(MediaRequest("https://vimeo.com/1"), context);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->size_bytes, 42u);
    EXPECT_EQ(result->suggested_name, "Clip.mp4");
}

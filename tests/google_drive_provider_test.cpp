#include <gtest/gtest.h>
#include "fakes.hpp"
#include "../libmediagrab/include/google_drive_provider.hpp"
#include "../libmediagrab/include/url.hpp"

using namespace mediagrab;
using namespace mediagrab::test;

TEST(DriveFileIdTest, ExtractsIdFromKnownShapes) {
    EXPECT_EQ(drive_file_id(*Url::parse("https://drive.google.com/file/d/1AbC-d_9/view?usp=sharing")), "1AbC-d_9");
    EXPECT_EQ(drive_file_id(*Url::parse("https://drive.google.com/open?id=XYZ123")), "XYZ123");
    EXPECT_EQ(drive_file_id(*Url::parse("https://drive.google.com/uc?export=download&id=Q1")), "Q1");
    EXPECT_FALSE(drive_file_id(*Url::parse("https://drive.google.com/drive/folders")).has_value());
    EXPECT_FALSE(drive_file_id(*Url::parse("https://drive.google.com/file/d//view")).has_value());
}

class GoogleDriveProviderTest : public ::testing::Test {
protected:
    GoogleDriveProviderTest() : http(std::make_shared<FakeHttpClient>()), provider(http) {}

    ErrorReport fetch_expecting_failure(const std::string& url) {
        try {
            (void)provider.fetch(MediaRequest(url), context);
        } catch (const FetchError& e) {
            return e.report();
        }
        ADD_FAILURE() << "fetch succeeded for " << url;
        return {};
    }

    std::shared_ptr<FakeHttpClient> http;
    GoogleDriveProvider provider;
    FetchContext context;
};

TEST_F(GoogleDriveProviderTest, DownloadsThroughExportUrl) {
    http->on("https://drive.google.com/uc?export=download&id=ABC123",
             {200, {{"Content-Type", "application/pdf"},
                    {"Content-Disposition", "attachment; filename=\"thesis.pdf\""}}, "%PDF-1.7"});

    RetrievedPayload payload = provider.fetch(
        MediaRequest("https://drive.google.com/file/d/ABC123/view?usp=sharing"), context);
    ASSERT_EQ(http->requests.size(), 1u);
    EXPECT_EQ(http->requests[0].url, drive_export_url("ABC123"));
    EXPECT_EQ(payload.source_provider, ProviderId::GoogleDrive);
    EXPECT_EQ(payload.suggested_name, "thesis.pdf");
    EXPECT_EQ(payload.declared_mime, "application/pdf");
}

TEST_F(GoogleDriveProviderTest, HtmlAnswerMeansAccessDenied) {
    http->on("https://drive.google.com/uc", {200, {{"Content-Type", "text/html; charset=utf-8"}}, "<html>"});
    const ErrorReport report = fetch_expecting_failure("https://drive.google.com/file/d/PRIVATE/view");
    EXPECT_EQ(report.kind, ErrorKind::AccessDenied);
    EXPECT_EQ(report.provider, ProviderId::GoogleDrive);
    EXPECT_FALSE(report.recoverable);
}

TEST_F(GoogleDriveProviderTest, LinkWithoutIdIsParsingError) {
    const ErrorReport report = fetch_expecting_failure("https://drive.google.com/drive/my-drive");
    EXPECT_EQ(report.kind, ErrorKind::ParsingError);
    EXPECT_FALSE(report.recoverable);
    EXPECT_TRUE(http->requests.empty());
}

TEST_F(GoogleDriveProviderTest, ErrorStatusIsNetworkError) {
    http->on("https://drive.google.com/uc", {404, {}, "missing"});
    EXPECT_EQ(fetch_expecting_failure("https://drive.google.com/file/d/GONE/view").kind, ErrorKind::NetworkError);
}

TEST_F(GoogleDriveProviderTest, HandlesOnlyDriveHosts) {
    EXPECT_TRUE(provider.handles_domain("drive.google.com"));
    EXPECT_FALSE(provider.handles_domain("docs.google.com"));
}

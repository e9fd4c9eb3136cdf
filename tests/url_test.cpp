#include <gtest/gtest.h>
#include "../libmediagrab/include/url.hpp"

using namespace mediagrab;

TEST(UrlTest, ParsesComponents) {
    const auto url = Url::parse("https://User:pw@WWW.Example.COM:8443/a/b.mp4?x=1&y=2");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->scheme(), "https");
    EXPECT_EQ(url->host(), "www.example.com");
    EXPECT_EQ(url->port(), 8443);
    EXPECT_EQ(url->path(), "/a/b.mp4");
    EXPECT_EQ(url->query(), "x=1&y=2");
    EXPECT_EQ(url->target(), "/a/b.mp4?x=1&y=2");
    EXPECT_EQ(url->bare_host(), "example.com");
}

TEST(UrlTest, RejectsNonHttpAndRelative) {
    EXPECT_FALSE(Url::parse("ftp://example.com/file").has_value());
    EXPECT_FALSE(Url::parse("/relative/path").has_value());
    EXPECT_FALSE(Url::parse("not a url").has_value());
    EXPECT_FALSE(Url::parse("https://").has_value());
}

TEST(UrlTest, DefaultsPathToRoot) {
    const auto url = Url::parse("http://example.com");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->path(), "/");
    EXPECT_FALSE(url->is_https());
}

TEST(UrlTest, ResolvesRedirectLocations) {
    const auto base = Url::parse("https://example.com/dir/page?q=1");
    ASSERT_TRUE(base.has_value());

    const auto absolute = base->resolve("http://cdn.example.net/file.bin");
    ASSERT_TRUE(absolute.has_value());
    EXPECT_EQ(absolute->host(), "cdn.example.net");

    const auto rooted = base->resolve("/other/file.bin");
    ASSERT_TRUE(rooted.has_value());
    EXPECT_EQ(rooted->to_string(), "https://example.com/other/file.bin");

    const auto relative = base->resolve("file.bin");
    ASSERT_TRUE(relative.has_value());
    EXPECT_EQ(relative->path(), "/dir/file.bin");

    const auto scheme_relative = base->resolve("//media.example.org/x.mp4");
    ASSERT_TRUE(scheme_relative.has_value());
    EXPECT_EQ(scheme_relative->scheme(), "https");
    EXPECT_EQ(scheme_relative->host(), "media.example.org");
}

TEST(UrlTest, LastSegmentAndQueryParam) {
    const auto url = Url::parse("https://drive.google.com/open?id=ABC%2D1&usp=sharing");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->query_param("id"), "ABC-1");
    EXPECT_FALSE(url->query_param("missing").has_value());

    const auto file = Url::parse("https://example.com/media/My%20Clip.mp4/");
    ASSERT_TRUE(file.has_value());
    EXPECT_EQ(file->last_segment(), "My%20Clip.mp4");
}

TEST(UrlTest, PercentCoding) {
    EXPECT_EQ(percent_decode("a%20b%2Fc"), "a b/c");
    EXPECT_EQ(percent_decode("a+b", true), "a b");
    EXPECT_EQ(percent_decode("a+b"), "a+b");
    EXPECT_EQ(percent_decode("bad%zz"), "bad%zz");
    EXPECT_EQ(percent_decode("caf%C3%A9"), "caf\xC3\xA9");
    EXPECT_EQ(percent_encode("https://x.com/a b?c=d"), "https%3A%2F%2Fx.com%2Fa%20b%3Fc%3Dd");
}

TEST(UrlTest, EscapesCharactersNotAllowedInRequestTarget) {
    const auto url = Url::parse("https://example.com/my file.mp4?title=a b");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->target().find(' '), std::string::npos);
    EXPECT_EQ(url->path(), "/my%20file.mp4");
    EXPECT_EQ(url->last_segment(), "my%20file.mp4");
    EXPECT_EQ(url->query_param("title"), "a b");
}

TEST(UrlTest, EscapesRawUtf8AndKeepsExistingEscapes) {
    const auto url = Url::parse("https://example.com/caf\xC3\xA9/clip%20one.mp4");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->path(), "/caf%C3%A9/clip%20one.mp4");
}

TEST(UrlTest, NormalizesHostAndDropsFragment) {
    const auto url = Url::parse("  HTTPS://Media.Example.com./v.mp4#t=10 ");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->scheme(), "https");
    EXPECT_EQ(url->host(), "media.example.com");
    EXPECT_EQ(url->port(), 443);
    EXPECT_EQ(url->host_header(), "media.example.com");
    EXPECT_EQ(url->to_string(), "https://media.example.com/v.mp4");
}

TEST(UrlTest, HostHeaderCarriesExplicitPort) {
    const auto url = Url::parse("http://example.com:8080/x");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->host_header(), "example.com:8080");
    EXPECT_FALSE(Url::parse("http://example.com:99999/x").has_value());
}

TEST(UrlTest, ResolvesRelativeLocationWithDotSegmentsAndSpaces) {
    const auto base = Url::parse("https://example.com/a/b/page");
    ASSERT_TRUE(base.has_value());
    const auto next = base->resolve("../files/new name.bin");
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->target(), "/a/files/new%20name.bin");

    const auto query_only = base->resolve("?page=2");
    ASSERT_TRUE(query_only.has_value());
    EXPECT_EQ(query_only->target(), "/a/b/page?page=2");
}

#include <gtest/gtest.h>
#include "../libmediagrab/include/cookie_jar.hpp"
#include "../libmediagrab/include/file_utils.hpp"
#include "../libmediagrab/include/url.hpp"

#include <fstream>

using namespace mediagrab;

namespace {

const std::string kJar =
    "# Netscape HTTP Cookie File\n"
    "\n"
    ".instagram.com\tTRUE\t/\tTRUE\t0\tsessionid\tS1\r\n"
    "#HttpOnly_.instagram.com\tTRUE\t/\tTRUE\t0\tcsrftoken\tC2\n"
    "www.example.com\tFALSE\t/private\tFALSE\t0\tpriv\tP\n"
    ".example.com\tTRUE\t/\tFALSE\t1\told\tO\n"
    "broken line without tabs\n";

} // namespace

TEST(CookieJarTest, ParsesNetscapeFormat) {
    const CookieJar jar = CookieJar::parse(kJar);
    ASSERT_EQ(jar.cookies().size(), 4u);
    EXPECT_EQ(jar.cookies()[0].domain, "instagram.com");
    EXPECT_TRUE(jar.cookies()[0].include_subdomains);
    EXPECT_TRUE(jar.cookies()[0].secure);
    EXPECT_EQ(jar.cookies()[0].value, "S1");
    EXPECT_EQ(jar.cookies()[1].name, "csrftoken");
}

TEST(CookieJarTest, HeaderMatchesDomainPathSecureAndExpiry) {
    const CookieJar jar = CookieJar::parse(kJar);
    EXPECT_EQ(jar.header_for(*Url::parse("https://www.instagram.com/p/X/")), "sessionid=S1; csrftoken=C2");
    EXPECT_FALSE(jar.header_for(*Url::parse("http://www.instagram.com/p/X/")).has_value());
    EXPECT_EQ(jar.header_for(*Url::parse("http://www.example.com/private/a")), "priv=P");
    EXPECT_FALSE(jar.header_for(*Url::parse("http://www.example.com/privateer")).has_value());
    EXPECT_FALSE(jar.header_for(*Url::parse("http://sub.www.example.com/private")).has_value());
    EXPECT_FALSE(jar.header_for(*Url::parse("https://notinstagram.com/")).has_value());
}

TEST(CookieJarTest, MissingFileIsNotAnError) {
    EXPECT_FALSE(CookieJar::load_if_present("/nonexistent/dir/cookies.txt").has_value());
    EXPECT_THROW((void)CookieJar::load("/nonexistent/dir/cookies.txt"), std::runtime_error);
}

TEST(CookieJarTest, CopyPreservesOriginalText) {
    const ScopedTempDir dir("cookietest");
    const auto source = dir.path() / "cookies.txt";
    {
        std::ofstream out(source, std::ios::binary);
        out << kJar;
    }
    const auto jar = CookieJar::load_if_present(source);
    ASSERT_TRUE(jar.has_value());

    const auto copy = dir.path() / "copy.txt";
    jar->write_copy(copy);
    std::ifstream in(copy, std::ios::binary);
    const std::string copied((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(copied, kJar);
}

TEST(CookieJarTest, ScopedTempDirIsRemoved) {
    std::filesystem::path path;
    {
        const ScopedTempDir dir("scoped");
        path = dir.path();
        EXPECT_TRUE(std::filesystem::is_directory(path));
        std::ofstream(path / "file.txt") << "x";
    }
    EXPECT_FALSE(std::filesystem::exists(path));
}

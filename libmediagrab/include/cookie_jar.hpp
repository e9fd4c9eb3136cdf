/**
 * @file cookie_jar.hpp
 * @brief Read-only Netscape cookie file, loaded once and shared by providers.
 */

#ifndef MEDIAGRAB_COOKIE_JAR_HPP
#define MEDIAGRAB_COOKIE_JAR_HPP

#include "url.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mediagrab {

struct Cookie {
    std::string domain;             ///< Without the leading dot
    bool include_subdomains = false;
    std::string path = "/";
    bool secure = false;
    std::int64_t expires = 0;       ///< Unix time, 0 for session cookies
    std::string name;
    std::string value;
};

/**
 * @brief Immutable cookie jar in the Netscape/Mozilla "cookies.txt" format.
 *
 * The jar never writes to the file it was loaded from; tools that need a
 * cookie file they may rewrite get a private copy through write_copy().
 */
class CookieJar {
public:
    /**
     * @brief Parse a cookie file.
     * @throws std::runtime_error if the file cannot be read.
     */
    static CookieJar load(const std::filesystem::path& path);

    /**
     * @brief Like load(), but a missing file yields std::nullopt.
     */
    static std::optional<CookieJar> load_if_present(const std::filesystem::path& path);

    /**
     * @brief Parse cookie file contents held in memory.
     */
    static CookieJar parse(std::string text);

    /// @return "name=value; ..." for cookies matching @p url, or std::nullopt if none match.
    [[nodiscard]] std::optional<std::string> header_for(const Url& url) const;

    /**
     * @brief Write the original file contents to @p destination.
     * @throws std::runtime_error on I/O failure.
     */
    void write_copy(const std::filesystem::path& destination) const;

    [[nodiscard]] const std::vector<Cookie>& cookies() const noexcept { return cookies_; }
    [[nodiscard]] bool empty() const noexcept { return cookies_.empty(); }

private:
    std::string raw_;
    std::vector<Cookie> cookies_;
};

} // namespace mediagrab

#endif // MEDIAGRAB_COOKIE_JAR_HPP

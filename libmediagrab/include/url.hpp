/**
 * @file url.hpp
 * @brief Absolute http(s) URL model on top of Boost.URL.
 */

#ifndef MEDIAGRAB_URL_HPP
#define MEDIAGRAB_URL_HPP

#include <boost/url/url.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace mediagrab {

/**
 * @brief Parsed absolute http or https URL.
 *
 * The stored URL is normalized once at parse time: scheme and host are
 * lowercased, userinfo, fragment and a trailing host dot are dropped, the
 * path is at least "/", and characters that may not appear in a URI
 * (spaces, non-ASCII bytes) are percent-encoded so target() is always a
 * valid HTTP request target.
 */
class Url {
public:
    /**
     * @brief Parse an absolute URL.
     * @return The URL, or std::nullopt when the scheme is not http(s),
     * the host is missing, or the port is not a number.
     */
    static std::optional<Url> parse(std::string_view text);

    /**
     * @brief Resolve a redirect target against this URL (RFC 3986 5.2).
     */
    [[nodiscard]] std::optional<Url> resolve(std::string_view reference) const;

    [[nodiscard]] std::string scheme() const;

    /// @return Host name or address, without IPv6 brackets.
    [[nodiscard]] std::string host() const;

    /// @return Explicit port, or 443/80 from the scheme.
    [[nodiscard]] std::uint16_t port() const noexcept;

    /// @return Percent-encoded path, never empty.
    [[nodiscard]] std::string path() const;

    /// @return Percent-encoded query without the '?'.
    [[nodiscard]] std::string query() const;

    [[nodiscard]] bool is_https() const noexcept { return url_.scheme_id() == boost::urls::scheme::https; }

    /// @return path plus "?query" when a query is present (HTTP request target).
    [[nodiscard]] std::string target() const;

    /// @return Value for the Host header: host, plus ":port" when not the default.
    [[nodiscard]] std::string host_header() const;

    /// @return Host with a leading "www." removed.
    [[nodiscard]] std::string bare_host() const;

    /// @return Last non-empty path segment, still percent-encoded.
    [[nodiscard]] std::string last_segment() const;

    /// @return First value of query parameter @p name, percent-decoded.
    [[nodiscard]] std::optional<std::string> query_param(std::string_view name) const;

    [[nodiscard]] std::string to_string() const;

private:
    explicit Url(boost::urls::url url) : url_(std::move(url)) {}

    boost::urls::url url_;
};

/**
 * @brief Decode %XX escapes.
 * @param plus_as_space Also turn '+' into ' ' (form encoding).
 * @return The decoded text, or @p text unchanged when it holds a malformed escape.
 */
[[nodiscard]] std::string percent_decode(std::string_view text, bool plus_as_space = false);

/**
 * @brief Encode every byte outside the RFC 3986 unreserved set.
 */
[[nodiscard]] std::string percent_encode(std::string_view text);

} // namespace mediagrab

#endif // MEDIAGRAB_URL_HPP

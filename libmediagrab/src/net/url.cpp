#include "../../include/url.hpp"
#include <boost/url.hpp>
#include <algorithm>
#include <cctype>

namespace mediagrab {

namespace {

// reserved and unreserved characters of RFC 3986 plus '%'; everything else gets escaped
constexpr boost::urls::grammar::lut_chars kUriChars(
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789"
    "-._~:/?#[]@!$&'()*+,;=%");

template <typename StringView>
std::string to_std(const StringView& s) {
    return {s.data(), s.size()};
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);
    return text;
}

// pasted links often carry spaces or raw UTF-8
std::string escape_illegal(const std::string_view text) {
    return boost::urls::encode(text, kUriChars);
}

} // namespace

std::optional<Url> Url::parse(const std::string_view text) {
    const std::string escaped = escape_illegal(trim(text));
    const auto parsed = boost::urls::parse_uri(escaped);
    if (parsed.has_error()) return std::nullopt;

    boost::urls::url url(*parsed);
    url.normalize_scheme();
    if (url.scheme_id() != boost::urls::scheme::http && url.scheme_id() != boost::urls::scheme::https) {
        return std::nullopt;
    }
    if (!url.has_authority() || url.encoded_host().empty()) return std::nullopt;

    url.remove_userinfo();
    url.remove_fragment();
    url.normalize_authority();

    if (url.host_type() == boost::urls::host_type::name) {
        std::string host = to_std(url.encoded_host());
        std::ranges::transform(host, host.begin(),
            [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        while (!host.empty() && host.back() == '.') host.pop_back();
        if (host.empty()) return std::nullopt;
        url.set_encoded_host(host);
    }

    if (url.has_port()) {
        if (url.port().empty()) {
            url.remove_port();
        } else if (url.port_number() == 0) {
            return std::nullopt;
        }
    }

    if (url.encoded_path().empty()) url.set_encoded_path("/");
    return Url(std::move(url));
}

std::optional<Url> Url::resolve(const std::string_view reference) const {
    const std::string escaped = escape_illegal(trim(reference));
    const auto ref = boost::urls::parse_uri_reference(escaped);
    if (ref.has_error()) return std::nullopt;

    boost::urls::url resolved;
    if (boost::urls::resolve(url_, *ref, resolved).has_error()) return std::nullopt;
    return parse(to_std(resolved.buffer()));
}

std::string Url::scheme() const {
    return to_std(url_.scheme());
}

std::string Url::host() const {
    return url_.host_address();
}

std::uint16_t Url::port() const noexcept {
    if (url_.has_port()) return url_.port_number();
    return is_https() ? 443 : 80;
}

std::string Url::path() const {
    return to_std(url_.encoded_path());
}

std::string Url::query() const {
    return to_std(url_.encoded_query());
}

std::string Url::target() const {
    return to_std(url_.encoded_target());
}

std::string Url::host_header() const {
    return to_std(url_.encoded_host_and_port());
}

std::string Url::bare_host() const {
    std::string host = this->host();
    if (host.starts_with("www.")) host.erase(0, 4);
    return host;
}

std::string Url::last_segment() const {
    const std::string path = to_std(url_.encoded_path());
    std::string_view p = path;
    while (!p.empty() && p.back() == '/') p.remove_suffix(1);
    const auto slash = p.rfind('/');
    return std::string(slash == std::string_view::npos ? p : p.substr(slash + 1));
}

std::optional<std::string> Url::query_param(const std::string_view name) const {
    for (const auto& param : url_.params()) {
        if (param.key == name) {
            return param.has_value ? param.value : std::string{};
        }
    }
    return std::nullopt;
}

std::string Url::to_string() const {
    return to_std(url_.buffer());
}

std::string percent_decode(const std::string_view text, const bool plus_as_space) {
    const auto checked = boost::urls::make_pct_string_view(text);
    if (checked.has_error()) return std::string(text);
    const boost::urls::decode_view decoded(*checked, boost::urls::encoding_opts(plus_as_space));
    return std::string(decoded.begin(), decoded.end());
}

std::string percent_encode(const std::string_view text) {
    return boost::urls::encode(text, boost::urls::unreserved_chars);
}

} // namespace mediagrab

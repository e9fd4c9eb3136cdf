#include "../../include/generic_http_provider.hpp"
#include "../../include/filename_sanitizer.hpp"
#include "../../include/logger.hpp"
#include "../../include/media_type.hpp"
#include <algorithm>
#include <cctype>

namespace mediagrab {

namespace {

constexpr std::string_view kTag = "generic_http";

std::string lower(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(),
        [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

bool usable_name(const std::string_view name) {
    return name.find('.') != std::string_view::npos && !name.ends_with('.');
}

// value of parameter `key` in a header of the form `type; a=b; c="d"`
std::optional<std::string> disposition_param(const std::string_view header, const std::string_view key) {
    std::size_t pos = 0;
    while (pos < header.size()) {
        // skip to the next parameter, honoring quoted strings
        bool quoted = false;
        std::size_t end = pos;
        for (; end < header.size(); ++end) {
            if (header[end] == '"' && (end == 0 || header[end - 1] != '\\')) quoted = !quoted;
            else if (header[end] == ';' && !quoted) break;
        }
        const std::string_view part = trim(header.substr(pos, end - pos));
        const auto eq = part.find('=');
        if (eq != std::string_view::npos && lower(trim(part.substr(0, eq))) == key) {
            std::string_view value = trim(part.substr(eq + 1));
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                value = value.substr(1, value.size() - 2);
            }
            return std::string(value);
        }
        pos = end + 1;
    }
    return std::nullopt;
}

class ResponseBodySource final : public PayloadSource {
public:
    ResponseBodySource(std::unique_ptr<IResponseStream> response, const ProviderId owner)
        : response_(std::move(response)), owner_(owner) {}

protected:
    std::size_t read_some(const std::span<char> buffer) override {
        try {
            return response_->read(buffer);
        } catch (const TransportError& e) {
            throw transport_failure(e, owner_, "reading the response body");
        }
    }

private:
    std::unique_ptr<IResponseStream> response_;
    ProviderId owner_;
};

std::optional<std::string> suggested_name_for(const HttpResponseHead& head, const Url& source_url) {
    if (const auto disposition = head.header("Content-Disposition")) {
        if (auto name = filename_from_content_disposition(*disposition)) return name;
    }
    if (auto name = filename_from_url_path(source_url)) return name;
    if (const auto final_url = Url::parse(head.final_url)) {
        if (auto name = filename_from_url_path(*final_url)) return name;
    }
    return std::nullopt;
}

} // namespace

std::optional<std::string> filename_from_content_disposition(const std::string_view header) {
    if (auto extended = disposition_param(header, "filename*")) {
        // RFC 5987: charset'language'percent-encoded
        std::string_view value = *extended;
        if (const auto tick = value.find('\''); tick != std::string_view::npos) {
            const auto second = value.find('\'', tick + 1);
            value.remove_prefix(second == std::string_view::npos ? tick + 1 : second + 1);
        }
        std::string decoded = percent_decode(value);
        if (usable_name(decoded)) return decoded;
    }
    if (auto plain = disposition_param(header, "filename")) {
        std::string decoded = percent_decode(*plain);
        if (usable_name(decoded)) return decoded;
    }
    return std::nullopt;
}

std::optional<std::string> filename_from_url_path(const Url& url) {
    const std::string segment = percent_decode(url.last_segment());
    if (segment.find('.') == std::string::npos) return std::nullopt;
    return segment;
}

RetrievedPayload GenericHttpProvider::take_over(std::unique_ptr<IResponseStream> response,
                                                const ProviderId owner,
                                                const Url& source_url,
                                                const FetchContext& context) {
    const HttpResponseHead& head = response->head();
    if (!head.ok()) {
        throw FetchError(ErrorKind::NetworkError, owner,
                         "HTTP status " + std::to_string(head.status) + " from " + head.final_url);
    }
    enforce_size_limit(head.content_length, context, owner);

    RetrievedPayload payload;
    payload.source_provider = owner;
    payload.suggested_name = suggested_name_for(head, source_url).value_or(std::string(kFallbackFilename));
    if (const auto content_type = head.header("Content-Type")) {
        if (std::string mime = normalize_mime(*content_type); !mime.empty()) {
            payload.declared_mime = std::move(mime);
        }
    }
    payload.size_bytes = head.content_length;

    Logger::log(LogLevel::Debug,
                "streaming '" + payload.suggested_name + "' (" +
                (payload.size_bytes ? std::to_string(*payload.size_bytes) + " bytes" : std::string("unknown size")) + ")",
                kTag);

    payload.body = std::make_unique<ResponseBodySource>(std::move(response), owner);
    payload.body->set_limit(context.max_payload_bytes, owner);
    return payload;
}

RetrievedPayload GenericHttpProvider::fetch(const MediaRequest& request, const FetchContext& context) {
    throw_if_cancelled(context, id());
    const auto url = Url::parse(request.raw_url());
    if (!url) {
        throw FetchError(ErrorKind::InvalidURL, id(), "not an absolute http(s) URL: " + request.raw_url());
    }

    Logger::log(LogLevel::Info, "direct download of " + Logger::clip(url->to_string()), kTag);
    std::unique_ptr<IResponseStream> response;
    try {
        response = http_->open(make_http_request(url->to_string(), context));
    } catch (const TransportError& e) {
        throw transport_failure(e, id(), "requesting " + url->host());
    }
    return take_over(std::move(response), id(), *url, context);
}

std::optional<ProbeResult> GenericHttpProvider::probe(const MediaRequest& request, const FetchContext& context) {
    const auto url = Url::parse(request.raw_url());
    if (!url) return std::nullopt;

    try {
        const auto response = http_->open(make_http_request(url->to_string(), context, "HEAD"));
        const HttpResponseHead& head = response->head();
        if (!head.ok()) {
            Logger::log(LogLevel::Debug, "HEAD answered " + std::to_string(head.status), kTag);
            return std::nullopt;
        }
        ProbeResult result;
        result.provider = id();
        result.size_bytes = head.content_length;
        if (auto name = suggested_name_for(head, *url)) {
            result.suggested_name = sanitize_filename(*name);
        }
        return result;
    } catch (const TransportError& e) {
        Logger::log(LogLevel::Debug, std::string("probe failed: ") + e.what(), kTag);
        return std::nullopt;
    }
}

} // namespace mediagrab

#include "../../include/short_video_provider.hpp"
#include "../../include/generic_http_provider.hpp"
#include "../../include/logger.hpp"
#include "../../include/url.hpp"

#include <nlohmann/json.hpp>

namespace mediagrab {

namespace {

constexpr std::string_view kTag = "short_video";

std::string string_or(const nlohmann::json& object, const char* key, std::string fallback) {
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string() || it->get_ref<const std::string&>().empty()) {
        return fallback;
    }
    return it->get<std::string>();
}

} // namespace

ShortVideoInfo parse_short_video_response(const std::string_view body) {
    const auto provider = ProviderId::ShortVideoApi;
    const nlohmann::json doc = nlohmann::json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        throw FetchError(ErrorKind::ParsingError, provider,
                         "API response is not a JSON object: " + Logger::clip(body, 120), true);
    }

    const auto code = doc.find("code");
    if (code == doc.end() || !code->is_number_integer()) {
        throw FetchError(ErrorKind::ParsingError, provider, "API response has no status code", true);
    }
    if (code->get<long long>() != 0) {
        throw FetchError(ErrorKind::ProviderRejected, provider,
                         "API refused the link: " + string_or(doc, "msg", "unknown API error"));
    }

    const auto data = doc.find("data");
    if (data == doc.end() || !data->is_object()) {
        throw FetchError(ErrorKind::ProviderRejected, provider, "API returned no video data");
    }

    ShortVideoInfo info;
    info.play_url = string_or(*data, "play", "");
    if (info.play_url.empty()) {
        throw FetchError(ErrorKind::ProviderRejected, provider, "API returned no playable video URL");
    }
    info.title = string_or(*data, "title", info.title);
    if (const auto author = data->find("author"); author != data->end() && author->is_object()) {
        info.author = string_or(*author, "unique_id", info.author);
    }
    return info;
}

bool ShortVideoProvider::handles_domain(const std::string_view host) const noexcept {
    return host.find("tiktok.com") != std::string_view::npos;
}

RetrievedPayload ShortVideoProvider::fetch(const MediaRequest& request, const FetchContext& context) {
    throw_if_cancelled(context, id());
    const std::string api_url = api_endpoint_ + (api_endpoint_.find('?') == std::string::npos ? "?" : "&") +
                                "url=" + percent_encode(request.raw_url());
    Logger::log(LogLevel::Info, "resolving video through " + api_endpoint_, kTag);

    std::string body;
    try {
        const auto response = http_->open(make_http_request(api_url, context));
        if (!response->head().ok()) {
            throw FetchError(ErrorKind::NetworkError, id(),
                             "API answered with HTTP status " + std::to_string(response->head().status));
        }
        body = read_text(*response);
    } catch (const TransportError& e) {
        throw transport_failure(e, id(), "contacting the short-video API");
    }

    const ShortVideoInfo info = parse_short_video_response(body);
    Logger::log(LogLevel::Debug, "API resolved '" + Logger::clip(info.title, 80) + "' by " + info.author, kTag);

    const auto media_url = Url::parse(info.play_url);
    if (!media_url) {
        throw FetchError(ErrorKind::ParsingError, id(),
                         "API returned an invalid video URL: " + Logger::clip(info.play_url, 120), true);
    }

    std::unique_ptr<IResponseStream> response;
    try {
        response = http_->open(make_http_request(media_url->to_string(), context));
    } catch (const TransportError& e) {
        throw transport_failure(e, id(), "downloading the video");
    }

    RetrievedPayload payload = GenericHttpProvider::take_over(std::move(response), id(), *media_url, context);
    payload.suggested_name = info.author + "_" + info.title + ".mp4";
    payload.declared_mime = "video/mp4";
    return payload;
}

} // namespace mediagrab

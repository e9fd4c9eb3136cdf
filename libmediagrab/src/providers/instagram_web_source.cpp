#include "../../include/post_metadata_source.hpp"
#include "../../include/logger.hpp"
#include "../../include/url.hpp"

#include <nlohmann/json.hpp>

namespace mediagrab {

namespace {

constexpr std::string_view kTag = "instagram";
constexpr std::string_view kWebAppId = "936619743392459";

using nlohmann::json;

std::optional<std::string> string_at(const json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) return std::nullopt;
    std::string value = it->get<std::string>();
    if (value.empty()) return std::nullopt;
    return value;
}

std::optional<std::int64_t> integer_at(const json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end() || !it->is_number_integer()) return std::nullopt;
    return it->get<std::int64_t>();
}

// first url of an array of {url: ...} objects
std::optional<std::string> first_url(const json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end() || !it->is_array() || it->empty() || !it->front().is_object()) return std::nullopt;
    return string_at(it->front(), "url");
}

void read_item(const json& item, PostMetadata& post) {
    const json* media = &item;
    // carousel: take the first child
    if (const auto children = item.find("carousel_media");
        children != item.end() && children->is_array() && !children->empty()) {
        media = &children->front();
    }

    post.video_url = first_url(*media, "video_versions");
    if (const auto images = media->find("image_versions2"); images != media->end() && images->is_object()) {
        post.image_url = first_url(*images, "candidates");
    }
    const auto media_type = integer_at(*media, "media_type");
    post.is_video = media_type ? *media_type == 2 : post.video_url.has_value();

    if (const auto user = item.find("user"); user != item.end() && user->is_object()) {
        if (auto name = string_at(*user, "username")) post.owner = *name;
    }
    post.taken_at = integer_at(item, "taken_at");
}

void read_shortcode_media(const json& media, PostMetadata& post) {
    const json* node = &media;
    if (const auto sidecar = media.find("edge_sidecar_to_children"); sidecar != media.end() && sidecar->is_object()) {
        const auto edges = sidecar->find("edges");
        if (edges != sidecar->end() && edges->is_array() && !edges->empty() && edges->front().contains("node")) {
            node = &edges->front().at("node");
        }
    }

    const auto is_video = node->find("is_video");
    post.is_video = is_video != node->end() && is_video->is_boolean() && is_video->get<bool>();
    post.video_url = string_at(*node, "video_url");
    post.display_url = string_at(*node, "display_url");

    if (const auto owner = media.find("owner"); owner != media.end() && owner->is_object()) {
        if (auto name = string_at(*owner, "username")) post.owner = *name;
    }
    post.taken_at = integer_at(media, "taken_at_timestamp");
}

} // namespace

std::optional<ErrorKind> classify_instagram_status(const int status) noexcept {
    if (status >= 200 && status < 300) return std::nullopt;
    if (status == 401 || status == 403) return ErrorKind::LoginRequired;
    if (status == 404) return ErrorKind::NotFound;
    if (status == 429 || status >= 500) return ErrorKind::ProviderUnavailable;
    return ErrorKind::NetworkError;
}

PostMetadata parse_instagram_post(const std::string_view body, const std::string& shortcode) {
    const auto provider = ProviderId::SocialPost;
    const json doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        if (body.find("<html") != std::string_view::npos || body.find("<!DOCTYPE") != std::string_view::npos) {
            throw FetchError(ErrorKind::LoginRequired, provider,
                             "Instagram served a web page instead of post data; the post is private or requires login");
        }
        throw FetchError(ErrorKind::ParsingError, provider, "post data is not JSON: " + Logger::clip(body, 120));
    }

    if (const auto login = doc.find("require_login"); login != doc.end() && login->is_boolean() && login->get<bool>()) {
        throw FetchError(ErrorKind::LoginRequired, provider, "Instagram requires login to view this post");
    }

    PostMetadata post;
    post.shortcode = shortcode;

    if (const auto items = doc.find("items"); items != doc.end() && items->is_array() && !items->empty()) {
        read_item(items->front(), post);
        return post;
    }
    if (const auto graphql = doc.find("graphql"); graphql != doc.end() && graphql->is_object()) {
        if (const auto media = graphql->find("shortcode_media"); media != graphql->end() && media->is_object()) {
            read_shortcode_media(*media, post);
            return post;
        }
    }
    throw FetchError(ErrorKind::ParsingError, provider, "post data has no recognizable media section");
}

PostMetadata InstagramWebSource::lookup(const std::string& shortcode, const FetchContext& context) {
    const auto provider = ProviderId::SocialPost;
    const std::string endpoint = "https://www.instagram.com/p/" + shortcode + "/?__a=1&__d=dis";

    HttpRequest request = make_http_request(endpoint, context);
    request.headers.emplace_back("X-IG-App-ID", std::string(kWebAppId));
    request.headers.emplace_back("Accept", "application/json");
    if (context.credential) {
        if (auto cookies = context.credential->header_for(*Url::parse(endpoint))) {
            request.headers.emplace_back("Cookie", std::move(*cookies));
        }
    }

    try {
        const auto response = http_->open(request);
        const HttpResponseHead& head = response->head();
        if (const auto kind = classify_instagram_status(head.status)) {
            throw FetchError(*kind, provider,
                             "Instagram answered HTTP " + std::to_string(head.status) + " for post " + shortcode);
        }
        if (head.final_url.find("/accounts/login") != std::string::npos) {
            throw FetchError(ErrorKind::LoginRequired, provider, "Instagram redirected to the login page");
        }
        const std::string body = read_text(*response);
        Logger::log(LogLevel::Debug, "post " + shortcode + ": " + std::to_string(body.size()) + " bytes of metadata", kTag);
        return parse_instagram_post(body, shortcode);
    } catch (const TransportError& e) {
        throw transport_failure(e, provider, "fetching post metadata");
    }
}

} // namespace mediagrab

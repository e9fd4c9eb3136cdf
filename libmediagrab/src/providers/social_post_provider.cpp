#include "../../include/social_post_provider.hpp"
#include "../../include/generic_http_provider.hpp"
#include "../../include/logger.hpp"

#include <array>
#include <chrono>
#include <ctime>

namespace mediagrab {

namespace {

constexpr std::string_view kTag = "social_post";

bool is_shortcode_char(const char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '_';
}

std::string utc_date(const std::int64_t unix_time) {
    const auto t = static_cast<std::time_t>(unix_time);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::array<char, 16> buf{};
    std::strftime(buf.data(), buf.size(), "%Y%m%d", &tm);
    return buf.data();
}

} // namespace

std::optional<std::string> post_shortcode(const Url& url) {
    static constexpr std::array<std::string_view, 3> kMarkers = {"/p/", "/reel/", "/tv/"};
    const std::string encoded_path = url.path();
    const std::string_view path = encoded_path;
    for (const auto marker : kMarkers) {
        const auto pos = path.find(marker);
        if (pos == std::string_view::npos) continue;
        std::string_view rest = path.substr(pos + marker.size());
        std::size_t len = 0;
        while (len < rest.size() && is_shortcode_char(rest[len])) ++len;
        if (len > 0) return std::string(rest.substr(0, len));
    }
    return std::nullopt;
}

std::optional<std::string> select_post_media(const PostMetadata& post) {
    if (post.is_video) {
        if (post.video_url) return post.video_url;
        return post.display_url;
    }
    if (post.image_url) return post.image_url;
    return post.display_url;
}

std::string post_filename(const PostMetadata& post) {
    const std::int64_t taken = post.taken_at.value_or(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
    const std::string owner = post.owner.empty() ? "instagram" : post.owner;
    return owner + "_" + post.shortcode + "_" + utc_date(taken) + (post.is_video ? ".mp4" : ".jpg");
}

bool SocialPostProvider::handles_domain(const std::string_view host) const noexcept {
    return host.find("instagram.com") != std::string_view::npos;
}

RetrievedPayload SocialPostProvider::fetch(const MediaRequest& request, const FetchContext& context) {
    throw_if_cancelled(context, id());
    const auto url = Url::parse(request.raw_url());
    const auto shortcode = url ? post_shortcode(*url) : std::nullopt;
    if (!shortcode) {
        throw FetchError(ErrorKind::ParsingError, id(),
                         "not an Instagram post, reel or tv URL: " + request.raw_url());
    }

    Logger::log(LogLevel::Info, "looking up post " + *shortcode +
                (context.credential ? " with cookies" : " anonymously"), kTag);
    const PostMetadata post = source_->lookup(*shortcode, context);

    const auto media_url = select_post_media(post);
    const auto media = media_url ? Url::parse(*media_url) : std::nullopt;
    if (!media) {
        throw FetchError(ErrorKind::NoArtifactProduced, id(), "post " + *shortcode + " has no downloadable media");
    }

    Logger::log(LogLevel::Debug, std::string(post.is_video ? "video" : "image") + " post by " + post.owner, kTag);
    std::unique_ptr<IResponseStream> response;
    try {
        response = http_->open(make_http_request(media->to_string(), context));
    } catch (const TransportError& e) {
        throw transport_failure(e, id(), "downloading the post media");
    }

    RetrievedPayload payload = GenericHttpProvider::take_over(std::move(response), id(), *media, context);
    payload.suggested_name = post_filename(post);
    payload.declared_mime = post.is_video ? "video/mp4" : "image/jpeg";
    return payload;
}

} // namespace mediagrab

#include "../../include/google_drive_provider.hpp"
#include "../../include/generic_http_provider.hpp"
#include "../../include/logger.hpp"
#include "../../include/media_type.hpp"
#include <algorithm>

namespace mediagrab {

namespace {

constexpr std::string_view kTag = "google_drive";

bool is_id_char(const char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '_';
}

bool is_valid_id(const std::string_view id) {
    return !id.empty() && std::ranges::all_of(id, is_id_char);
}

} // namespace

std::optional<std::string> drive_file_id(const Url& url) {
    const std::string encoded_path = url.path();
    const std::string_view path = encoded_path;
    if (const auto marker = path.find("/d/"); marker != std::string_view::npos) {
        std::string_view id = path.substr(marker + 3);
        id = id.substr(0, id.find('/'));
        if (is_valid_id(id)) return std::string(id);
        return std::nullopt;
    }
    if (auto id = url.query_param("id"); id && is_valid_id(*id)) {
        return id;
    }
    return std::nullopt;
}

std::string drive_export_url(const std::string& file_id) {
    return "https://drive.google.com/uc?export=download&id=" + file_id + "&confirm=t";
}

bool GoogleDriveProvider::handles_domain(const std::string_view host) const noexcept {
    return host.find("drive.google.com") != std::string_view::npos;
}

RetrievedPayload GoogleDriveProvider::fetch(const MediaRequest& request, const FetchContext& context) {
    throw_if_cancelled(context, id());
    const auto url = Url::parse(request.raw_url());
    const auto file_id = url ? drive_file_id(*url) : std::nullopt;
    if (!file_id) {
        throw FetchError(ErrorKind::ParsingError, id(),
                         "could not find a file id in the Google Drive link " + request.raw_url());
    }

    const std::string export_url = drive_export_url(*file_id);
    Logger::log(LogLevel::Info, "Drive file " + *file_id + " via export URL", kTag);

    std::unique_ptr<IResponseStream> response;
    try {
        response = http_->open(make_http_request(export_url, context));
    } catch (const TransportError& e) {
        throw transport_failure(e, id(), "requesting the Drive export URL");
    }

    const auto content_type = response->head().header("Content-Type");
    if (response->head().ok() && content_type && normalize_mime(*content_type) == "text/html") {
        throw FetchError(ErrorKind::AccessDenied, id(),
                         "Google Drive answered with a web page: the file requires a login or confirmation, "
                         "or is not shared publicly");
    }
    return GenericHttpProvider::take_over(std::move(response), id(), *Url::parse(export_url), context);
}

} // namespace mediagrab

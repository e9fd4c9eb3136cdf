#include "../../include/provider.hpp"

namespace mediagrab {

HttpRequest make_http_request(std::string url, const FetchContext& context, std::string method) {
    HttpRequest request;
    request.method = std::move(method);
    request.url = std::move(url);
    request.timeout = context.network_timeout;
    request.stop = context.stop;
    if (!context.user_agent.empty()) {
        request.headers.emplace_back("User-Agent", context.user_agent);
    }
    return request;
}

FetchError transport_failure(const TransportError& error, const ProviderId provider, const std::string_view what) {
    if (error.reason() == TransportError::Reason::Cancelled) {
        return FetchError(ErrorKind::Cancelled, provider, "cancelled while " + std::string(what));
    }
    return FetchError(ErrorKind::NetworkError, provider, std::string(what) + ": " + error.what());
}

void enforce_size_limit(const std::optional<std::uint64_t> announced,
                        const FetchContext& context,
                        const ProviderId provider) {
    if (context.max_payload_bytes == 0 || !announced || *announced <= context.max_payload_bytes) return;
    throw FetchError(ErrorKind::PayloadTooLarge, provider,
                     "announced size of " + std::to_string(*announced) +
                     " bytes exceeds the maximum of " + std::to_string(context.max_payload_bytes) + " bytes");
}

void throw_if_cancelled(const FetchContext& context, const ProviderId provider) {
    if (context.stop.stop_requested()) {
        throw FetchError(ErrorKind::Cancelled, provider, "cancelled by caller");
    }
}

} // namespace mediagrab

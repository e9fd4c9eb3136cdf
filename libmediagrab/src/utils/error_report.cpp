#include "../../include/error_report.hpp"
#include "../../include/logger.hpp"

namespace mediagrab {

std::string_view to_string(const ProviderId id) noexcept {
    switch (id) {
        case ProviderId::GenericHttp:    return "GenericHttp";
        case ProviderId::GoogleDrive:    return "GoogleDrive";
        case ProviderId::ShortVideoApi:  return "ShortVideoApi";
        case ProviderId::SocialPost:     return "SocialPost";
        case ProviderId::VideoExtractor: return "VideoExtractor";
    }
    return "Unknown";
}

std::string_view to_string(const ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidURL:          return "InvalidURL";
        case ErrorKind::ParsingError:        return "ParsingError";
        case ErrorKind::UnsupportedURL:      return "UnsupportedURL";
        case ErrorKind::AccessDenied:        return "AccessDenied";
        case ErrorKind::LoginRequired:       return "LoginRequired";
        case ErrorKind::NotFound:            return "NotFound";
        case ErrorKind::ProviderRejected:    return "ProviderRejected";
        case ErrorKind::ProviderUnavailable: return "ProviderUnavailable";
        case ErrorKind::NetworkError:        return "NetworkError";
        case ErrorKind::NoArtifactProduced:  return "NoArtifactProduced";
        case ErrorKind::PayloadTooLarge:     return "PayloadTooLarge";
        case ErrorKind::Cancelled:           return "Cancelled";
        case ErrorKind::Unknown:             return "Unknown";
    }
    return "Unknown";
}

bool is_recoverable_by_default(const ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::UnsupportedURL:
        case ErrorKind::ProviderRejected:
        case ErrorKind::ProviderUnavailable:
        case ErrorKind::NetworkError:
            return true;
        case ErrorKind::InvalidURL:
        case ErrorKind::ParsingError:
        case ErrorKind::AccessDenied:
        case ErrorKind::LoginRequired:
        case ErrorKind::NotFound:
        case ErrorKind::NoArtifactProduced:
        case ErrorKind::PayloadTooLarge:
        case ErrorKind::Cancelled:
        case ErrorKind::Unknown:
            return false;
    }
    return false;
}

ErrorReport ErrorReport::make(const ErrorKind kind,
                              const std::optional<ProviderId> provider,
                              const std::string_view message) {
    return make(kind, provider, message, is_recoverable_by_default(kind));
}

ErrorReport ErrorReport::make(const ErrorKind kind,
                              const std::optional<ProviderId> provider,
                              const std::string_view message,
                              const bool recoverable) {
    ErrorReport r;
    r.kind = kind;
    r.provider = provider;
    r.human_message = Logger::clip(message, kMaxMessageLength);
    r.recoverable = recoverable;
    return r;
}

std::string ErrorReport::describe() const {
    std::string out(to_string(kind));
    if (provider) {
        out += " [";
        out += to_string(*provider);
        out += "]";
    }
    if (!human_message.empty()) {
        out += ": ";
        out += human_message;
    }
    return out;
}

FetchError::FetchError(ErrorReport report)
    : std::runtime_error(report.describe()), report_(std::move(report)) {}

FetchError::FetchError(const ErrorKind kind,
                       const std::optional<ProviderId> provider,
                       const std::string_view message)
    : FetchError(ErrorReport::make(kind, provider, message)) {}

FetchError::FetchError(const ErrorKind kind,
                       const std::optional<ProviderId> provider,
                       const std::string_view message,
                       const bool recoverable)
    : FetchError(ErrorReport::make(kind, provider, message, recoverable)) {}

} // namespace mediagrab

/**
 * @file error_report.hpp
 * @brief Error taxonomy shared by every provider and by the orchestrator.
 */

#ifndef MEDIAGRAB_ERROR_REPORT_HPP
#define MEDIAGRAB_ERROR_REPORT_HPP

#include "media_types.hpp"
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace mediagrab {

/**
 * @brief Classification of a failed retrieval.
 *
 * The kind decides, through its default recoverability, whether the
 * orchestrator moves on to the next candidate provider.
 */
enum class ErrorKind {
    InvalidURL,          ///< Not an absolute http(s) URL
    ParsingError,        ///< URL shape or upstream response could not be parsed
    UnsupportedURL,      ///< Extractor does not know the site
    AccessDenied,        ///< Upstream refused access (403, confirmation page)
    LoginRequired,       ///< Content needs an authenticated session
    NotFound,            ///< Content does not exist (404-equivalent)
    ProviderRejected,    ///< Third-party API answered with a failure status
    ProviderUnavailable, ///< Transient upstream trouble (5xx, rate limit, tool missing)
    NetworkError,        ///< Transport failure or non-2xx status
    NoArtifactProduced,  ///< Retrieval finished without producing media
    PayloadTooLarge,     ///< Configured maximum size exceeded
    Cancelled,           ///< Caller requested a stop
    Unknown              ///< Anything that could not be classified
};

/// @return Stable name of an ErrorKind (e.g. "LoginRequired").
[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

/// @return Whether a failure of this kind lets the orchestrator try the next candidate.
[[nodiscard]] bool is_recoverable_by_default(ErrorKind kind) noexcept;

/**
 * @brief Normalized description of one failed retrieval attempt.
 */
struct ErrorReport {
    ErrorKind kind = ErrorKind::Unknown;
    std::optional<ProviderId> provider; ///< Empty for failures before any provider ran
    std::string human_message;          ///< Cause text, bounded in length
    bool recoverable = false;

    ///< Upper bound for human_message, longer causes are cut and marked with "...".
    static constexpr std::size_t kMaxMessageLength = 300;

    /**
     * @brief Builds a report using the default recoverability of @p kind.
     */
    static ErrorReport make(ErrorKind kind,
                            std::optional<ProviderId> provider,
                            std::string_view message);

    /**
     * @brief Builds a report with an explicit recoverability.
     */
    static ErrorReport make(ErrorKind kind,
                            std::optional<ProviderId> provider,
                            std::string_view message,
                            bool recoverable);

    /// @return "Kind: message" with the provider name when known.
    [[nodiscard]] std::string describe() const;
};

/**
 * @brief Exception carrying an ErrorReport.
 *
 * Providers throw it from fetch(); the orchestrator catches it and decides
 * between fallback and termination; route() rethrows the final one.
 */
class FetchError : public std::runtime_error {
public:
    explicit FetchError(ErrorReport report);

    FetchError(ErrorKind kind, std::optional<ProviderId> provider, std::string_view message);

    FetchError(ErrorKind kind, std::optional<ProviderId> provider, std::string_view message, bool recoverable);

    [[nodiscard]] const ErrorReport& report() const noexcept { return report_; }

private:
    ErrorReport report_;
};

} // namespace mediagrab

#endif // MEDIAGRAB_ERROR_REPORT_HPP

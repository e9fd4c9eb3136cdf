/**
 * @file video_extractor_provider.hpp
 * @brief The long tail of video and audio sites, handled by the yt-dlp executable.
 */

#ifndef MEDIAGRAB_VIDEO_EXTRACTOR_PROVIDER_HPP
#define MEDIAGRAB_VIDEO_EXTRACTOR_PROVIDER_HPP

#include "process_runner.hpp"
#include "provider.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mediagrab {

///< Format selection: best video plus best audio, else the best single file.
inline constexpr std::string_view kExtractorFormat = "bv*+ba/b";

/**
 * @brief Translates the diagnostics of a failed yt-dlp run into an ErrorReport.
 *
 * @param diagnostics stderr of the run.
 * @param credential_supplied Whether cookies were passed; a 403 is only
 *        worth a fallback when they were not.
 */
[[nodiscard]] ErrorReport classify_extractor_failure(std::string_view diagnostics, bool credential_supplied);

/**
 * @brief Size estimate and filename from the `yt-dlp -J` info document.
 *
 * The size is filesize_approx, else filesize, else the sum over
 * requested_formats. The name is "title.ext".
 * @return std::nullopt when the document is not valid JSON.
 */
[[nodiscard]] std::optional<ProbeResult> parse_extractor_info(std::string_view json_text);

class VideoExtractorProvider final : public IProvider {
public:
    VideoExtractorProvider(std::shared_ptr<IProcessRunner> runner, std::string executable)
        : runner_(std::move(runner)), executable_(std::move(executable)) {}

    [[nodiscard]] ProviderId id() const noexcept override { return ProviderId::VideoExtractor; }
    [[nodiscard]] std::string_view get_name() const noexcept override { return "Video Extractor (yt-dlp)"; }

    [[nodiscard]] bool handles_domain(std::string_view host) const noexcept override;
    [[nodiscard]] bool requires_credential() const noexcept override { return true; }
    [[nodiscard]] bool supports_streaming_probe() const noexcept override { return true; }

    /**
     * @brief Downloads into a scoped temporary directory and loads the produced file.
     *
     * yt-dlp rewrites the cookie file it is given, so it receives a private
     * copy of the jar inside the same temporary directory.
     */
    RetrievedPayload fetch(const MediaRequest& request, const FetchContext& context) override;

    std::optional<ProbeResult> probe(const MediaRequest& request, const FetchContext& context) override;

private:
    std::shared_ptr<IProcessRunner> runner_;
    std::string executable_;
};

} // namespace mediagrab

#endif // MEDIAGRAB_VIDEO_EXTRACTOR_PROVIDER_HPP

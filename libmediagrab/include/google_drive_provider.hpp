/**
 * @file google_drive_provider.hpp
 * @brief Google Drive share links, rewritten to a direct export URL.
 */

#ifndef MEDIAGRAB_GOOGLE_DRIVE_PROVIDER_HPP
#define MEDIAGRAB_GOOGLE_DRIVE_PROVIDER_HPP

#include "provider.hpp"
#include "url.hpp"
#include <memory>
#include <optional>
#include <string>

namespace mediagrab {

/**
 * @brief File id of a Drive share link (".../d/<id>/..." or "?id=<id>").
 */
[[nodiscard]] std::optional<std::string> drive_file_id(const Url& url);

/**
 * @brief Direct export URL for a Drive file id, with the virus-scan confirmation pre-set.
 */
[[nodiscard]] std::string drive_export_url(const std::string& file_id);

class GoogleDriveProvider final : public IProvider {
public:
    explicit GoogleDriveProvider(std::shared_ptr<IHttpClient> http) : http_(std::move(http)) {}

    [[nodiscard]] ProviderId id() const noexcept override { return ProviderId::GoogleDrive; }
    [[nodiscard]] std::string_view get_name() const noexcept override { return "Google Drive"; }

    [[nodiscard]] bool handles_domain(std::string_view host) const noexcept override;
    [[nodiscard]] bool requires_credential() const noexcept override { return false; }
    [[nodiscard]] bool supports_streaming_probe() const noexcept override { return false; }

    /**
     * @brief Opens the export URL and hands the response to GenericHttpProvider.
     *
     * An HTML answer means Drive wants a login or a confirmation the
     * link does not carry; that is reported as AccessDenied.
     */
    RetrievedPayload fetch(const MediaRequest& request, const FetchContext& context) override;

private:
    std::shared_ptr<IHttpClient> http_;
};

} // namespace mediagrab

#endif // MEDIAGRAB_GOOGLE_DRIVE_PROVIDER_HPP

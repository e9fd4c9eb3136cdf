#include "../../include/result_assembler.hpp"
#include "../../include/filename_sanitizer.hpp"
#include "../../include/http_client.hpp"
#include "../../include/logger.hpp"
#include "../../include/media_type.hpp"
#include "../../include/mime_detector.hpp"
#include "../../include/process_runner.hpp"

namespace mediagrab {

namespace {

std::string resolve_mime(const RetrievedPayload& payload, const std::string& filename) {
    if (payload.declared_mime) {
        if (std::string declared = normalize_mime(*payload.declared_mime);
            !declared.empty() && declared != kOctetStream) {
            return declared;
        }
    }
    if (const auto ext = filename_extension(filename); !ext.empty()) {
        if (auto by_ext = mime_from_extension(ext)) return *by_ext;
    }
    if (payload.body) {
        if (std::string sniffed = MimeDetector::detect_buffer(payload.body->peek(kSniffBytes));
            !sniffed.empty() && sniffed != kOctetStream) {
            Logger::log(LogLevel::Debug, "content sniffed as " + sniffed, "assembler");
            return sniffed;
        }
    }
    return std::string(kOctetStream);
}

} // namespace

MediaArtifact assemble_artifact(RetrievedPayload payload) {
    MediaArtifact artifact;
    artifact.provider = payload.source_provider;
    artifact.size_bytes = payload.size_bytes;
    artifact.filename = sanitize_filename(payload.suggested_name);
    artifact.mime_type = resolve_mime(payload, artifact.filename);

    if (const auto canonical = extension_for_mime(artifact.mime_type)) {
        const std::string ext = filename_extension(artifact.filename);
        bool append = ext.empty();
        if (!append) {
            if (const auto ext_mime = mime_from_extension(ext)) {
                append = mime_family(*ext_mime) != mime_family(artifact.mime_type);
            }
        }
        if (append) {
            artifact.filename = sanitize_filename(artifact.filename + *canonical);
        }
    }

    artifact.body = std::move(payload.body);
    return artifact;
}

ErrorReport report_from(const std::exception& error, const std::optional<ProviderId> provider) {
    if (const auto* fetch = dynamic_cast<const FetchError*>(&error)) {
        ErrorReport report = fetch->report();
        if (!report.provider) report.provider = provider;
        return report;
    }
    if (const auto* transport = dynamic_cast<const TransportError*>(&error)) {
        if (transport->reason() == TransportError::Reason::Cancelled) {
            return ErrorReport::make(ErrorKind::Cancelled, provider, transport->what());
        }
        return ErrorReport::make(ErrorKind::NetworkError, provider, transport->what());
    }
    if (const auto* spawn = dynamic_cast<const SpawnError*>(&error)) {
        return ErrorReport::make(ErrorKind::ProviderUnavailable, provider, spawn->what());
    }
    return ErrorReport::make(ErrorKind::Unknown, provider, error.what(), false);
}

} // namespace mediagrab

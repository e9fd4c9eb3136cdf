/**
 * @file mediagrab.hpp
 * @brief Public API for the mediagrab library.
 */

#ifndef MEDIAGRAB_HPP
#define MEDIAGRAB_HPP

#include "cookie_jar.hpp"
#include "error_report.hpp"
#include "media_types.hpp"
#include "payload.hpp"
#include "provider_registry.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace mediagrab {

/**
 * @brief Interface for receiving progress and status events during a grab.
 */
struct GrabObserver {
    virtual ~GrabObserver() = default;

    virtual void onAttempt(ProviderId provider, int attempt) {}

    virtual void onFallback(const ErrorReport& report) {}

    virtual void onComplete(ProviderId provider,
                            const std::string& filename,
                            const std::string& mime_type,
                            std::optional<std::uint64_t> size_bytes) {}

    virtual void onError(const ErrorReport& report) {}

    virtual void onLog(int level, const std::string& msg, const std::string& tag) {}
};

/**
 * @brief Main interface for the mediagrab library.
 *
 * @details Wraps classification, provider fallback and result
 * normalization into a simple, blocking API.
 * Uses PIMPL idiom to hide internal dependencies.
 */
class MediaGrabber {
public:
    /**
     * @brief Uses the built-in providers over a Boost.Beast HTTP client and
     * a POSIX process runner.
     */
    MediaGrabber();

    /**
     * @brief Uses the providers of @p registry instead of the built-in ones.
     */
    explicit MediaGrabber(ProviderRegistry registry);

    ~MediaGrabber();

    MediaGrabber(const MediaGrabber&) = delete;
    MediaGrabber& operator=(const MediaGrabber&) = delete;
    MediaGrabber(MediaGrabber&&) noexcept;
    MediaGrabber& operator=(MediaGrabber&&) noexcept;

    // --- Configuration ---

    /**
     * @brief Timeout of every single network operation.
     * Default: 30 s.
     */
    MediaGrabber& networkTimeout(std::chrono::milliseconds val);

    /**
     * @brief Upper bound for a whole yt-dlp run.
     * Default: 30 min.
     */
    MediaGrabber& extractorTimeout(std::chrono::milliseconds val);

    /**
     * @brief Largest accepted artifact, 0 for no limit.
     * Default: 2 GiB.
     */
    MediaGrabber& maxPayloadBytes(std::uint64_t val);

    /**
     * @brief yt-dlp executable, looked up on PATH when not absolute.
     * Default: "yt-dlp".
     */
    MediaGrabber& ytDlpPath(const std::string& path);

    /**
     * @brief Endpoint of the short-video resolution API.
     * Default: tikwm.
     */
    MediaGrabber& shortVideoApi(const std::string& url);

    MediaGrabber& userAgent(const std::string& agent);

    /**
     * @brief Credential blob handed to the providers that use one.
     */
    MediaGrabber& cookies(std::shared_ptr<const CookieJar> jar);

    /**
     * @brief Loads a Netscape cookie file if it exists; a missing file is not an error.
     * @throws std::runtime_error if the file exists but cannot be read.
     */
    MediaGrabber& cookieFile(const std::filesystem::path& path);

    // --- Observability ---

    /**
     * @brief Sets the observer for progress events.
     * The caller retains ownership of the observer.
     */
    void setObserver(GrabObserver* observer);

    // --- Execution ---

    /**
     * @brief Retrieves the media behind @p url. Blocks until completion.
     * @throws FetchError with the terminal or last recoverable report.
     */
    MediaArtifact grab(const std::string& url);

    /**
     * @brief Estimates size and filename without downloading.
     */
    ProbeResult probe(const std::string& url);

    // --- Control ---

    /**
     * @brief Requests cancellation of the running grab or probe. Thread-safe.
     */
    void stop();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mediagrab

#endif // MEDIAGRAB_HPP

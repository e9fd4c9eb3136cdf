/**
 * @file mime_detector.hpp
 * @brief Content-based MIME detection through libmagic.
 */

#ifndef MEDIAGRAB_MIME_DETECTOR_HPP
#define MEDIAGRAB_MIME_DETECTOR_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace mediagrab {

/**
 * @brief Detects MIME types from content rather than from names.
 */
class MimeDetector {
public:
    /**
     * @brief Detect the MIME type of a file.
     *
     * @param path The filesystem path to the file.
     * @return A string representing the MIME type (e.g., "video/mp4"),
     * empty when libmagic is unavailable or gives no answer.
     */
    static std::string detect(const std::filesystem::path& path);

    /**
     * @brief Detect the MIME type of the leading bytes of a payload.
     *
     * Answers that carry no information ("application/x-empty",
     * "inode/x-empty") are returned as an empty string.
     */
    static std::string detect_buffer(std::string_view bytes);
};

} // namespace mediagrab

#endif // MEDIAGRAB_MIME_DETECTOR_HPP

/**
 * @file media_type.hpp
 * @brief Lookup tables between file extensions and MIME types.
 *
 * Used by the Result Assembler to resolve a MIME type from a filename and
 * to give an extensionless filename the extension of its resolved type.
 */

#ifndef MEDIAGRAB_MEDIA_TYPE_HPP
#define MEDIAGRAB_MEDIA_TYPE_HPP

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace mediagrab {

///< The generic binary type; never treated as a meaningful declaration.
inline constexpr std::string_view kOctetStream = "application/octet-stream";

///< Map linking lowercase extensions (with the dot) to MIME types.
inline const std::unordered_map<std::string, std::string> ext_to_mime = {
    { ".mp4",  "video/mp4" },
    { ".m4v",  "video/mp4" },
    { ".webm", "video/webm" },
    { ".mkv",  "video/x-matroska" },
    { ".mov",  "video/quicktime" },
    { ".avi",  "video/x-msvideo" },
    { ".flv",  "video/x-flv" },
    { ".3gp",  "video/3gpp" },
    { ".ts",   "video/mp2t" },
    { ".mpeg", "video/mpeg" },
    { ".mpg",  "video/mpeg" },
    { ".mp3",  "audio/mpeg" },
    { ".m4a",  "audio/mp4" },
    { ".aac",  "audio/aac" },
    { ".ogg",  "audio/ogg" },
    { ".opus", "audio/opus" },
    { ".flac", "audio/flac" },
    { ".wav",  "audio/wav" },
    { ".jpg",  "image/jpeg" },
    { ".jpeg", "image/jpeg" },
    { ".png",  "image/png" },
    { ".gif",  "image/gif" },
    { ".webp", "image/webp" },
    { ".heic", "image/heic" },
    { ".bmp",  "image/bmp" },
    { ".svg",  "image/svg+xml" },
    { ".pdf",  "application/pdf" },
    { ".zip",  "application/zip" },
    { ".7z",   "application/x-7z-compressed" },
    { ".rar",  "application/vnd.rar" },
    { ".gz",   "application/gzip" },
    { ".tar",  "application/x-tar" },
    { ".json", "application/json" },
    { ".txt",  "text/plain" },
    { ".csv",  "text/csv" },
    { ".html", "text/html" },
    { ".htm",  "text/html" },
    { ".srt",  "application/x-subrip" },
    { ".vtt",  "text/vtt" },
};

///< Map linking MIME types to the extension given to files of that type.
inline const std::unordered_map<std::string, std::string> mime_to_ext = {
    { "video/mp4",        ".mp4" },
    { "video/webm",       ".webm" },
    { "video/x-matroska", ".mkv" },
    { "video/quicktime",  ".mov" },
    { "video/x-msvideo",  ".avi" },
    { "video/x-flv",      ".flv" },
    { "video/3gpp",       ".3gp" },
    { "video/mp2t",       ".ts" },
    { "video/mpeg",       ".mpg" },
    { "audio/mpeg",       ".mp3" },
    { "audio/mp3",        ".mp3" },
    { "audio/mp4",        ".m4a" },
    { "audio/x-m4a",      ".m4a" },
    { "audio/aac",        ".aac" },
    { "audio/ogg",        ".ogg" },
    { "audio/opus",       ".opus" },
    { "audio/flac",       ".flac" },
    { "audio/x-flac",     ".flac" },
    { "audio/wav",        ".wav" },
    { "audio/x-wav",      ".wav" },
    { "image/jpeg",       ".jpg" },
    { "image/png",        ".png" },
    { "image/gif",        ".gif" },
    { "image/webp",       ".webp" },
    { "image/heic",       ".heic" },
    { "image/bmp",        ".bmp" },
    { "application/pdf",  ".pdf" },
    { "application/zip",  ".zip" },
    { "application/gzip", ".gz" },
    { "application/x-7z-compressed", ".7z" },
    { "application/vnd.rar", ".rar" },
};

/**
 * @brief Lowercases a MIME value and drops its parameters ("; charset=...").
 * @return The bare type, empty if nothing is left.
 */
inline std::string normalize_mime(std::string_view value) {
    const auto semi = value.find(';');
    if (semi != std::string_view::npos) value = value.substr(0, semi);
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) value.remove_prefix(1);
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) value.remove_suffix(1);
    std::string s(value);
    std::ranges::transform(s, s.begin(),
        [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

/**
 * @brief MIME type for an extension (".mp4", case-insensitive).
 */
inline std::optional<std::string> mime_from_extension(std::string ext) {
    std::ranges::transform(ext, ext.begin(),
        [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    const auto it = ext_to_mime.find(ext);
    if (it == ext_to_mime.end()) return std::nullopt;
    return it->second;
}

/**
 * @brief Extension (with dot) for a MIME type, if the type is known.
 */
inline std::optional<std::string> extension_for_mime(const std::string& mime) {
    const auto it = mime_to_ext.find(normalize_mime(mime));
    if (it == mime_to_ext.end()) return std::nullopt;
    return it->second;
}

/**
 * @brief Top-level type of a MIME value ("video/mp4" -> "video").
 */
inline std::string mime_family(const std::string_view mime) {
    return normalize_mime(mime.substr(0, mime.find('/')));
}

} // namespace mediagrab

#endif // MEDIAGRAB_MEDIA_TYPE_HPP

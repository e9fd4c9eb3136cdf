/**
 * @file filename_sanitizer.hpp
 * @brief Turns arbitrary upstream names into safe, bounded filenames.
 */

#ifndef MEDIAGRAB_FILENAME_SANITIZER_HPP
#define MEDIAGRAB_FILENAME_SANITIZER_HPP

#include <cstddef>
#include <string>
#include <string_view>

namespace mediagrab {

///< Returned when nothing usable is left of the input.
inline constexpr std::string_view kFallbackFilename = "downloaded_file";

///< Maximum filename length in characters, extension included.
inline constexpr std::size_t kMaxFilenameLength = 150;

/**
 * @brief Sanitize a filename proposed by an upstream service.
 *
 * - trims whitespace and dots at both ends;
 * - replaces \ / * ? : " < > | and the remaining ASCII control characters with '_';
 * - collapses runs of '.' into a single dot;
 * - returns kFallbackFilename when the result is empty;
 * - truncates to kMaxFilenameLength characters, keeping the extension
 *   (text after the last dot) and never splitting a UTF-8 sequence.
 *
 * Pure and idempotent: sanitize_filename(sanitize_filename(x)) == sanitize_filename(x).
 */
[[nodiscard]] std::string sanitize_filename(std::string_view raw);

/**
 * @brief Extension of a filename including the dot, lowercased ("" if none).
 *
 * A leading dot (".profile") is not an extension.
 */
[[nodiscard]] std::string filename_extension(std::string_view filename);

/**
 * @brief Number of UTF-8 code points in @p s (invalid bytes count as one each).
 */
[[nodiscard]] std::size_t utf8_length(std::string_view s) noexcept;

/// @return Byte length of the first @p max_chars code points of @p s.
[[nodiscard]] std::size_t utf8_prefix_bytes(std::string_view s, std::size_t max_chars) noexcept;

} // namespace mediagrab

#endif // MEDIAGRAB_FILENAME_SANITIZER_HPP

/**
 * @file file_utils.hpp
 * @brief Temporary directory helpers.
 */

#ifndef MEDIAGRAB_FILE_UTILS_HPP
#define MEDIAGRAB_FILE_UTILS_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace mediagrab {

/**
 * @brief Creates a unique temporary directory.
 *
 * Creates a directory inside the system temp path using a
 * "mediagrab-{prefix}/{prefix}_{random_suffix}" pattern.
 *
 * @param prefix A short prefix (e.g., "ytdlp").
 * @return Filesystem path to the newly created temporary directory.
 * @throws std::runtime_error if the directory cannot be created.
 */
std::filesystem::path make_temp_dir(const std::string& prefix);

/**
 * @brief Recursively removes a directory and logs any errors.
 * @param dir The path to the directory to be removed.
 * @param tag The logger tag (e.g., "video_extractor").
 */
void cleanup_temp_dir(const std::filesystem::path& dir,
                      std::string_view tag = "file_utils");

/**
 * @brief Temporary directory removed when the object goes out of scope.
 */
class ScopedTempDir {
public:
    explicit ScopedTempDir(const std::string& prefix, std::string tag = "file_utils")
        : path_(make_temp_dir(prefix)), tag_(std::move(tag)) {}

    ~ScopedTempDir() { cleanup_temp_dir(path_, tag_); }

    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    std::string tag_;
};

} // namespace mediagrab

#endif // MEDIAGRAB_FILE_UTILS_HPP

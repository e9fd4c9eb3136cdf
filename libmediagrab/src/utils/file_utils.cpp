#include <filesystem>
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <random>
#include <stdexcept>
#include <system_error>

namespace mediagrab {

namespace {

std::string random_suffix() {
    thread_local std::mt19937_64 rng(std::random_device{}());
    return std::to_string(rng());
}

} // namespace

std::filesystem::path make_temp_dir(const std::string& prefix) {
    // use a common base dir inside temp
    const auto base_tmp = std::filesystem::temp_directory_path() /
        ("mediagrab-" + prefix);

    std::error_code ec;
    std::filesystem::create_directories(base_tmp, ec);

    auto dir = base_tmp / (prefix + "_" + random_suffix());
    if (!std::filesystem::create_directory(dir, ec) || ec) {
        throw std::runtime_error("Failed to create temp dir: " + dir.string() +
                                 (ec ? " (" + ec.message() + ")" : std::string(" (already exists)")));
    }
    Logger::log(LogLevel::Debug, "Created temp dir: " + dir.string(), "file_utils");
    return dir;
}

void cleanup_temp_dir(const std::filesystem::path& dir, const std::string_view tag) {
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    if (ec) {
        Logger::log(LogLevel::Warning, "Can't remove temp dir: " + dir.string() + " (" + ec.message() + ")", tag);
    } else {
        Logger::log(LogLevel::Debug, "Removed temp dir: " + dir.string(), tag);
    }
}

} // namespace mediagrab

#ifndef MEDIAGRAB_CLI_PARSER_HPP
#define MEDIAGRAB_CLI_PARSER_HPP

#include <cstdint>
#include <filesystem>
#include <string>

// forward declaration
namespace CLI { class App; }

struct Settings {
    std::string url;

    bool probe_only = false;
    bool quiet = false;
    bool overwrite = false;

    std::filesystem::path output_dir = ".";
    std::filesystem::path cookie_file = "cookies.txt";
    std::uint64_t max_size = 0;
    unsigned timeout_sec = 30;
    unsigned extractor_timeout_sec = 1800;
    std::string yt_dlp = "yt-dlp";
    std::string api;
    std::string user_agent;

    std::string log_level = "WARNING";
    std::filesystem::path log_file;
};

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif // MEDIAGRAB_CLI_PARSER_HPP

#include "cli_parser.hpp"
#include "../../../libmediagrab/include/router_config.hpp"
#include "../../../libmediagrab/include/short_video_provider.hpp"
#include <CLI/CLI.hpp>

void setup_cli_parser(CLI::App& app, Settings& settings) {
    // setup standard help and version flags
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");
    app.set_config("--config", "", "Read options from an INI or TOML file.");

    // --- Flags (booleans) ---
    app.add_flag("--probe", settings.probe_only,
                 "Only print the estimated size and file name, don't download.");

    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress non-error console output.");

    app.add_flag("--overwrite", settings.overwrite,
                 "Replace an existing file with the same name instead of numbering the new one.");

    // --- Options ---
    app.add_option("-o,--output", settings.output_dir,
                   "Directory the downloaded file is written to.")
                   ->default_val(".")
                   ->check(CLI::ExistingDirectory);

    app.add_option("--cookies", settings.cookie_file,
                   "Netscape cookie file used for sites that need a login (ignored if missing).")
                   ->default_val("cookies.txt");

    settings.max_size = mediagrab::kDefaultMaxPayloadBytes;
    app.add_option("--max-size", settings.max_size,
                   "Largest accepted download, e.g. 500MB or 2GB (0 = no limit).")
                   ->default_str("2GB")
                   ->transform(CLI::AsSizeValue(false));

    app.add_option("--timeout", settings.timeout_sec,
                   "Timeout in seconds of every network operation.")
                   ->default_val(30)
                   ->check(CLI::PositiveNumber);

    app.add_option("--extractor-timeout", settings.extractor_timeout_sec,
                   "Upper bound in seconds for a whole yt-dlp run.")
                   ->default_val(1800)
                   ->check(CLI::PositiveNumber);

    app.add_option("--yt-dlp", settings.yt_dlp,
                   "yt-dlp executable to use.")
                   ->default_val("yt-dlp");

    settings.api = std::string(mediagrab::kDefaultShortVideoApi);
    app.add_option("--api", settings.api,
                   "Endpoint of the short-video resolution API.")
                   ->default_str(settings.api);

    settings.user_agent = mediagrab::kDefaultUserAgent;
    app.add_option("--user-agent", settings.user_agent,
                   "User-Agent header sent with HTTP requests.");

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
                   ->default_val("WARNING")
                   ->transform(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Write logs to a specific file (default: no file logging).");

    // --- Positional Arguments ---
    app.add_option("url", settings.url, "Link to the media (http or https).")
        ->required();
}

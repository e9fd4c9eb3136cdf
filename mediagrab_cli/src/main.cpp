#include <algorithm>
#include <atomic>
#include <chrono>
#include <clocale>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <thread>
#include <vector>
#include "utils/color.hpp"
#include "cli/cli_parser.hpp"
#include <CLI/CLI.hpp>
#include "../../libmediagrab/include/mediagrab.hpp"
#include "../../libmediagrab/include/logger.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"

using namespace mediagrab;
namespace fs = std::filesystem;

static std::atomic<bool> interrupted{false};

// handle ctrl+c or termination signals; the watcher thread forwards the stop
void signal_handler(const int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        interrupted.store(true);
    }
}

inline void init_utf8_locale() {
    std::setlocale(LC_ALL, "");

    const char *cur = std::setlocale(LC_CTYPE, nullptr);
    if (cur && std::string(cur).find("UTF-8") != std::string::npos) {
        Logger::log(LogLevel::Debug, std::string("Current locale: ") + cur, "LocaleInit");
        return; // ok
    }

    constexpr const char *fallbacks[] = {"C.UTF-8", "en_US.UTF-8"};
    for (const auto fb: fallbacks) {
        if (std::setlocale(LC_ALL, fb)) {
            Logger::log(LogLevel::Info, std::string("Locale set to ") + fb, "LocaleInit");
            return;
        }
    }

    // no UTF-8 available
    Logger::log(LogLevel::Warning, "UTF-8 locale not available; non-ASCII file names may be problematic.",
                "LocaleInit");
}

inline std::string format_size(const std::uint64_t bytes) {
    constexpr const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    auto value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < std::size(units)) {
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream oss;
    if (unit == 0) oss << bytes << " B";
    else oss << std::fixed << std::setprecision(1) << value << " " << units[unit];
    return oss.str();
}

// progress line printer; total may be unknown
inline void print_progress(const std::uint64_t done, const std::optional<std::uint64_t> total,
                           const double elapsed_seconds) {
    std::cerr << "\r" << format_size(done);
    if (total && *total > 0) {
        const double percent = std::min(100.0, static_cast<double>(done) * 100.0 / static_cast<double>(*total));
        std::cerr << " / " << format_size(*total)
                  << " (" << std::fixed << std::setprecision(1) << percent << "%)";
    }
    std::cerr << " elapsed: " << std::fixed << std::setprecision(1) << elapsed_seconds << "s   " << std::flush;
}

// picks "name (1).ext", "name (2).ext"... when the target already exists
inline fs::path unique_output_path(const fs::path& dir, const std::string& filename, const bool overwrite) {
    fs::path target = dir / filename;
    if (overwrite || !fs::exists(target)) return target;

    const fs::path p(filename);
    const std::string stem = p.stem().string();
    const std::string ext = p.extension().string();
    for (int i = 1; ; ++i) {
        target = dir / (stem + " (" + std::to_string(i) + ")" + ext);
        if (!fs::exists(target)) return target;
    }
}

// streams the artifact to disk through a ".part" file renamed on success
fs::path save_artifact(MediaArtifact& artifact, const Settings& settings) {
    const fs::path target = unique_output_path(settings.output_dir, artifact.filename, settings.overwrite);
    fs::path part = target;
    part += ".part";

    std::ofstream out(part, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("cannot open output file: " + part.string());
    }

    try {
        std::vector<char> buffer(64 * 1024);
        const auto start = std::chrono::steady_clock::now();
        auto last_print = start;
        while (true) {
            const std::size_t n = artifact.body->read(buffer);
            if (n == 0) break;
            out.write(buffer.data(), static_cast<std::streamsize>(n));
            if (!out) throw std::runtime_error("write failed: " + part.string());

            const auto now = std::chrono::steady_clock::now();
            if (!settings.quiet && now - last_print >= std::chrono::milliseconds(200)) {
                print_progress(artifact.body->bytes_read(), artifact.size_bytes,
                               std::chrono::duration<double>(now - start).count());
                last_print = now;
            }
        }
        out.close();
        if (!out) throw std::runtime_error("write failed: " + part.string());
        if (!settings.quiet) {
            print_progress(artifact.body->bytes_read(), artifact.body->bytes_read(),
                           std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count());
            std::cerr << std::endl;
        }
    } catch (...) {
        out.close();
        std::error_code ec;
        fs::remove(part, ec);
        if (ec) {
            Logger::log(LogLevel::Warning, "could not remove partial file " + part.string() + ": " + ec.message(), "main");
        }
        throw;
    }

    fs::rename(part, target);
    return target;
}

// console feedback for routing progress
class ConsoleObserver final : public GrabObserver {
public:
    explicit ConsoleObserver(const bool quiet) : quiet_(quiet) {}

    void onAttempt(const ProviderId provider, const int attempt) override {
        if (quiet_) return;
        std::cerr << CYAN << "[TRY] " << to_string(provider);
        if (attempt > 1) std::cerr << " (attempt " << attempt << ")";
        std::cerr << RESET << std::endl;
    }

    void onFallback(const ErrorReport& report) override {
        if (quiet_) return;
        std::cerr << YELLOW << "[FALLBACK] " << report.describe() << RESET << std::endl;
    }

private:
    bool quiet_;
};

inline int exit_code_for(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidURL: return 2;
        case ErrorKind::Cancelled:  return 130;
        default:                    return 1;
    }
}

int main(int argc, char* argv[]) {

    CLI::App app{"mediagrab: download the media behind a link."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        return app.exit(e);
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    Logger::clear_sinks();
    if (!settings.log_file.empty()) {
        auto fileSink = std::make_unique<FileLogSink>(settings.log_file.string(), true);
        if (!fileSink->is_open()) {
            std::cerr << RED << "Cannot open log file " << settings.log_file << RESET << std::endl;
            return 2;
        }
        Logger::add_sink(std::move(fileSink));
    }

    // NONE disables console logging, quiet keeps only errors
    if (const auto level = Logger::string_to_level(settings.log_level)) {
        auto consoleSink = std::make_unique<ConsoleLogSink>();
        consoleSink->log_level = settings.quiet ? LogLevel::Error : *level;
        Logger::add_sink(std::move(consoleSink));
    }

    init_utf8_locale();

    MediaGrabber grabber;
    ConsoleObserver observer(settings.quiet);
    grabber.setObserver(&observer);

    try {
        grabber.networkTimeout(std::chrono::seconds(settings.timeout_sec))
               .extractorTimeout(std::chrono::seconds(settings.extractor_timeout_sec))
               .maxPayloadBytes(settings.max_size)
               .ytDlpPath(settings.yt_dlp)
               .shortVideoApi(settings.api)
               .userAgent(settings.user_agent)
               .cookieFile(settings.cookie_file);
    } catch (const std::exception& e) {
        std::cerr << RED << "Cannot read cookie file: " << e.what() << RESET << std::endl;
        return 2;
    }

    // forwards a signal to the running grab
    std::jthread watcher([&grabber](const std::stop_token& st) {
        while (!st.stop_requested()) {
            if (interrupted.load()) {
                std::cerr << CYAN << "\n[INTERRUPT] Stop detected. Cancelling download..." << RESET << std::endl;
                grabber.stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });

    int rc = 0;
    try {
        if (settings.probe_only) {
            const ProbeResult result = grabber.probe(settings.url);
            if (result.provider) std::cout << "provider: " << to_string(*result.provider) << "\n";
            std::cout << "name: " << (result.suggested_name ? *result.suggested_name : "(unknown)") << "\n";
            std::cout << "size: " << (result.size_bytes ? format_size(*result.size_bytes) : "(unknown)") << std::endl;
        } else {
            MediaArtifact artifact = grabber.grab(settings.url);
            const fs::path saved = save_artifact(artifact, settings);
            if (!settings.quiet) {
                std::cerr << GREEN << "[DONE] " << saved.string()
                          << " (" << format_size(artifact.body->bytes_read()) << ", " << artifact.mime_type
                          << ") via " << to_string(artifact.provider) << RESET << std::endl;
            }
            std::cout << saved.string() << std::endl;
        }
    } catch (const FetchError& e) {
        const ErrorReport& report = e.report();
        std::cerr << RED << to_string(report.kind) << ": " << report.human_message << RESET << std::endl;
        rc = exit_code_for(report.kind);
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, std::string("Unexpected failure: ") + e.what(), "main");
        std::cerr << RED << "Unknown: " << e.what() << RESET << std::endl;
        rc = 1;
    }

    watcher.request_stop();
    watcher.join();

    if (interrupted.load() && rc != 0) {
        return 130;
    }
    return rc;
}

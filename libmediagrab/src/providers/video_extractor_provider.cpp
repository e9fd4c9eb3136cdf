#include "../../include/video_extractor_provider.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/filename_sanitizer.hpp"
#include "../../include/logger.hpp"
#include "../../include/media_type.hpp"
#include "../../include/mime_detector.hpp"
#include "../../include/url_classifier.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <vector>

namespace mediagrab {

namespace {

constexpr std::string_view kTag = "video_extractor";

std::string lower(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(),
        [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool contains_any(const std::string& haystack, const std::initializer_list<std::string_view> needles) {
    return std::ranges::any_of(needles, [&](const std::string_view n) {
        return haystack.find(n) != std::string::npos;
    });
}

// the most informative line of the diagnostics: the last "ERROR:" line, else everything
std::string headline(const std::string_view diagnostics) {
    std::string_view best;
    std::size_t pos = 0;
    while (pos < diagnostics.size()) {
        const auto end = std::min(diagnostics.find('\n', pos), diagnostics.size());
        const auto line = diagnostics.substr(pos, end - pos);
        if (line.starts_with("ERROR:")) best = line;
        pos = end + 1;
    }
    if (best.empty()) best = diagnostics;
    while (!best.empty() && std::isspace(static_cast<unsigned char>(best.back()))) best.remove_suffix(1);
    if (best.empty()) return "yt-dlp failed without diagnostics";
    return std::string(best);
}

std::optional<std::uint64_t> size_field(const nlohmann::json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end() || !it->is_number() || it->get<double>() <= 0) return std::nullopt;
    return static_cast<std::uint64_t>(it->get<double>());
}

bool is_leftover(const std::filesystem::path& p) {
    const auto ext = p.extension().string();
    return ext == ".part" || ext == ".ytdl" || ext == ".temp";
}

bool skipped_for_size(const std::string_view diagnostics) {
    return contains_any(lower(diagnostics), {"max-filesize"});
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("cannot open " + path.string());
    }
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw std::runtime_error("cannot read " + path.string());
    }
    return data;
}

} // namespace

ErrorReport classify_extractor_failure(const std::string_view diagnostics, const bool credential_supplied) {
    const auto provider = ProviderId::VideoExtractor;
    const std::string text = lower(diagnostics);
    const std::string cause = headline(diagnostics);

    if (contains_any(text, {"http error 403"})) {
        if (credential_supplied) {
            return ErrorReport::make(ErrorKind::AccessDenied, provider,
                                     "access denied (HTTP 403) even with cookies: " + cause, false);
        }
        return ErrorReport::make(ErrorKind::AccessDenied, provider,
                                 "access denied (HTTP 403); no cookies were supplied: " + cause, true);
    }
    if (contains_any(text, {"unsupported url"})) {
        return ErrorReport::make(ErrorKind::UnsupportedURL, provider, cause);
    }
    if (contains_any(text, {"confirm your age", "login required", "video is private", "private video",
                            "sign in to confirm", "requires authentication", "members-only"})) {
        return ErrorReport::make(ErrorKind::LoginRequired, provider,
                                 credential_supplied
                                     ? "login or age check failed even with cookies (expired or invalid?): " + cause
                                     : "content requires login or age verification (cookies needed): " + cause);
    }
    if (contains_any(text, {"video unavailable", "http error 404", "does not exist", "has been removed"})) {
        return ErrorReport::make(ErrorKind::NotFound, provider, cause);
    }
    if (contains_any(text, {"http error 429", "too many requests"})) {
        return ErrorReport::make(ErrorKind::ProviderUnavailable, provider, cause);
    }
    return ErrorReport::make(ErrorKind::Unknown, provider, "yt-dlp error: " + cause);
}

std::optional<ProbeResult> parse_extractor_info(const std::string_view json_text) {
    const auto doc = nlohmann::json::parse(json_text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) return std::nullopt;

    ProbeResult result;
    result.provider = ProviderId::VideoExtractor;
    result.size_bytes = size_field(doc, "filesize_approx");
    if (!result.size_bytes) result.size_bytes = size_field(doc, "filesize");
    if (!result.size_bytes) {
        if (const auto formats = doc.find("requested_formats"); formats != doc.end() && formats->is_array()) {
            std::uint64_t total = 0;
            for (const auto& f : *formats) {
                if (!f.is_object()) continue;
                total += size_field(f, "filesize").value_or(size_field(f, "filesize_approx").value_or(0));
            }
            if (total > 0) result.size_bytes = total;
        }
    }

    const auto title = doc.value("title", std::string("video"));
    const auto ext = doc.value("ext", std::string("mp4"));
    result.suggested_name = sanitize_filename(title + "." + ext);
    return result;
}

bool VideoExtractorProvider::handles_domain(const std::string_view host) const noexcept {
    return is_extractor_domain(host);
}

RetrievedPayload VideoExtractorProvider::fetch(const MediaRequest& request, const FetchContext& context) {
    throw_if_cancelled(context, id());

    const ScopedTempDir temp("ytdlp", std::string(kTag));
    const auto out_dir = temp.path() / "out";
    std::filesystem::create_directory(out_dir);

    std::vector<std::string> argv = {
        executable_,
        "-f", std::string(kExtractorFormat),
        "--merge-output-format", "mp4",
        "--no-playlist",
        "--no-progress",
        "--no-warnings",
        "-o", (out_dir / "%(title).120B.%(ext)s").string(),
    };
    if (context.credential) {
        const auto cookie_copy = temp.path() / "cookies.txt";
        context.credential->write_copy(cookie_copy);
        argv.insert(argv.end(), {"--cookies", cookie_copy.string()});
    } else {
        Logger::log(LogLevel::Warning, "no cookie jar configured, sites requiring login will fail", kTag);
    }
    if (context.max_payload_bytes > 0) {
        argv.insert(argv.end(), {"--max-filesize", std::to_string(context.max_payload_bytes)});
    }
    if (!context.user_agent.empty()) {
        argv.insert(argv.end(), {"--user-agent", context.user_agent});
    }
    argv.emplace_back("--");
    argv.push_back(request.raw_url());

    ProcessOptions options;
    options.timeout = context.extractor_timeout;
    options.stop = context.stop;

    Logger::log(LogLevel::Info, "running " + executable_ + " for " + Logger::clip(request.raw_url()), kTag);
    ProcessResult run;
    try {
        run = runner_->run(argv, options);
    } catch (const SpawnError& e) {
        throw FetchError(ErrorKind::ProviderUnavailable, id(),
                         e.not_found() ? executable_ + " is not installed or not on PATH" : std::string(e.what()));
    }

    if (run.cancelled) {
        throw FetchError(ErrorKind::Cancelled, id(), "download cancelled");
    }
    if (run.timed_out) {
        throw FetchError(ErrorKind::NetworkError, id(),
                         "yt-dlp did not finish within " +
                         std::to_string(std::chrono::duration_cast<std::chrono::seconds>(context.extractor_timeout).count()) +
                         " s");
    }
    if (run.exit_code != 0) {
        Logger::log(LogLevel::Debug, "yt-dlp exited with " + std::to_string(run.exit_code) + ": " +
                    Logger::clip(run.err), kTag);
        throw FetchError(classify_extractor_failure(run.err, context.credential != nullptr));
    }

    std::vector<std::filesystem::path> produced;
    for (const auto& entry : std::filesystem::directory_iterator(out_dir)) {
        if (entry.is_regular_file() && !is_leftover(entry.path())) produced.push_back(entry.path());
    }
    if (produced.empty()) {
        // yt-dlp skips oversized files and still exits 0
        if (skipped_for_size(run.out) || skipped_for_size(run.err)) {
            throw FetchError(ErrorKind::PayloadTooLarge, id(),
                             "file is larger than the " + std::to_string(context.max_payload_bytes) +
                             " byte limit: " + headline(run.err.empty() ? run.out : run.err));
        }
        throw FetchError(ErrorKind::NoArtifactProduced, id(), "yt-dlp finished but produced no file");
    }
    // several files only remain when merging was skipped; keep the largest
    const auto file = *std::ranges::max_element(produced, {}, [](const std::filesystem::path& p) {
        return std::filesystem::file_size(p);
    });

    const std::uint64_t size = std::filesystem::file_size(file);
    enforce_size_limit(size, context, id());
    throw_if_cancelled(context, id());

    RetrievedPayload payload;
    payload.source_provider = id();
    payload.suggested_name = file.filename().string();
    payload.size_bytes = size;
    if (std::string mime = MimeDetector::detect(file); !mime.empty() && mime != kOctetStream) {
        payload.declared_mime = std::move(mime);
    }
    payload.body = std::make_unique<BufferSource>(read_file(file));
    payload.body->set_limit(context.max_payload_bytes, id());

    Logger::log(LogLevel::Info, "yt-dlp produced '" + payload.suggested_name + "' (" + std::to_string(size) + " bytes)", kTag);
    return payload;
}

std::optional<ProbeResult> VideoExtractorProvider::probe(const MediaRequest& request, const FetchContext& context) {
    const std::vector<std::string> argv = {
        executable_, "-J", "--skip-download", "--no-playlist", "--no-warnings",
        "-f", std::string(kExtractorFormat), "--", request.raw_url(),
    };
    ProcessOptions options;
    options.timeout = context.network_timeout * 2;
    options.stop = context.stop;

    try {
        const ProcessResult run = runner_->run(argv, options);
        if (run.exit_code != 0 || run.cancelled || run.timed_out) {
            Logger::log(LogLevel::Debug, "probe failed: " + Logger::clip(headline(run.err)), kTag);
            return std::nullopt;
        }
        return parse_extractor_info(run.out);
    } catch (const SpawnError& e) {
        Logger::log(LogLevel::Warning, std::string("probe not possible: ") + e.what(), kTag);
        return std::nullopt;
    }
}

} // namespace mediagrab

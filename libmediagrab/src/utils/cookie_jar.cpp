#include "../../include/cookie_jar.hpp"
#include "../../include/logger.hpp"

#include <chrono>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace mediagrab {

namespace {

constexpr std::string_view kHttpOnlyPrefix = "#HttpOnly_";

std::vector<std::string_view> split_tabs(std::string_view line) {
    std::vector<std::string_view> fields;
    for (;;) {
        const auto tab = line.find('\t');
        fields.push_back(line.substr(0, tab));
        if (tab == std::string_view::npos) break;
        line.remove_prefix(tab + 1);
    }
    return fields;
}

bool domain_matches(const Cookie& cookie, const std::string& host) {
    if (host == cookie.domain) return true;
    if (!cookie.include_subdomains) return false;
    return host.size() > cookie.domain.size() &&
           host.ends_with(cookie.domain) &&
           host[host.size() - cookie.domain.size() - 1] == '.';
}

bool path_matches(const std::string& cookie_path, const std::string& request_path) {
    if (!request_path.starts_with(cookie_path)) return false;
    return request_path.size() == cookie_path.size() ||
           cookie_path.ends_with('/') ||
           request_path[cookie_path.size()] == '/';
}

} // namespace

CookieJar CookieJar::parse(std::string text) {
    CookieJar jar;
    jar.raw_ = std::move(text);

    std::istringstream in(jar.raw_);
    std::string line;
    std::size_t skipped = 0;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        std::string_view view = line;
        if (view.starts_with(kHttpOnlyPrefix)) {
            view.remove_prefix(kHttpOnlyPrefix.size());
        } else if (view.empty() || view.front() == '#') {
            continue;
        }

        const auto fields = split_tabs(view);
        if (fields.size() < 7) {
            ++skipped;
            continue;
        }

        Cookie c;
        std::string_view domain = fields[0];
        if (domain.starts_with('.')) domain.remove_prefix(1);
        c.domain = std::string(domain);
        c.include_subdomains = fields[1] == "TRUE" || fields[0].starts_with('.');
        c.path = fields[2].empty() ? "/" : std::string(fields[2]);
        c.secure = fields[3] == "TRUE";
        try {
            c.expires = std::stoll(std::string(fields[4]));
        } catch (const std::exception&) {
            ++skipped;
            continue;
        }
        c.name = std::string(fields[5]);
        c.value = std::string(fields[6]);
        jar.cookies_.push_back(std::move(c));
    }

    if (skipped > 0) {
        Logger::log(LogLevel::Warning, "skipped " + std::to_string(skipped) + " malformed cookie line(s)", "cookies");
    }
    return jar;
}

CookieJar CookieJar::load(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("cannot open cookie file " + path.string());
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw std::runtime_error("cannot read cookie file " + path.string());
    }
    CookieJar jar = parse(buffer.str());
    Logger::log(LogLevel::Info,
                "loaded " + std::to_string(jar.cookies_.size()) + " cookie(s) from " + path.string(),
                "cookies");
    return jar;
}

std::optional<CookieJar> CookieJar::load_if_present(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        Logger::log(LogLevel::Debug, "no cookie file at " + path.string(), "cookies");
        return std::nullopt;
    }
    return load(path);
}

std::optional<std::string> CookieJar::header_for(const Url& url) const {
    const auto now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    const std::string host = url.host();
    const std::string path = url.path();
    std::string header;
    for (const auto& c : cookies_) {
        if (c.expires != 0 && c.expires < now) continue;
        if (c.secure && !url.is_https()) continue;
        if (!domain_matches(c, host) || !path_matches(c.path, path)) continue;
        if (!header.empty()) header += "; ";
        header += c.name + "=" + c.value;
    }
    if (header.empty()) return std::nullopt;
    return header;
}

void CookieJar::write_copy(const std::filesystem::path& destination) const {
    std::ofstream out(destination, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("cannot create cookie copy " + destination.string());
    }
    out.write(raw_.data(), static_cast<std::streamsize>(raw_.size()));
    if (!out) {
        throw std::runtime_error("cannot write cookie copy " + destination.string());
    }
}

} // namespace mediagrab

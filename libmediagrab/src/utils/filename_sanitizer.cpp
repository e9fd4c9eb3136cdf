#include "../../include/filename_sanitizer.hpp"
#include <algorithm>
#include <cctype>

namespace mediagrab {

namespace {

constexpr std::string_view kReservedChars = "\\/*?:\"<>|";
constexpr std::string_view kSpaceChars = " \t\n\v\f\r";

bool is_reserved(const unsigned char c) {
    return c < 0x20 || c == 0x7F || kReservedChars.find(static_cast<char>(c)) != std::string_view::npos;
}

bool is_trimmed(const char c) {
    return c == '.' || kSpaceChars.find(c) != std::string_view::npos;
}

// byte length of the UTF-8 sequence starting at s[i]; malformed sequences count as one byte
std::size_t sequence_length(const std::string_view s, const std::size_t i) {
    const auto lead = static_cast<unsigned char>(s[i]);
    std::size_t len = 1;
    if ((lead & 0xE0) == 0xC0) len = 2;
    else if ((lead & 0xF0) == 0xE0) len = 3;
    else if ((lead & 0xF8) == 0xF0) len = 4;
    if (len == 1 || i + len > s.size()) return 1;
    for (std::size_t k = 1; k < len; ++k) {
        if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80) return 1;
    }
    return len;
}

std::string_view trim_edges(std::string_view s) {
    while (!s.empty() && is_trimmed(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_trimmed(s.back())) s.remove_suffix(1);
    return s;
}

// trim first: control characters at the edges are whitespace, not content
std::string clean_pass(const std::string_view in) {
    const std::string_view trimmed = trim_edges(in);
    std::string out;
    out.reserve(trimmed.size());
    for (const char ch : trimmed) {
        if (is_reserved(static_cast<unsigned char>(ch))) {
            out.push_back('_');
        } else if (ch == '.' && !out.empty() && out.back() == '.') {
            continue;
        } else {
            out.push_back(ch);
        }
    }

    return std::string(trim_edges(out));
}

std::string truncate_keeping_extension(const std::string& s) {
    if (utf8_length(s) <= kMaxFilenameLength) return s;

    const auto dot = s.rfind('.');
    if (dot != std::string::npos && dot > 0) {
        const std::string_view ext = std::string_view(s).substr(dot);
        const std::size_t ext_len = utf8_length(ext);
        if (ext_len < kMaxFilenameLength) {
            const std::string_view stem = std::string_view(s).substr(0, dot);
            const std::size_t keep = utf8_prefix_bytes(stem, kMaxFilenameLength - ext_len);
            return std::string(stem.substr(0, keep)) + std::string(ext);
        }
    }
    return s.substr(0, utf8_prefix_bytes(s, kMaxFilenameLength));
}

} // namespace

std::size_t utf8_length(const std::string_view s) noexcept {
    std::size_t i = 0;
    std::size_t chars = 0;
    while (i < s.size()) {
        i += sequence_length(s, i);
        ++chars;
    }
    return chars;
}

std::size_t utf8_prefix_bytes(const std::string_view s, const std::size_t max_chars) noexcept {
    std::size_t i = 0;
    std::size_t chars = 0;
    while (i < s.size() && chars < max_chars) {
        i += sequence_length(s, i);
        ++chars;
    }
    return i;
}

std::string sanitize_filename(const std::string_view raw) {
    std::string current = clean_pass(raw);
    // truncation can expose a trailing dot or space, so repeat until stable
    for (;;) {
        if (current.empty()) return std::string(kFallbackFilename);
        std::string next = clean_pass(truncate_keeping_extension(current));
        if (next == current) return current;
        current = std::move(next);
    }
}

std::string filename_extension(const std::string_view filename) {
    const auto dot = filename.rfind('.');
    if (dot == std::string_view::npos || dot == 0 || dot + 1 == filename.size()) return {};
    const auto slash = filename.find_last_of("/\\");
    if (slash != std::string_view::npos && slash > dot) return {};

    std::string ext(filename.substr(dot));
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

} // namespace mediagrab

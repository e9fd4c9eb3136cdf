#include "../../include/logger.hpp"
#include "../../include/filename_sanitizer.hpp"
#include <algorithm>

namespace mediagrab {

std::vector<std::unique_ptr<ILogSink>> Logger::sinks_;
std::mutex Logger::mtx_;

void Logger::add_sink(std::unique_ptr<ILogSink> sink) {
    std::lock_guard lock(mtx_);
    if (sink) {
        sinks_.push_back(std::move(sink));
    }
}

void Logger::remove_sink(const ILogSink* sink) {
    std::lock_guard lock(mtx_);
    std::erase_if(sinks_, [sink](const auto& s) { return s.get() == sink; });
}

void Logger::clear_sinks() {
    std::lock_guard lock(mtx_);
    sinks_.clear();
}

void Logger::log(const LogLevel level,
                 const std::string_view msg,
                 const std::string_view tag) {
    std::lock_guard lock(mtx_);
    for (const auto& sink : sinks_) {
        if (sink) {
            sink->log(level, msg, tag);
        }
    }
}

std::string Logger::clip(const std::string_view text, const std::size_t max_len) {
    const std::size_t keep = utf8_prefix_bytes(text, max_len);
    std::string out(text.substr(0, keep));
    // one line per log entry
    std::replace(out.begin(), out.end(), '\n', ' ');
    std::replace(out.begin(), out.end(), '\r', ' ');
    if (keep < text.size()) {
        out += "...";
    }
    return out;
}

} // namespace mediagrab

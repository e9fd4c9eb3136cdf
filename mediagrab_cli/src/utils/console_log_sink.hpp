#ifndef MEDIAGRAB_CONSOLE_LOG_SINK_HPP
#define MEDIAGRAB_CONSOLE_LOG_SINK_HPP

#include "../../../libmediagrab/include/log_sink.hpp"
#include <iostream>

// prints messages at or above log_level; everything goes to stderr so stdout stays clean
class ConsoleLogSink final : public mediagrab::ILogSink {
public:
    mediagrab::LogLevel log_level = mediagrab::LogLevel::Warning;

    void log(const mediagrab::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        using mediagrab::LogLevel;
        if (static_cast<int>(level) < static_cast<int>(log_level)) return;
        switch (level) {
            case LogLevel::Debug:
                std::cerr << "[DEBUG][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Info:
                std::cerr << "[INFO ][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Warning:
                std::cerr << "[WARN ][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Error:
                std::cerr << "[ERROR][" << tag << "] " << message << std::endl;
                break;
        }
    }
};

#endif // MEDIAGRAB_CONSOLE_LOG_SINK_HPP

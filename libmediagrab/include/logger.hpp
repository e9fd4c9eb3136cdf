/**
 * @file logger.hpp
 * @brief Static, thread-safe logging facade.
 *
 * Every component of the library logs through Logger::log with its own tag.
 * Where the lines end up is decided by the application, which installs one
 * or more ILogSink implementations at startup.
 */

#ifndef MEDIAGRAB_LOGGER_HPP
#define MEDIAGRAB_LOGGER_HPP

#include "log_sink.hpp"
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mediagrab {

/**
 * @brief Static logging facade for mediagrab.
 *
 * Delegates log messages to all registered sinks. With no sink installed,
 * messages are dropped.
 */
class Logger {
public:
    /**
     * @brief Add a new log sink. The Logger takes ownership of the sink.
     * @param sink Unique pointer to a sink implementation.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove (and destroy) one previously added sink.
     * @param sink Pointer obtained before handing the sink to add_sink().
     */
    static void remove_sink(const ILogSink* sink);

    /**
     * @brief Remove all configured sinks.
     */
    static void clear_sinks();

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Component tag (default: "mediagrab").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "mediagrab");

    /**
     * @brief Shortens text coming from remote peers or child processes
     * before it is embedded in a log line.
     *
     * Keeps at most @p max_len UTF-8 code points, never splitting one.
     */
    static std::string clip(std::string_view text, std::size_t max_len = 300);

    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
        }
        return "";
    }

    /**
     * @brief Parses a level name (case-sensitive, "WARN" and "WARNING" both accepted).
     * @return The level, or std::nullopt for "NONE" and unknown names.
     */
    static std::optional<LogLevel> string_to_level(const std::string& level) {
        if (level == "DEBUG")
            return LogLevel::Debug;
        if (level == "INFO")
            return LogLevel::Info;
        if (level == "WARNING" || level == "WARN")
            return LogLevel::Warning;
        if (level == "ERROR")
            return LogLevel::Error;
        return std::nullopt;
    }

private:
    ///< List of all registered sink implementations.
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    ///< Protects access to the sinks_ vector.
    static std::mutex mtx_;
};

} // namespace mediagrab

#endif // MEDIAGRAB_LOGGER_HPP

/**
 * @file log_sink.hpp
 * @brief Severity levels and the sink interface used by the Logger facade.
 */

#ifndef MEDIAGRAB_LOG_SINK_HPP
#define MEDIAGRAB_LOG_SINK_HPP

#include <string_view>

namespace mediagrab {

/**
 * @brief Severity levels for log messages.
 *
 * Sinks use the level to filter and to pick an output stream.
 */
enum class LogLevel {
    Debug,   ///< Request/response details, provider decisions
    Info,    ///< Normal progress of a routing pass
    Warning, ///< Recoverable provider failures, missing optional inputs
    Error    ///< Terminal failures
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations decide where a log line goes (console, file, observer
 * callback). The Logger delegates every message to all installed sinks.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Component that emitted the message (e.g. "generic_http").
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

} // namespace mediagrab

#endif // MEDIAGRAB_LOG_SINK_HPP

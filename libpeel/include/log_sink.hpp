/**
 * @file log_sink.hpp
 * @brief Severity levels and the sink interface used by the Logger facade.
 */

#ifndef PEEL_LOG_SINK_HPP
#define PEEL_LOG_SINK_HPP

#include <string_view>

namespace peel {

/**
 * @brief Severity levels for log messages.
 */
enum class LogLevel {
    Debug,   ///< Token-by-token parsing details
    Info,    ///< Parsed chains and CLI progress
    Warning, ///< Non-fatal libarchive diagnostics
    Error    ///< Unsupported input, broken invariants
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations decide where a message ends up (console, file, test
 * capture). The Logger fans each message out to every installed sink.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Component that produced the message (e.g. "extension").
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

} // namespace peel

#endif // PEEL_LOG_SINK_HPP

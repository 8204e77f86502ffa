/**
 * @file logger.hpp
 * @brief Static, thread-safe logging facade for libpeel and the peel CLI.
 */

#ifndef PEEL_LOGGER_HPP
#define PEEL_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace peel {

/**
 * @brief Global entry point for logging.
 *
 * The library never prints on its own: every message goes through
 * Logger::log and reaches whatever sinks the embedding program installed.
 * With no sinks installed, logging is a no-op.
 */
class Logger {
public:
    /**
     * @brief Add a new log sink. The Logger takes ownership of the sink.
     * @param sink Unique pointer to a sink implementation (null is ignored).
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /// Remove all configured sinks.
    static void clear_sinks();

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Component tag (default: "peel").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "peel");

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
     * @brief Parses a --log-level value, ignoring case.
     * @return The level, or std::nullopt for "NONE" and anything unrecognized.
     */
    static std::optional<LogLevel> string_to_level(std::string_view level);

private:
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    static std::mutex mtx_;
};

} // namespace peel

#endif // PEEL_LOGGER_HPP

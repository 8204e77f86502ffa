#ifndef PEEL_FILE_LOG_SINK_HPP
#define PEEL_FILE_LOG_SINK_HPP

#include "../../../libpeel/include/log_sink.hpp"
#include "../../../libpeel/include/logger.hpp"
#include <filesystem>
#include <fstream>
#include <mutex>
#include <stdexcept>

namespace peel {

// Writes every level, unfiltered.
class FileLogSink final : public ILogSink {
public:
    explicit FileLogSink(const std::filesystem::path& filename, const bool append = true)
        : out_(filename, append ? std::ios::app : std::ios::trunc) {
        if (!out_.is_open()) {
            throw std::runtime_error("Cannot open log file: " + filename.string());
        }
    }

    void log(const LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        std::lock_guard lock(mtx_);
        out_ << "[" << Logger::level_to_string(level) << "]";
        if (!tag.empty()) out_ << "[" << tag << "]";
        out_ << " " << message << "\n";
        out_.flush();
    }

private:
    std::ofstream out_;
    std::mutex mtx_;
};

} // namespace peel

#endif // PEEL_FILE_LOG_SINK_HPP

#include "../../include/archive_support.hpp"
#include "../../include/logger.hpp"
#include <archive.h>
#include <stdexcept>
#include <string>

namespace peel {

namespace {

const char* support_tag() {
    return "archive_support";
}

// ARCHIVE_WARN is returned when libarchive falls back to an external
// program; the reader still works, so only log it
void check_status(archive* reader, const int status, const std::string_view what) {
    if (status == ARCHIVE_OK) {
        return;
    }
    const char* error = archive_error_string(reader);
    const std::string detail = std::string(what) + ": " + (error ? error : "unknown libarchive error");
    if (status == ARCHIVE_WARN) {
        Logger::log(LogLevel::Warning, std::string("LIBARCHIVE WARN: ") + detail, support_tag());
        return;
    }
    Logger::log(LogLevel::Error, "Failed to enable " + detail, support_tag());
    throw std::runtime_error("Failed to enable " + detail);
}

void enable_format(archive* reader, const CompressionFormat format) {
    switch (format) {
        case CompressionFormat::Tar:
            check_status(reader, archive_read_support_format_tar(reader), "tar format");
            break;
        case CompressionFormat::Zip:
            check_status(reader, archive_read_support_format_zip(reader), "zip format");
            break;
        case CompressionFormat::Gzip:
            check_status(reader, archive_read_support_filter_gzip(reader), "gzip filter");
            break;
        case CompressionFormat::Bzip:
            check_status(reader, archive_read_support_filter_bzip2(reader), "bzip2 filter");
            break;
        case CompressionFormat::Lz4:
            check_status(reader, archive_read_support_filter_lz4(reader), "lz4 filter");
            break;
        case CompressionFormat::Lzma:
            // both .xz and .lzma map here
            check_status(reader, archive_read_support_filter_xz(reader), "xz filter");
            check_status(reader, archive_read_support_filter_lzma(reader), "lzma filter");
            break;
        case CompressionFormat::Zstd:
            check_status(reader, archive_read_support_filter_zstd(reader), "zstd filter");
            break;
        case CompressionFormat::Snappy:
            throw std::runtime_error("libarchive has no reader for snappy (.sz) streams");
    }
}

bool is_readable(const CompressionFormat format) noexcept {
    return is_archive_format(format) || read_filter_for(format).has_value();
}

} // namespace

std::optional<int> read_filter_for(const CompressionFormat format) noexcept {
    switch (format) {
        case CompressionFormat::Gzip:   return ARCHIVE_FILTER_GZIP;
        case CompressionFormat::Bzip:   return ARCHIVE_FILTER_BZIP2;
        case CompressionFormat::Lz4:    return ARCHIVE_FILTER_LZ4;
        case CompressionFormat::Lzma:   return ARCHIVE_FILTER_XZ;
        case CompressionFormat::Zstd:   return ARCHIVE_FILTER_ZSTD;
        case CompressionFormat::Snappy:
        case CompressionFormat::Tar:
        case CompressionFormat::Zip:
            return std::nullopt;
    }
    return std::nullopt;
}

bool can_read_chain(const std::span<const Extension> extensions) noexcept {
    for (const auto& extension : extensions) {
        for (const auto format : extension) {
            if (!is_readable(format)) {
                return false;
            }
        }
    }
    return true;
}

void enable_read_support(archive* reader, const std::span<const Extension> extensions) {
    if (!reader) {
        throw std::invalid_argument("enable_read_support: null archive reader");
    }

    bool has_container = false;
    for (const auto& extension : extensions) {
        for (const auto format : extension) {
            enable_format(reader, format);
            has_container = has_container || is_archive_format(format);
        }
    }

    if (!has_container) {
        check_status(reader, archive_read_support_format_raw(reader), "raw format");
    }

    Logger::log(LogLevel::Debug,
                "Reader configured for '" + join_display_text(extensions) + "'",
                support_tag());
}

} // namespace peel

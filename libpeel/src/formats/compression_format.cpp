#include "../../include/compression_format.hpp"

namespace peel {

bool is_archive_format(const CompressionFormat format) noexcept {
    // list every format explicitly, no default label
    switch (format) {
        case CompressionFormat::Tar:
        case CompressionFormat::Zip:
            return true;
        case CompressionFormat::Gzip:
        case CompressionFormat::Bzip:
        case CompressionFormat::Lz4:
        case CompressionFormat::Lzma:
        case CompressionFormat::Snappy:
        case CompressionFormat::Zstd:
            return false;
    }
    return false;
}

std::string_view to_string(const CompressionFormat format) noexcept {
    switch (format) {
        case CompressionFormat::Gzip:   return ".gz";
        case CompressionFormat::Bzip:   return ".bz";
        case CompressionFormat::Zstd:   return ".zst";
        case CompressionFormat::Lz4:    return ".lz4";
        case CompressionFormat::Lzma:   return ".lz";
        case CompressionFormat::Snappy: return ".sz";
        case CompressionFormat::Tar:    return ".tar";
        case CompressionFormat::Zip:    return ".zip";
    }
    return "";
}

std::ostream& operator<<(std::ostream& os, const CompressionFormat format) {
    return os << to_string(format);
}

} // namespace peel

/**
 * @file compression_format.hpp
 * @brief The closed set of compression and archive formats peel recognizes.
 */

#ifndef PEEL_COMPRESSION_FORMAT_HPP
#define PEEL_COMPRESSION_FORMAT_HPP

#include <ostream>
#include <string_view>

namespace peel {

/**
 * @brief Accepted formats for input and output.
 *
 * Every switch over this enum lists all enumerators and has no default
 * label, so the build (-Werror=switch) breaks at each consumer when a new
 * format is added.
 */
enum class CompressionFormat {
    Gzip,   ///< .gz
    Bzip,   ///< .bz .bz2
    Lz4,    ///< .lz4
    Lzma,   ///< .xz .lzma
    Snappy, ///< .sz
    Tar,    ///< .tar and the tgz/tbz/txz/... aliases
    Zstd,   ///< .zst
    Zip     ///< .zip
};

/**
 * @brief Checks if the format bundles several files in one stream.
 * @return true for Tar and Zip, false for single-stream compressors.
 */
[[nodiscard]] bool is_archive_format(CompressionFormat format) noexcept;

/**
 * @brief Canonical dotted rendering (e.g. ".gz", ".tar").
 */
[[nodiscard]] std::string_view to_string(CompressionFormat format) noexcept;

std::ostream& operator<<(std::ostream& os, CompressionFormat format);

} // namespace peel

#endif // PEEL_COMPRESSION_FORMAT_HPP

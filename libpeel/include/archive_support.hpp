/**
 * @file archive_support.hpp
 * @brief Maps parsed extension chains onto libarchive reader support.
 *
 * The compression engine that consumes a parsed chain reads it through
 * libarchive. These helpers tell it which filters and formats the chain
 * needs and register exactly those on a reader handle. Nothing is read or
 * decompressed here.
 */

#ifndef PEEL_ARCHIVE_SUPPORT_HPP
#define PEEL_ARCHIVE_SUPPORT_HPP

#include "compression_format.hpp"
#include "extension.hpp"
#include <optional>
#include <span>

struct archive;

namespace peel {

/**
 * @brief libarchive read filter code (ARCHIVE_FILTER_*) for a compressor.
 * @return std::nullopt for archive containers and for formats libarchive
 * cannot decode (Snappy).
 */
[[nodiscard]] std::optional<int> read_filter_for(CompressionFormat format) noexcept;

/**
 * @brief Whether libarchive can read every layer of the chain.
 */
[[nodiscard]] bool can_read_chain(std::span<const Extension> extensions) noexcept;

/**
 * @brief Registers the read filters and formats the chain needs on @p reader.
 *
 * When the chain has no archive container the "raw" format is enabled, so a
 * bare compressed stream can be read as a single entry.
 *
 * @throws std::invalid_argument if @p reader is null.
 * @throws std::runtime_error if a layer is not supported by libarchive or a
 * registration call fails.
 */
void enable_read_support(archive* reader, std::span<const Extension> extensions);

} // namespace peel

#endif // PEEL_ARCHIVE_SUPPORT_HPP

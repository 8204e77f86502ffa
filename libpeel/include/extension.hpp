/**
 * @file extension.hpp
 * @brief Extension values and the parsers that produce them from format
 * strings and file system paths.
 */

#ifndef PEEL_EXTENSION_HPP
#define PEEL_EXTENSION_HPP

#include "compression_format.hpp"
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace peel {

/**
 * @brief One recognized extension token and the formats it stands for.
 *
 * A single token such as "tgz" can denote several formats ([Tar, Gzip]).
 * The format sequence points into the static extension table and is never
 * empty. Two extensions compare equal when their format sequences do;
 * display_text is only what the user typed.
 */
class Extension {
public:
    /**
     * @brief Builds an extension from a table entry.
     *
     * An empty @p formats can only come from a malformed table: the error is
     * logged and the process is aborted.
     *
     * The span is stored, not copied: @p formats must have static storage
     * duration, as the arrays behind compression_formats_from_text do. A
     * temporary container leaves the extension dangling.
     *
     * @param formats Static format sequence, outermost layer first.
     * @param text The token that matched (e.g. "tgz", "tar", "xz").
     */
    Extension(std::span<const CompressionFormat> formats, std::string text);

    [[nodiscard]] std::span<const CompressionFormat> compression_formats() const noexcept {
        return compression_formats_;
    }

    [[nodiscard]] const std::string& display_text() const noexcept {
        return display_text_;
    }

    /// Whether the first (outermost) format is an archive container.
    [[nodiscard]] bool is_archive() const noexcept;

    [[nodiscard]] auto begin() const noexcept { return compression_formats_.begin(); }
    [[nodiscard]] auto end() const noexcept { return compression_formats_.end(); }

    friend bool operator==(const Extension& lhs, const Extension& rhs) noexcept;

private:
    std::span<const CompressionFormat> compression_formats_;
    std::string display_text_;
};

[[nodiscard]] const std::string& to_string(const Extension& extension) noexcept;

std::ostream& operator<<(std::ostream& os, const Extension& extension);

/**
 * @brief Returns the formats that correspond to the given extension text.
 *
 * Examples: "tar" -> [Tar], "tgz" -> [Tar, Gzip].
 * Matching is exact and case-sensitive; text containing a dot never matches.
 *
 * @return The static format sequence, or std::nullopt for unknown text.
 */
[[nodiscard]] std::optional<std::span<const CompressionFormat>>
compression_formats_from_text(std::string_view extension) noexcept;

/**
 * @brief All tokens the extension table recognizes, in table order.
 */
[[nodiscard]] std::span<const std::string_view> known_extension_tokens() noexcept;

/**
 * @brief Parses a user given format such as "tar.gz" or ".tar.gz".
 *
 * Empty pieces between dots are ignored. If any piece is unknown the whole
 * string is rejected. The recognized pieces are returned in reverse of
 * their textual order ("tar.gz" -> [gz, tar]).
 *
 * @return The extensions, or std::nullopt if a piece is not recognized.
 */
[[nodiscard]] std::optional<std::vector<Extension>> from_format_text(std::string_view format);

/**
 * @brief Strips every known extension from the tail of a path.
 *
 * Stops at the first extension that is not recognized. The parent directory
 * is kept in the returned path.
 *
 * @return The remaining path and the extensions in left to right order
 * ("a.tar.gz" -> {"a", [tar, gz]}). The list is empty if nothing matched.
 */
[[nodiscard]] std::pair<std::filesystem::path, std::vector<Extension>>
separate_known_extensions_from_name(std::filesystem::path path);

/// Same as separate_known_extensions_from_name, keeping only the extensions.
[[nodiscard]] std::vector<Extension> extensions_from_path(const std::filesystem::path& path);

/// Flat-maps the extensions into their formats, preserving order.
[[nodiscard]] std::vector<CompressionFormat> flatten_formats(std::span<const Extension> extensions);

/// Joins the display texts with dots ("tar.gz").
[[nodiscard]] std::string join_display_text(std::span<const Extension> extensions);

} // namespace peel

namespace std {
template <>
struct hash<peel::Extension> {
    size_t operator()(const peel::Extension& extension) const noexcept;
};
} // namespace std

#endif // PEEL_EXTENSION_HPP

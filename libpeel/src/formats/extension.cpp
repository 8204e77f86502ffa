#include "../../include/extension.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <array>
#include <cstdlib>

namespace peel {

namespace fs = std::filesystem;

namespace {

const char* extension_tag() {
    return "extension";
}

using enum CompressionFormat;

constexpr std::array<CompressionFormat, 1> kTar = {Tar};
constexpr std::array<CompressionFormat, 2> kTarGzip = {Tar, Gzip};
constexpr std::array<CompressionFormat, 2> kTarBzip = {Tar, Bzip};
constexpr std::array<CompressionFormat, 2> kTarLz4 = {Tar, Lz4};
constexpr std::array<CompressionFormat, 2> kTarLzma = {Tar, Lzma};
constexpr std::array<CompressionFormat, 2> kTarSnappy = {Tar, Snappy};
constexpr std::array<CompressionFormat, 2> kTarZstd = {Tar, Zstd};
constexpr std::array<CompressionFormat, 1> kZip = {Zip};
constexpr std::array<CompressionFormat, 1> kBzip = {Bzip};
constexpr std::array<CompressionFormat, 1> kGzip = {Gzip};
constexpr std::array<CompressionFormat, 1> kLz4 = {Lz4};
constexpr std::array<CompressionFormat, 1> kLzma = {Lzma};
constexpr std::array<CompressionFormat, 1> kSnappy = {Snappy};
constexpr std::array<CompressionFormat, 1> kZstd = {Zstd};

struct TableEntry {
    std::string_view token;
    std::span<const CompressionFormat> formats;
};

// token -> formats, outermost layer first
constexpr std::array<TableEntry, 18> kExtensionTable = {{
    {"tar",   kTar},
    {"tgz",   kTarGzip},
    {"tbz",   kTarBzip},
    {"tbz2",  kTarBzip},
    {"tlz4",  kTarLz4},
    {"txz",   kTarLzma},
    {"tlzma", kTarLzma},
    {"tsz",   kTarSnappy},
    {"tzst",  kTarZstd},
    {"zip",   kZip},
    {"bz",    kBzip},
    {"bz2",   kBzip},
    {"gz",    kGzip},
    {"lz4",   kLz4},
    {"xz",    kLzma},
    {"lzma",  kLzma},
    {"sz",    kSnappy},
    {"zst",   kZstd},
}};

constexpr auto kKnownTokens = [] {
    std::array<std::string_view, kExtensionTable.size()> tokens{};
    for (std::size_t i = 0; i < kExtensionTable.size(); ++i) {
        tokens[i] = kExtensionTable[i].token;
    }
    return tokens;
}();

} // namespace

Extension::Extension(const std::span<const CompressionFormat> formats, std::string text)
    : compression_formats_(formats), display_text_(std::move(text)) {
    if (compression_formats_.empty()) {
        Logger::log(LogLevel::Error,
                    "Extension '" + display_text_ + "' has no compression formats, extension table is malformed",
                    extension_tag());
        std::abort();
    }
}

bool Extension::is_archive() const noexcept {
    // never empty, checked in the constructor
    return is_archive_format(compression_formats_.front());
}

bool operator==(const Extension& lhs, const Extension& rhs) noexcept {
    return std::ranges::equal(lhs.compression_formats_, rhs.compression_formats_);
}

const std::string& to_string(const Extension& extension) noexcept {
    return extension.display_text();
}

std::ostream& operator<<(std::ostream& os, const Extension& extension) {
    return os << extension.display_text();
}

std::optional<std::span<const CompressionFormat>>
compression_formats_from_text(const std::string_view extension) noexcept {
    const auto it = std::ranges::find(kExtensionTable, extension, &TableEntry::token);
    if (it == kExtensionTable.end()) {
        return std::nullopt;
    }
    return it->formats;
}

std::span<const std::string_view> known_extension_tokens() noexcept {
    return kKnownTokens;
}

std::optional<std::vector<Extension>> from_format_text(const std::string_view format) {
    std::vector<Extension> extensions;

    std::size_t start = 0;
    while (start <= format.size()) {
        std::size_t end = format.find('.', start);
        if (end == std::string_view::npos) {
            end = format.size();
        }
        const std::string_view piece = format.substr(start, end - start);
        start = end + 1;

        // leading, trailing and repeated dots leave empty pieces
        if (piece.empty()) {
            continue;
        }

        const auto formats = compression_formats_from_text(piece);
        if (!formats) {
            Logger::log(LogLevel::Debug,
                        "Unknown piece '" + std::string(piece) + "' in format '" + std::string(format) + "'",
                        extension_tag());
            return std::nullopt;
        }
        extensions.emplace_back(*formats, std::string(piece));
    }

    std::ranges::reverse(extensions);
    return extensions;
}

std::pair<fs::path, std::vector<Extension>> separate_known_extensions_from_name(fs::path path) {
    std::vector<Extension> extensions;

    // trailing separators and "." components name no file, use the component before them
    while (path.has_relative_path() && (!path.has_filename() || path.filename() == ".")) {
        path = path.parent_path();
    }

    // while there are known extensions at the tail, grab them
    while (path.has_extension()) {
        std::string text = path.extension().string();
        text.erase(0, 1);

        const auto formats = compression_formats_from_text(text);
        if (!formats) {
            Logger::log(LogLevel::Debug,
                        "Stopped at unknown extension '" + text + "' of " + path.string(),
                        extension_tag());
            break;
        }
        extensions.emplace_back(*formats, std::move(text));
        path.replace_extension();
    }

    // found right to left, report left to right
    std::ranges::reverse(extensions);
    return {std::move(path), std::move(extensions)};
}

std::vector<Extension> extensions_from_path(const fs::path& path) {
    auto [base, extensions] = separate_known_extensions_from_name(path);
    return std::move(extensions);
}

std::vector<CompressionFormat> flatten_formats(const std::span<const Extension> extensions) {
    std::vector<CompressionFormat> formats;
    for (const auto& extension : extensions) {
        formats.insert(formats.end(), extension.begin(), extension.end());
    }
    return formats;
}

std::string join_display_text(const std::span<const Extension> extensions) {
    std::string joined;
    for (const auto& extension : extensions) {
        if (!joined.empty()) {
            joined += '.';
        }
        joined += extension.display_text();
    }
    return joined;
}

} // namespace peel

std::size_t std::hash<peel::Extension>::operator()(const peel::Extension& extension) const noexcept {
    std::size_t seed = extension.compression_formats().size();
    for (const auto format : extension.compression_formats()) {
        seed ^= std::hash<int>{}(static_cast<int>(format)) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    }
    return seed;
}

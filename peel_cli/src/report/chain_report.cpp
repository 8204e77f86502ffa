#include "chain_report.hpp"
#include "../../../libpeel/include/archive_support.hpp"
#include <iomanip>
#include <sstream>

namespace {

std::string formats_text(const std::vector<peel::Extension>& extensions) {
    std::string text;
    for (const auto format : peel::flatten_formats(extensions)) {
        if (!text.empty()) text += ' ';
        text += peel::to_string(format);
    }
    return text;
}

const char* yes_no(const bool value) {
    return value ? "yes" : "no";
}

std::string chain_fields(const std::vector<peel::Extension>& extensions) {
    std::ostringstream out;
    out << "layers=" << peel::join_display_text(extensions)
        << " formats=" << formats_text(extensions)
        << " archive=" << yes_no(extensions.front().is_archive())
        << " libarchive=" << yes_no(peel::can_read_chain(extensions));
    return out.str();
}

} // namespace

PathResult inspect_path(const std::filesystem::path& input) {
    auto [base, extensions] = peel::separate_known_extensions_from_name(input);
    return {input, std::move(base), std::move(extensions)};
}

std::string format_path_line(const PathResult& result) {
    if (result.extensions.empty()) {
        return result.input.string() + ": no known extension";
    }
    return result.input.string() + ": base=" + result.base.string() + " " + chain_fields(result.extensions);
}

std::string format_chain_line(const std::string_view text, const std::vector<peel::Extension>& extensions) {
    if (extensions.empty()) {
        return std::string(text) + ": no known extension";
    }
    return std::string(text) + ": " + chain_fields(extensions);
}

void print_extension_table(std::ostream& out) {
    for (const auto token : peel::known_extension_tokens()) {
        const auto formats = peel::compression_formats_from_text(token);
        if (!formats) continue;

        out << std::left << std::setw(8) << token;
        for (const auto format : *formats) {
            out << ' ' << format;
        }
        out << '\n';
    }
}

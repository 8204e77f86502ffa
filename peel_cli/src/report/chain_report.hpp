#ifndef PEEL_CHAIN_REPORT_HPP
#define PEEL_CHAIN_REPORT_HPP

#include "../../../libpeel/include/extension.hpp"
#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

struct PathResult {
    std::filesystem::path input;              // path as given on the command line
    std::filesystem::path base;               // residual path, extensions stripped
    std::vector<peel::Extension> extensions;  // left to right
};

PathResult inspect_path(const std::filesystem::path& input);

/**
 * @brief One report line for a path.
 *
 * "a.tar.gz: base=a layers=tar.gz formats=.tar .gz archive=yes libarchive=yes"
 * or "notes.txt: no known extension".
 */
std::string format_path_line(const PathResult& result);

/// One report line for a parsed format string, chain in the order given.
std::string format_chain_line(std::string_view text, const std::vector<peel::Extension>& extensions);

/// Every known token with its formats, one per line.
void print_extension_table(std::ostream& out);

#endif // PEEL_CHAIN_REPORT_HPP

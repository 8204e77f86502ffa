#ifndef PEEL_CLI_PARSER_HPP
#define PEEL_CLI_PARSER_HPP

#include <filesystem>
#include <string>
#include <vector>

// forward declaration
namespace CLI { class App; }

enum class Command {
    None,
    Path,   ///< strip known extensions from paths
    Format, ///< parse a --format style string
    List    ///< print the extension table
};

struct Settings {
    bool quiet = false;
    std::string log_level = "ERROR";
    std::filesystem::path log_file;

    Command command = Command::None;
    std::vector<std::filesystem::path> paths;
    std::string format_text;
};

/**
 * @brief Registers global options and the path/format/list subcommands.
 *
 * Parsed values land in @p settings, which must outlive @p app.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif // PEEL_CLI_PARSER_HPP

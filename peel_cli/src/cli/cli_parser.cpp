#include "cli_parser.hpp"
#include <CLI/CLI.hpp>

void setup_cli_parser(CLI::App& app, Settings& settings) {
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");
    app.require_subcommand(1);

    // --- global options ---
    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress console log output.");

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
                   ->default_val("ERROR")
                   ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Also write logs to FILE (default: no file logging).");

    // --- subcommands ---
    auto* path_cmd = app.add_subcommand("path", "Strip known compression extensions from paths.");
    path_cmd->add_option("paths", settings.paths, "One or more file names or paths.")
        ->required();
    path_cmd->callback([&settings]() { settings.command = Command::Path; });

    auto* format_cmd = app.add_subcommand("format", "Parse a format string such as 'tar.gz' or '.tgz'.");
    format_cmd->add_option("text", settings.format_text, "Dot separated extension tokens.")
        ->required();
    format_cmd->callback([&settings]() {
        if (settings.format_text.find_first_not_of('.') == std::string::npos) {
            throw CLI::ValidationError("format", "Format string contains no extension tokens.");
        }
        settings.command = Command::Format;
    });

    auto* list_cmd = app.add_subcommand("list", "List every known extension token.");
    list_cmd->callback([&settings]() { settings.command = Command::List; });
}

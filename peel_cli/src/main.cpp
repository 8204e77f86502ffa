#include <iostream>
#include <memory>
#include <CLI/CLI.hpp>
#include "cli/cli_parser.hpp"
#include "report/chain_report.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "../../libpeel/include/extension.hpp"
#include "../../libpeel/include/logger.hpp"

using namespace peel;

namespace {

void setup_logging(const Settings& settings) {
    Logger::clear_sinks();

    if (!settings.log_file.empty()) {
        Logger::add_sink(std::make_unique<FileLogSink>(settings.log_file));
    }

    // NONE maps to no level: console stays silent
    const auto level = Logger::string_to_level(settings.log_level);
    if (!settings.quiet && level) {
        auto console_sink = std::make_unique<ConsoleLogSink>();
        console_sink->log_level = *level;
        Logger::add_sink(std::move(console_sink));
    }
}

int run_path(const Settings& settings) {
    int status = 0;
    for (const auto& path : settings.paths) {
        const PathResult result = inspect_path(path);
        if (result.extensions.empty()) {
            Logger::log(LogLevel::Error, "Unsupported extension: " + path.string(), "main");
            status = 1;
        } else {
            Logger::log(LogLevel::Info, path.string() + " -> " + join_display_text(result.extensions), "main");
        }
        std::cout << format_path_line(result) << '\n';
    }
    return status;
}

int run_format(const Settings& settings) {
    const auto extensions = from_format_text(settings.format_text);
    if (!extensions) {
        Logger::log(LogLevel::Error, "Unsupported format: " + settings.format_text, "main");
        return 1;
    }
    std::cout << format_chain_line(settings.format_text, *extensions) << '\n';
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"peel: recognize compression and archive extensions."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e) {
        return app.exit(e);
    }

    try {
        setup_logging(settings);
    } catch (const std::exception& e) {
        std::cerr << "Logging setup failed: " << e.what() << std::endl;
        return 1;
    }

    switch (settings.command) {
        case Command::Path:
            return run_path(settings);
        case Command::Format:
            return run_format(settings);
        case Command::List:
            print_extension_table(std::cout);
            return 0;
        case Command::None:
            break;
    }
    Logger::log(LogLevel::Error, "No command given.", "main");
    return 1;
}

#include "cli_parser.hpp"
#include "csa/version.hpp"

#include <charconv>
#include <iostream>

namespace csa::cli {

    namespace {

        std::optional<std::size_t> parse_count(const std::string_view text) {
            std::size_t value = 0;
            const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc{} || end != text.data() + text.size()) {
                return std::nullopt;
            }
            return value;
        }

    }  // namespace

    Command CliParser::parse_command(const std::string_view cmd) {
        if (cmd == "parse") return Command::PARSE;
        if (cmd == "analyze") return Command::ANALYZE;
        if (cmd == "metrics") return Command::METRICS;
        if (cmd == "languages" || cmd == "langs") return Command::LANGUAGES;
        if (cmd == "help" || cmd == "--help" || cmd == "-h") return Command::HELP;
        if (cmd == "version" || cmd == "--version" || cmd == "-v") return Command::VERSION;
        return Command::UNKNOWN;
    }

    Options CliParser::parse(const int argc, const char* const* argv) {
        if (argc < 2) {
            return Options{.command = Command::HELP};
        }

        const std::string_view cmd_str = argv[1];

        Options opts;
        opts.command = parse_command(cmd_str);

        if (opts.command == Command::HELP || opts.command == Command::VERSION) {
            return opts;
        }

        if (opts.command == Command::UNKNOWN) {
            opts.errors.push_back("Unknown command: " + std::string(cmd_str));
            return opts;
        }

        int index = 2;
        parse_command_options(argc, argv, index, opts);

        if (opts.command_help) {
            return opts;
        }

        const bool needs_input = opts.command == Command::PARSE ||
                                 opts.command == Command::ANALYZE ||
                                 opts.command == Command::METRICS;
        if (needs_input && opts.input_files.empty()) {
            opts.errors.emplace_back("No input file specified");
        }

        return opts;
    }

    void CliParser::parse_command_options(const int argc, const char* const* argv, int& index, Options& opts) {
        const auto take_value = [&](const std::string& flag) -> std::optional<std::string> {
            if (index < argc) {
                return std::string(argv[index++]);
            }
            opts.errors.push_back("Missing value for " + flag);
            return std::nullopt;
        };

        while (index < argc) {
            if (std::string arg = argv[index++]; arg == "--help" || arg == "-h") {
                opts.command_help = true;
            } else if (arg == "--config" || arg == "-c") {
                if (auto value = take_value(arg)) opts.config_file = std::move(*value);
            } else if (arg == "--language" || arg == "-l") {
                if (auto value = take_value(arg)) opts.language = std::move(*value);
            } else if (arg == "--output" || arg == "-o") {
                if (auto value = take_value(arg)) opts.output_file = std::move(*value);
            } else if (arg == "--threshold" || arg == "-t") {
                if (auto value = take_value(arg)) {
                    opts.threshold = parse_count(*value);
                    if (!opts.threshold) {
                        opts.errors.push_back("Invalid threshold: " + *value);
                    }
                }
            } else if (arg == "--ast") {
                opts.include_ast = true;
            } else if (arg == "--compact") {
                opts.compact = true;
            } else if (arg == "--verbose") {
                opts.verbose = true;
            } else if (!arg.empty() && arg[0] != '-') {
                opts.input_files.push_back(std::move(arg));
            } else {
                opts.errors.push_back("Unknown option: " + arg);
            }
        }
    }

    void CliParser::print_help() {
        std::cout << R"(
Code Structure Analyzer (csa) - Structural analysis of source code

USAGE:
    csa <COMMAND> [OPTIONS] <file>...

COMMANDS:
    parse          Parse files and print the syntax tree and diagnostics as JSON
    analyze        Print functions, classes, imports and statistics as JSON
    metrics        Print structural metrics of the syntax tree as JSON
    languages      List registered languages and their file extensions
    help           Show this help message
    version        Show version information

OPTIONS:
    -c, --config <file>     TOML configuration file
    -l, --language <id>     Language id (default: detected from the file extension)
    -t, --threshold <n>     Long-function threshold in lines (analyze)
    -o, --output <file>     Write JSON to a file instead of stdout
    --ast                   Include the syntax tree in parse output
    --compact               Print JSON on a single line
    --verbose               Enable debug logging
    -h, --help              Show help for a command

Run 'csa <COMMAND> --help' for more information on a command.
)";
    }

    void CliParser::print_version() {
        std::cout << PROJECT_SHORT_NAME << " (" << PROJECT_NAME << ") " << VERSION_STRING << "\n";
    }

    void CliParser::print_command_help(const Command cmd) {
        switch (cmd) {
            case Command::PARSE:
                std::cout << R"(csa parse - Parse source files

USAGE:
    csa parse [OPTIONS] <file>...

OPTIONS:
    -l, --language <id>     Parse with this language instead of detecting it
    --ast                   Include the syntax tree (default: [output] include_ast)
    -o, --output <file>     Write JSON to a file
    --compact               Print JSON on a single line

DESCRIPTION:
    Prints {ast, errors, warnings, metadata} per file. Syntax errors are
    reported in "errors" and do not change the exit code.
)";
                break;
            case Command::ANALYZE:
                std::cout << R"(csa analyze - Analyze source files

USAGE:
    csa analyze [OPTIONS] <file>...

OPTIONS:
    -l, --language <id>     Analyze with this language instead of detecting it
    -t, --threshold <n>     Report functions longer than n lines (default: 50)
    -o, --output <file>     Write JSON to a file
    --compact               Print JSON on a single line

DESCRIPTION:
    Prints functions, classes, imports and statistics, followed by the
    long-function, complexity and unused-import reports.
)";
                break;
            case Command::METRICS:
                std::cout << R"(csa metrics - Structural metrics

USAGE:
    csa metrics [OPTIONS] <file>...

DESCRIPTION:
    Prints counts of functions, methods, classes, variables, conditionals
    and loops together with complexity, depth and node count.
)";
                break;
            case Command::LANGUAGES:
                std::cout << R"(csa languages - List registered languages

USAGE:
    csa languages
)";
                break;
            default:
                print_help();
                break;
        }
    }

}  // namespace csa::cli

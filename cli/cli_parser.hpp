#ifndef CODESTRUCTUREANALYZER_CLI_PARSER_HPP
#define CODESTRUCTUREANALYZER_CLI_PARSER_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace csa::cli {

    enum class Command {
        PARSE,
        ANALYZE,
        METRICS,
        LANGUAGES,
        HELP,
        VERSION,
        UNKNOWN
    };

    struct Options {
        Command command = Command::UNKNOWN;

        std::vector<std::string> input_files;
        std::optional<std::string> output_file;
        std::optional<std::string> config_file;
        std::optional<std::string> language;
        std::optional<std::size_t> threshold;

        bool include_ast = false;
        bool compact = false;
        bool verbose = false;
        bool command_help = false;

        // Problems found while reading the arguments; non-empty means the
        // command must not run.
        std::vector<std::string> errors;
    };

    class CliParser {
    public:
        static Options parse(int argc, const char* const* argv);
        static void print_help();
        static void print_command_help(Command cmd);
        static void print_version();

    private:
        static Command parse_command(std::string_view cmd);
        static void parse_command_options(int argc, const char* const* argv, int& index, Options& opts);
    };

}  // namespace csa::cli

#endif //CODESTRUCTUREANALYZER_CLI_PARSER_HPP

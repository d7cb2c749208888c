#include "csa/core/config.hpp"
#include "csa/utils/file_utils.hpp"
#include "csa/utils/string_utils.hpp"

#include <toml++/toml.h>

#include <array>
#include <cstdint>
#include <sstream>
#include <vector>

namespace csa::core {

    namespace {

        constexpr int MAX_INDENT = 16;

        constexpr std::array<std::pair<std::string_view, spdlog::level::level_enum>, 7> LOG_LEVELS = {{
            {"trace", spdlog::level::trace},
            {"debug", spdlog::level::debug},
            {"info", spdlog::level::info},
            {"warn", spdlog::level::warn},
            {"error", spdlog::level::err},
            {"critical", spdlog::level::critical},
            {"off", spdlog::level::off},
        }};

        /**
         * Reads typed keys out of one TOML section, recording type mismatches
         * as "section.key" messages.
         */
        class SectionReader {
        public:
            SectionReader(const toml::table& root, std::string section, std::vector<std::string>& errors)
                : section_(std::move(section))
                , errors_(errors) {
                const toml::node_view node = root[section_];
                if (node && !node.is_table()) {
                    errors_.push_back(section_ + " must be a table");
                }
                table_ = node.as_table();
            }

            void read(const std::string_view key, bool& out) const {
                const toml::node* node = find(key);
                if (!node) {
                    return;
                }
                if (const auto* value = node->as_boolean()) {
                    out = value->get();
                } else {
                    mismatch(key, "a boolean");
                }
            }

            void read(const std::string_view key, std::string& out) const {
                const toml::node* node = find(key);
                if (!node) {
                    return;
                }
                if (const auto* value = node->as_string()) {
                    out = value->get();
                } else {
                    mismatch(key, "a string");
                }
            }

            void read(const std::string_view key, std::int64_t& out) const {
                const toml::node* node = find(key);
                if (!node) {
                    return;
                }
                if (const auto* value = node->as_integer()) {
                    out = value->get();
                } else {
                    mismatch(key, "an integer");
                }
            }

        private:
            const toml::node* find(const std::string_view key) const {
                return table_ ? table_->get(key) : nullptr;
            }

            void mismatch(const std::string_view key, const std::string_view expected) const {
                errors_.push_back(section_ + "." + std::string(key) + " must be " + std::string(expected));
            }

            std::string section_;
            std::vector<std::string>& errors_;
            const toml::table* table_ = nullptr;
        };

    }  // namespace

    Result<Config, Error> Config::load_from_file(const std::filesystem::path& path) {
        const auto content = file_utils::read_file(path);
        if (content.is_err()) {
            return Result<Config, Error>::failure(content.error());
        }

        auto config = load_from_string(content.value());
        if (config.is_err()) {
            return Result<Config, Error>::failure(config.error().with_context(path.string()));
        }
        return config;
    }

    Result<Config, Error> Config::load_from_string(const std::string_view content) {
        toml::table table;
        try {
            table = toml::parse(content);
        } catch (const toml::parse_error& err) {
            std::ostringstream context;
            context << "line " << err.source().begin.line << ", column " << err.source().begin.column;
            return Result<Config, Error>::failure(
                Error::config_error("Failed to parse TOML configuration: " + std::string(err.description()),
                                    context.str())
            );
        }

        Config config;
        std::vector<std::string> errors;

        std::int64_t threshold = static_cast<std::int64_t>(config.analysis.long_function_threshold);
        SectionReader(table, "analysis", errors).read("long_function_threshold", threshold);
        if (threshold < 0) {
            errors.emplace_back("analysis.long_function_threshold must be non-negative");
        } else {
            config.analysis.long_function_threshold = static_cast<std::size_t>(threshold);
        }

        const SectionReader output(table, "output", errors);
        std::int64_t indent = config.output.indent;
        output.read("indent", indent);
        if (indent < 0 || indent > MAX_INDENT) {
            errors.push_back("output.indent must be between 0 and " + std::to_string(MAX_INDENT));
        } else {
            config.output.indent = static_cast<int>(indent);
        }
        output.read("pretty_print", config.output.pretty_print);
        output.read("include_ast", config.output.include_ast);
        output.read("include_locations", config.output.include_locations);

        SectionReader(table, "logging", errors).read("level", config.logging.level);

        if (!errors.empty()) {
            return Result<Config, Error>::failure(
                Error::config_error("Invalid configuration", string_utils::join(errors, "; "))
            );
        }

        if (auto validation = config.validate(); validation.is_err()) {
            return Result<Config, Error>::failure(validation.error());
        }

        return Result<Config, Error>::success(std::move(config));
    }

    Result<void, Error> Config::validate() const {
        std::vector<std::string> errors;

        if (output.indent < 0 || output.indent > MAX_INDENT) {
            errors.push_back("output.indent must be between 0 and " + std::to_string(MAX_INDENT));
        }

        if (!parse_log_level(logging.level)) {
            errors.push_back("logging.level must be one of trace, debug, info, warn, error, critical, off");
        }

        if (!errors.empty()) {
            return Result<void, Error>::failure(
                Error::config_error("Invalid configuration", string_utils::join(errors, "; "))
            );
        }

        return Result<void, Error>::success();
    }

    std::string Config::to_string() const {
        const toml::table table{
            {"analysis", toml::table{
                {"long_function_threshold", static_cast<std::int64_t>(analysis.long_function_threshold)},
            }},
            {"output", toml::table{
                {"indent", output.indent},
                {"pretty_print", output.pretty_print},
                {"include_ast", output.include_ast},
                {"include_locations", output.include_locations},
            }},
            {"logging", toml::table{
                {"level", logging.level},
            }},
        };

        std::ostringstream ss;
        ss << table << "\n";
        return ss.str();
    }

    exporters::ExportOptions Config::export_options() const {
        exporters::ExportOptions options;
        options.pretty_print = output.pretty_print;
        options.indent = output.indent;
        options.include_ast = output.include_ast;
        options.include_locations = output.include_locations;
        return options;
    }

    std::optional<spdlog::level::level_enum> parse_log_level(const std::string_view name) {
        const std::string lowered = string_utils::to_lower(name);
        for (const auto& [level_name, level] : LOG_LEVELS) {
            if (lowered == level_name) {
                return level;
            }
        }
        if (lowered == "warning") {
            return spdlog::level::warn;
        }
        return std::nullopt;
    }

}  // namespace csa::core

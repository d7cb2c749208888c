#ifndef CODESTRUCTUREANALYZER_CONFIG_HPP
#define CODESTRUCTUREANALYZER_CONFIG_HPP

/**
 * @file config.hpp
 * @brief TOML configuration for the analyzer front end.
 *
 * Example file:
 * @code
 *     [analysis]
 *     long_function_threshold = 50
 *
 *     [output]
 *     indent = 2
 *     include_ast = false
 *
 *     [logging]
 *     level = "warn"
 * @endcode
 *
 * Missing sections and keys keep their defaults. Unknown keys are ignored.
 */

#include "csa/result.hpp"
#include "csa/error.hpp"
#include "csa/export/json_exporter.hpp"

#include <spdlog/common.h>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace csa::core {

    struct AnalysisConfig {
        std::size_t long_function_threshold = 50;
    };

    struct OutputConfig {
        int indent = 2;
        bool pretty_print = true;
        bool include_ast = false;
        bool include_locations = true;
    };

    struct LoggingConfig {
        std::string level = "warn";
    };

    class Config {
    public:
        Config() = default;

        AnalysisConfig analysis;
        OutputConfig output;
        LoggingConfig logging;

        /**
         * Load configuration from a TOML file.
         *
         * @return The configuration, the read error of the file, or
         *         ConfigError if the content is invalid.
         */
        static Result<Config, Error> load_from_file(const std::filesystem::path& path);

        /**
         * Load configuration from TOML text.
         *
         * @return ConfigError on a TOML syntax error, a value of the wrong
         *         type, or a value out of range.
         */
        static Result<Config, Error> load_from_string(std::string_view content);

        [[nodiscard]] Result<void, Error> validate() const;

        /**
         * Serializes the configuration back to TOML.
         */
        [[nodiscard]] std::string to_string() const;

        [[nodiscard]] exporters::ExportOptions export_options() const;
    };

    /**
     * Maps a level name ("trace", "debug", "info", "warn", "error",
     * "critical", "off") to the spdlog level. Case-insensitive.
     */
    std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name);

}  // namespace csa::core

#endif //CODESTRUCTUREANALYZER_CONFIG_HPP

#include "app.hpp"
#include "csa/analyzers/python_analyzer.hpp"
#include "csa/ast/traversal.hpp"
#include "csa/export/json_exporter.hpp"
#include "csa/utils/file_utils.hpp"
#include "csa/utils/string_utils.hpp"
#include "csa/version.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <fstream>
#include <iostream>

namespace csa::cli {

    App::App(Options options)
        : options_(std::move(options))
    {
        parsers::register_default_parsers(registry_);
        analyzers_.push_back(std::make_unique<analyzers::PythonAnalyzer>());
    }

    int App::run() {
        if (auto loaded = load_config(); loaded.is_err()) {
            std::cerr << "Configuration error: " << loaded.error() << "\n";
            return 1;
        }

        configure_logging();

        switch (options_.command) {
            case Command::PARSE:
                return run_parse();
            case Command::ANALYZE:
                return run_analyze();
            case Command::METRICS:
                return run_metrics();
            case Command::LANGUAGES:
                return run_languages();
            default:
                std::cerr << "Unknown command\n";
                return 1;
        }
    }

    Result<void, Error> App::load_config() {
        if (options_.config_file) {
            auto loaded = core::Config::load_from_file(*options_.config_file);
            if (loaded.is_err()) {
                return Result<void, Error>::failure(loaded.error());
            }
            config_ = std::move(loaded.value());
        }

        if (options_.threshold) {
            config_.analysis.long_function_threshold = *options_.threshold;
        }
        if (options_.include_ast) {
            config_.output.include_ast = true;
        }
        if (options_.compact) {
            config_.output.pretty_print = false;
        }
        if (options_.verbose) {
            config_.logging.level = "debug";
        }

        return Result<void, Error>::success();
    }

    void App::configure_logging() const {
        auto logger = spdlog::get(PROJECT_SHORT_NAME);
        if (!logger) {
            logger = spdlog::stderr_color_mt(PROJECT_SHORT_NAME);
        }
        spdlog::set_default_logger(logger);
        spdlog::set_level(core::parse_log_level(config_.logging.level).value_or(spdlog::level::warn));
    }

    Result<parsers::ParseResult, Error> App::parse_input(const std::string& file) const {
        if (!options_.language) {
            return registry_.parse_file(file);
        }

        auto content = file_utils::read_file(file);
        if (content.is_err()) {
            return Result<parsers::ParseResult, Error>::failure(content.error());
        }
        return registry_.parse(content.value(), *options_.language, file);
    }

    Result<const analyzers::ILanguageAnalyzer*, Error> App::find_analyzer(const std::string& file) const {
        std::string language;
        if (options_.language) {
            language = string_utils::to_lower(*options_.language);
        } else if (const auto* parser = registry_.get_parser_by_filename(file)) {
            language = std::string(parser->language_id());
        } else {
            return Result<const analyzers::ILanguageAnalyzer*, Error>::failure(
                Error::config_error("No parser found for file", file)
            );
        }

        for (const auto& analyzer : analyzers_) {
            if (analyzer->language_id() == language) {
                return Result<const analyzers::ILanguageAnalyzer*, Error>::success(analyzer.get());
            }
        }

        return Result<const analyzers::ILanguageAnalyzer*, Error>::failure(
            Error::config_error("No analyzer registered for language", language)
        );
    }

    int App::run_parse() {
        const exporters::JsonExporter exporter(config_.export_options());

        std::vector<nlohmann::json> documents;
        int exit_code = 0;

        for (const auto& file : options_.input_files) {
            auto result = parse_input(file);
            if (result.is_err()) {
                std::cerr << "Error: " << result.error() << "\n";
                exit_code = 1;
                continue;
            }
            documents.push_back(exporter.parse_result_to_json(result.value()));
        }

        if (auto written = emit(documents); written.is_err()) {
            std::cerr << "Error: " << written.error() << "\n";
            return 1;
        }
        return exit_code;
    }

    nlohmann::json App::analysis_report(const analyzers::ModuleAnalysis& analysis) const {
        nlohmann::json report = analysis.to_json();
        report["file"] = analysis.filename.value_or("");
        report["language"] = analysis.language;

        const std::size_t threshold = config_.analysis.long_function_threshold;
        nlohmann::json long_functions = nlohmann::json::array();
        for (const auto* function : analysis.find_long_functions(threshold)) {
            long_functions.push_back({
                {"name", function->name},
                {"length", function->length()},
                {"line_start", function->line_start}
            });
        }

        nlohmann::json complexity = nlohmann::json::array();
        for (const auto& [name, value] : analysis.get_complexity_report()) {
            complexity.push_back({{"name", name}, {"complexity", value}});
        }

        report["long_functions"] = {{"threshold", threshold}, {"functions", long_functions}};
        report["complexity_report"] = complexity;
        report["unused_imports"] = analysis.find_unused_imports();
        report["dependencies"] = analysis.get_dependencies();

        nlohmann::json syntax_errors = nlohmann::json::array();
        for (const auto& error : analysis.syntax_errors) {
            syntax_errors.push_back(exporters::JsonExporter::diagnostic_to_json(error));
        }
        report["syntax_errors"] = syntax_errors;

        return report;
    }

    int App::run_analyze() {
        std::vector<nlohmann::json> documents;
        int exit_code = 0;

        for (const auto& file : options_.input_files) {
            auto analyzer = find_analyzer(file);
            if (analyzer.is_err()) {
                std::cerr << "Error: " << analyzer.error() << "\n";
                exit_code = 1;
                continue;
            }

            auto analysis = analyzer.value()->analyze_file(file);
            if (analysis.is_err()) {
                std::cerr << "Error: " << analysis.error() << "\n";
                exit_code = 1;
                continue;
            }

            documents.push_back(analysis_report(analysis.value()));
        }

        if (auto written = emit(documents); written.is_err()) {
            std::cerr << "Error: " << written.error() << "\n";
            return 1;
        }
        return exit_code;
    }

    int App::run_metrics() {
        std::vector<nlohmann::json> documents;
        int exit_code = 0;

        for (const auto& file : options_.input_files) {
            auto result = parse_input(file);
            if (result.is_err()) {
                std::cerr << "Error: " << result.error() << "\n";
                exit_code = 1;
                continue;
            }

            const auto& parsed = result.value();
            nlohmann::json document = exporters::JsonExporter::metrics_to_json(ast::extract_metrics(*parsed.ast));
            document["file"] = file;
            document["language"] = parsed.metadata.language;
            document["syntax_errors"] = parsed.errors.size();
            documents.push_back(std::move(document));
        }

        if (auto written = emit(documents); written.is_err()) {
            std::cerr << "Error: " << written.error() << "\n";
            return 1;
        }
        return exit_code;
    }

    int App::run_languages() const {
        for (const auto& language : registry_.registered_languages()) {
            const auto* parser = registry_.get_parser(language);
            std::vector<std::string> extensions;
            for (const auto& extension : parser->supported_extensions()) {
                extensions.push_back("." + extension);
            }
            std::cout << language << ": " << string_utils::join(extensions, ", ") << "\n";
        }
        return 0;
    }

    Result<void, Error> App::emit(const std::vector<nlohmann::json>& documents) const {
        if (documents.empty()) {
            return Result<void, Error>::success();
        }

        const exporters::JsonExporter exporter(config_.export_options());
        const nlohmann::json output = documents.size() == 1 ? documents.front() : nlohmann::json(documents);

        if (!options_.output_file) {
            return exporter.write(std::cout, output);
        }

        std::ofstream file(*options_.output_file);
        if (!file) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to open output file", *options_.output_file)
            );
        }

        auto written = exporter.write(file, output);
        if (written.is_ok()) {
            spdlog::info("Wrote {}", *options_.output_file);
        }
        return written;
    }

}  // namespace csa::cli

#ifndef CODESTRUCTUREANALYZER_APP_HPP
#define CODESTRUCTUREANALYZER_APP_HPP

#include "cli_parser.hpp"
#include "csa/result.hpp"
#include "csa/error.hpp"
#include "csa/core/config.hpp"
#include "csa/parsers/parser.hpp"
#include "csa/analyzers/analyzer.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <vector>

namespace csa::cli {

    class App {
    public:
        explicit App(Options options);
        ~App() = default;

        int run();

    private:
        int run_parse();
        int run_analyze();
        int run_metrics();
        int run_languages() const;

        Result<void, Error> load_config();
        void configure_logging() const;

        /**
         * Parses one input, honouring --language when it is given.
         */
        Result<parsers::ParseResult, Error> parse_input(const std::string& file) const;

        /**
         * Picks the analyzer for --language, or for the language of the
         * parser that claims the file name.
         */
        Result<const analyzers::ILanguageAnalyzer*, Error> find_analyzer(const std::string& file) const;

        nlohmann::json analysis_report(const analyzers::ModuleAnalysis& analysis) const;

        /**
         * Writes one document per input, or an array when there are several.
         */
        Result<void, Error> emit(const std::vector<nlohmann::json>& documents) const;

        Options options_;
        core::Config config_;
        parsers::ParserRegistry registry_;
        std::vector<std::unique_ptr<analyzers::ILanguageAnalyzer>> analyzers_;
    };

}  // namespace csa::cli

#endif //CODESTRUCTUREANALYZER_APP_HPP

#ifndef CODESTRUCTUREANALYZER_PYTHON_ANALYZER_HPP
#define CODESTRUCTUREANALYZER_PYTHON_ANALYZER_HPP

/**
 * @file python_analyzer.hpp
 * @brief Python module analyzer.
 *
 * Works on the tree-sitter-python tree. Complexity counts if, elif,
 * while, for and except clauses plus one per boolean operator, so an
 * "a and b and c" chain adds two.
 */

#include "csa/analyzers/analyzer.hpp"

namespace csa::analyzers {

    class PythonAnalyzer final : public ILanguageAnalyzer {
    public:
        [[nodiscard]] std::string_view language_id() const noexcept override {
            return "python";
        }

        [[nodiscard]] Result<ModuleAnalysis, Error> analyze(
            std::string_view source,
            std::string_view filename
        ) const override;
    };

}  // namespace csa::analyzers

#endif //CODESTRUCTUREANALYZER_PYTHON_ANALYZER_HPP

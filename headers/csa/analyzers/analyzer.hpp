#ifndef CODESTRUCTUREANALYZER_ANALYZER_HPP
#define CODESTRUCTUREANALYZER_ANALYZER_HPP

/**
 * @file analyzer.hpp
 * @brief Language analyzer interface and module analysis types.
 *
 * Analyzers read a language's native parse tree directly (not the
 * canonical AST) so they can use everything the grammar knows: decorators,
 * docstrings, boolean operators, import aliases. The result of analyzing
 * one module is a ModuleAnalysis, which also answers the derived queries
 * (call graph, unused imports, long functions, statistics).
 *
 * Analyzer types:
 * - PythonAnalyzer: tree-sitter-python based module analysis
 */

#include "csa/result.hpp"
#include "csa/error.hpp"
#include "csa/parsers/parser.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace csa::analyzers {

    namespace fs = std::filesystem;

    /**
     * A function or method definition.
     */
    struct FunctionInfo {
        std::string name;
        std::vector<std::string> args;
        std::optional<std::string> returns;
        std::optional<std::string> docstring;
        std::size_t line_start = 0;
        std::size_t line_end = 0;
        std::size_t complexity = 1;
        std::set<std::string> calls;
        std::vector<std::string> decorators;
        bool is_async = false;

        [[nodiscard]] std::size_t length() const noexcept {
            return line_end >= line_start ? line_end - line_start : 0;
        }
    };

    struct ClassInfo {
        std::string name;
        std::vector<std::string> bases;
        std::vector<FunctionInfo> methods;
        std::optional<std::string> docstring;
        std::size_t line_start = 0;
        std::size_t line_end = 0;
        std::vector<std::string> decorators;
    };

    /**
     * One import statement entry.
     *
     * A plain import ("import a.b as c, d") yields one entry per imported
     * module. A selective import ("from m import x as y, z") yields one
     * entry listing every imported name. @c bound_names are the names the
     * statement introduces into the module namespace, parallel to
     * @c names for selective imports.
     */
    struct ImportInfo {
        std::string module;
        std::vector<std::string> names;
        std::optional<std::string> alias;
        std::size_t line = 0;

        bool is_from = false;
        std::vector<std::string> bound_names;
    };

    /**
     * A module-level assignment target.
     */
    struct VariableInfo {
        std::string name;
        std::size_t line = 0;
        std::optional<std::string> annotation;
    };

    struct ModuleStatistics {
        std::size_t total_lines = 0;
        std::size_t non_empty_lines = 0;
        std::size_t num_functions = 0;
        std::size_t num_classes = 0;
        std::size_t num_imports = 0;
        std::size_t num_globals = 0;
        double avg_complexity = 0.0;
        std::size_t max_complexity = 0;
        std::size_t functions_without_docstrings = 0;
    };

    /**
     * Everything extracted from one module.
     *
     * @c functions holds the functions that are not methods, nested ones
     * included, in source order. Methods live in their ClassInfo. Classes
     * are listed in source order, nested ones included.
     */
    struct ModuleAnalysis {
        std::string language;
        std::optional<std::string> filename;

        std::vector<FunctionInfo> functions;
        std::vector<ClassInfo> classes;
        std::vector<ImportInfo> imports;
        std::vector<VariableInfo> globals;

        /// Names referenced as identifiers outside import statements.
        std::set<std::string> used_names;

        std::vector<parsers::ParseDiagnostic> syntax_errors;

        std::size_t total_lines = 0;
        std::size_t non_empty_lines = 0;

        /**
         * Functions followed by each class's methods, in class order.
         */
        [[nodiscard]] std::vector<const FunctionInfo*> all_functions() const;

        [[nodiscard]] const FunctionInfo* find_function(std::string_view name) const;
        [[nodiscard]] const ClassInfo* find_class(std::string_view name) const;

        /**
         * Call graph edges: function name to the callee names in its body.
         * When two functions share a name the later one wins.
         */
        [[nodiscard]] std::map<std::string, std::set<std::string>> get_dependencies() const;

        /**
         * Imports whose bound names are never referenced.
         *
         * Entries read "module", "module as alias" or "module.name".
         * Wildcard imports are never reported.
         */
        [[nodiscard]] std::vector<std::string> find_unused_imports() const;

        /**
         * Functions and methods spanning more than @p threshold lines,
         * longest first.
         */
        [[nodiscard]] std::vector<const FunctionInfo*> find_long_functions(std::size_t threshold = 50) const;

        [[nodiscard]] std::vector<const FunctionInfo*> find_functions_without_docstrings() const;

        /**
         * (name, complexity) for every function and method, most complex
         * first.
         */
        [[nodiscard]] std::vector<std::pair<std::string, std::size_t>> get_complexity_report() const;

        [[nodiscard]] ModuleStatistics get_statistics() const;

        /**
         * Serializes the analysis as
         * {functions, classes, imports, statistics}.
         */
        [[nodiscard]] nlohmann::json to_json() const;
    };

    /**
     * Base interface for language analyzers.
     */
    class ILanguageAnalyzer {
    public:
        virtual ~ILanguageAnalyzer() = default;

        /**
         * Returns the language identifier (e.g., "python").
         */
        [[nodiscard]] virtual std::string_view language_id() const noexcept = 0;

        /**
         * Analyzes source text.
         *
         * Syntax errors do not fail the call; they are recorded in
         * ModuleAnalysis::syntax_errors and the rest of the module is
         * still analyzed.
         *
         * @param source The module source.
         * @param filename Name recorded in the result; may be empty.
         * @return The analysis, or an error if no tree could be built.
         */
        [[nodiscard]] virtual Result<ModuleAnalysis, Error> analyze(
            std::string_view source,
            std::string_view filename
        ) const = 0;

        /**
         * Reads and analyzes a file.
         *
         * @return The analysis, or the read error unchanged.
         */
        [[nodiscard]] Result<ModuleAnalysis, Error> analyze_file(const fs::path& path) const;
    };

    /**
     * Line counts shared by the analyzers.
     *
     * total_lines counts '\n'-separated segments ("" has 1); non-empty
     * lines are those with content that does not start with @p comment.
     */
    [[nodiscard]] std::pair<std::size_t, std::size_t> count_lines(std::string_view source, std::string_view comment);

}  // namespace csa::analyzers

#endif //CODESTRUCTUREANALYZER_ANALYZER_HPP

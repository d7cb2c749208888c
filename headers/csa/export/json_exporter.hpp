#ifndef CODESTRUCTUREANALYZER_JSON_EXPORTER_HPP
#define CODESTRUCTUREANALYZER_JSON_EXPORTER_HPP

/**
 * @file json_exporter.hpp
 * @brief JSON serialization of ASTs, parse results and metrics.
 *
 * The documents produced here are what downstream renderers consume; the
 * analyzer export lives on ModuleAnalysis::to_json().
 */

#include "csa/result.hpp"
#include "csa/error.hpp"
#include "csa/ast/node.hpp"
#include "csa/ast/traversal.hpp"
#include "csa/parsers/parser.hpp"

#include <nlohmann/json.hpp>

#include <ostream>
#include <string>

namespace csa::exporters {

    /**
     * Export options for controlling output.
     */
    struct ExportOptions {
        bool pretty_print = true;       // Indent nested values
        int indent = 2;                 // Spaces per level when pretty printing
        bool include_ast = true;        // Emit the tree in parse results
        bool include_locations = true;  // Emit node source ranges
    };

    class JsonExporter {
    public:
        explicit JsonExporter(ExportOptions options = {});

        [[nodiscard]] const ExportOptions& options() const noexcept {
            return options_;
        }

        /**
         * Serializes a node and its subtree.
         *
         * Every node carries "type"; "loc" and "metadata" appear when
         * present. Absent optional children are null.
         */
        [[nodiscard]] nlohmann::json node_to_json(const ast::Node& node) const;

        /**
         * Serializes {ast, errors, warnings, metadata}. "ast" is null when
         * include_ast is off.
         */
        [[nodiscard]] nlohmann::json parse_result_to_json(const parsers::ParseResult& result) const;

        [[nodiscard]] static nlohmann::json diagnostic_to_json(const parsers::ParseDiagnostic& diagnostic);
        [[nodiscard]] static nlohmann::json metrics_to_json(const ast::CodeMetrics& metrics);

        /**
         * Formats a document according to the options. Invalid UTF-8 in
         * strings is replaced rather than rejected.
         */
        [[nodiscard]] std::string dump(const nlohmann::json& document) const;

        /**
         * Writes a formatted document followed by a newline.
         *
         * @return IoError if the stream fails.
         */
        [[nodiscard]] Result<void, Error> write(std::ostream& stream, const nlohmann::json& document) const;

    private:
        ExportOptions options_;
    };

}  // namespace csa::exporters

#endif //CODESTRUCTUREANALYZER_JSON_EXPORTER_HPP

#ifndef CODESTRUCTUREANALYZER_PYTHON_PARSER_HPP
#define CODESTRUCTUREANALYZER_PYTHON_PARSER_HPP

/**
 * @file python_parser.hpp
 * @brief Python front-end.
 *
 * Parses Python source with tree-sitter-python and converts the native
 * tree into the canonical AST:
 *
 * - def                      -> FunctionDeclaration, or MethodDeclaration
 *                               directly inside a class body
 * - class                    -> ClassDeclaration
 * - name = value             -> VariableDeclaration
 * - if / elif / else         -> IfStatement (elif nests as alternate)
 * - while, for               -> WhileLoop, ForLoop
 * - return                   -> ReturnStatement
 * - try, with, match         -> BlockStatement (metadata "construct")
 * - calls                    -> CallExpression
 * - other expressions        -> ExpressionStatement (metadata "kind")
 *
 * Syntax errors are reported as diagnostics and the affected regions are
 * left out of the AST; everything else is still converted.
 */

#include "csa/parsers/parser.hpp"

#include <set>
#include <string>
#include <string_view>

namespace csa::parsers {

    class PythonParser final : public IParser {
    public:
        explicit PythonParser(ParserConfig config = {});

        [[nodiscard]] std::string_view language_id() const noexcept override {
            return "python";
        }

        [[nodiscard]] std::set<std::string> supported_extensions() const override {
            return {"py", "pyw", "python"};
        }

        [[nodiscard]] const ParserConfig& config() const noexcept {
            return config_;
        }

    protected:
        [[nodiscard]] ParseResult do_parse(std::string_view source) const override;

    private:
        ParserConfig config_;
    };

}  // namespace csa::parsers

#endif //CODESTRUCTUREANALYZER_PYTHON_PARSER_HPP

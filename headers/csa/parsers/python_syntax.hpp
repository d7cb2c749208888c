#ifndef CODESTRUCTUREANALYZER_PYTHON_SYNTAX_HPP
#define CODESTRUCTUREANALYZER_PYTHON_SYNTAX_HPP

/**
 * @file python_syntax.hpp
 * @brief Python-specific readers over the tree-sitter Python tree.
 *
 * Shared by the Python front-end and the Python analyzer.
 */

#include "csa/parsers/syntax_tree.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace csa::parsers::python {

    /**
     * True for integer, float and string literal nodes.
     */
    [[nodiscard]] bool is_literal(TSNode node) noexcept;

    /**
     * True for node types that stand for a whole statement.
     */
    [[nodiscard]] bool is_statement(TSNode node) noexcept;

    /**
     * Name of a decorator: "name", "pkg.name", or the callee of a call
     * decorator ("app.route" for @app.route("/")).
     */
    [[nodiscard]] std::string decorator_name(const SyntaxTree& tree, TSNode decorator);

    /**
     * Evaluates a plain string literal (or an implicit concatenation of
     * them) to its value.
     *
     * @return The value; nullopt for bytes, f-strings and anything that is
     *         not a string literal.
     */
    [[nodiscard]] std::optional<std::string> string_value(const SyntaxTree& tree, TSNode node);

    /**
     * Normalizes docstring indentation: tabs are expanded, the first line
     * is stripped of leading whitespace, the common indentation of the
     * remaining lines is removed, and leading/trailing blank lines are
     * dropped.
     */
    [[nodiscard]] std::string cleandoc(std::string_view doc);

    /**
     * Docstring of a function, class or module body.
     *
     * @param body A block (or module) node.
     * @return The cleaned docstring when the first statement is a string
     *         literal expression.
     */
    [[nodiscard]] std::optional<std::string> docstring(const SyntaxTree& tree, TSNode body);

}  // namespace csa::parsers::python

#endif //CODESTRUCTUREANALYZER_PYTHON_SYNTAX_HPP

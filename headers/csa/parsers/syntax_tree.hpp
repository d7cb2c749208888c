#ifndef CODESTRUCTUREANALYZER_SYNTAX_TREE_HPP
#define CODESTRUCTUREANALYZER_SYNTAX_TREE_HPP

/**
 * @file syntax_tree.hpp
 * @brief Owning wrapper around a tree-sitter concrete syntax tree.
 *
 * The Python front-end and the Python analyzer both read the native
 * tree-sitter tree. SyntaxTree keeps the source text and the TSTree
 * together so that node text and positions can be resolved safely for as
 * long as the wrapper lives.
 *
 * TSNode values returned from here are views into the tree and must not
 * outlive the SyntaxTree they came from.
 */

#include "csa/result.hpp"
#include "csa/error.hpp"
#include "csa/ast/node.hpp"
#include "csa/parsers/parser.hpp"

extern "C" {
#include <tree_sitter/api.h>
}

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace csa::parsers {

    class SyntaxTree {
    public:
        /**
         * Parses @p source with the tree-sitter Python grammar.
         *
         * Syntax errors do not fail the call; they show up as ERROR and
         * MISSING nodes (see syntax_errors()).
         *
         * @return The tree, or InternalError if the grammar could not be
         *         loaded or tree-sitter produced no tree.
         */
        [[nodiscard]] static Result<SyntaxTree, Error> parse_python(std::string_view source);

        [[nodiscard]] TSNode root() const noexcept;

        [[nodiscard]] std::string_view source() const noexcept {
            return source_;
        }

        /**
         * Source text spanned by @p node.
         */
        [[nodiscard]] std::string_view text(TSNode node) const noexcept;

        /**
         * Text of a 1-based line, without its terminator. Empty for lines
         * outside the source.
         */
        [[nodiscard]] std::string_view line_text(std::size_t line) const noexcept;

        [[nodiscard]] ast::SourceLocation start_of(TSNode node) const noexcept;

        /**
         * End position of @p node.
         *
         * A node whose native end sits at column 0 of a later line (block
         * bodies ending with their newline) is reported as ending at the
         * end of the previous line instead.
         */
        [[nodiscard]] ast::SourceLocation end_of(TSNode node) const noexcept;

        [[nodiscard]] ast::SourceRange range_of(TSNode node) const noexcept {
            return {start_of(node), end_of(node)};
        }

        [[nodiscard]] bool has_errors() const noexcept;

        /**
         * One SyntaxError diagnostic per ERROR or MISSING node, in source
         * order. The nodes inside an ERROR node are not reported again.
         */
        [[nodiscard]] std::vector<ParseDiagnostic> syntax_errors() const;

    private:
        SyntaxTree(std::string source, TSTree* tree);

        void collect_errors(TSNode node, std::vector<ParseDiagnostic>& out) const;

        std::string source_;
        std::vector<std::size_t> line_offsets_;
        std::unique_ptr<TSTree, decltype(&ts_tree_delete)> tree_;
    };

    /**
     * Small helpers over raw TSNode values.
     */
    namespace ts {

        [[nodiscard]] std::string_view type(TSNode node) noexcept;

        [[nodiscard]] inline bool is(const TSNode node, const std::string_view kind) noexcept {
            return !ts_node_is_null(node) && type(node) == kind;
        }

        /**
         * The child stored under @p name, or a null node.
         */
        [[nodiscard]] TSNode field(TSNode node, std::string_view name) noexcept;

        /**
         * Every child stored under @p name, for repeated fields.
         */
        [[nodiscard]] std::vector<TSNode> field_children(TSNode node, std::string_view name);

        [[nodiscard]] std::vector<TSNode> named_children(TSNode node);

        /**
         * All children, anonymous tokens included.
         */
        [[nodiscard]] std::vector<TSNode> children(TSNode node);

        /**
         * True if an anonymous child token of @p node has type @p token
         * (e.g. the "async" keyword of a function definition).
         */
        [[nodiscard]] bool has_token(TSNode node, std::string_view token) noexcept;

    }  // namespace ts

}  // namespace csa::parsers

#endif //CODESTRUCTUREANALYZER_SYNTAX_TREE_HPP

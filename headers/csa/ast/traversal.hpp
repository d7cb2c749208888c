#ifndef CODESTRUCTUREANALYZER_TRAVERSAL_HPP
#define CODESTRUCTUREANALYZER_TRAVERSAL_HPP

/**
 * @file traversal.hpp
 * @brief Generic traversal and query functions over the canonical AST.
 *
 * Everything here goes through Node::children() only, so the functions
 * work for trees produced by any front-end. They never fail: on a partial
 * tree (after a syntax error) absent children are simply not visited.
 *
 * Ordering is pre-order depth-first throughout: a node is visited before
 * its children, and children are visited in their natural order.
 */

#include "csa/ast/node.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace csa::ast {

    /**
     * Callback for walk(). @p parent is nullptr for the root.
     */
    using WalkCallback = std::function<void(const Node& node, const Node* parent)>;

    /**
     * Visits @p root and every descendant in pre-order.
     */
    void walk(const Node& root, const WalkCallback& visit);

    /**
     * All nodes with tag @p type, in pre-order.
     */
    [[nodiscard]] std::vector<const Node*> find_nodes_by_type(const Node& root, NodeType type);

    /**
     * Returns the last node in pre-order whose range contains @p line.
     *
     * The search does not stop at the first match; a later match replaces
     * an earlier one. For well-nested trees this is the innermost node
     * spanning the line.
     *
     * @return The node, or nullptr when no ranged node covers the line.
     */
    [[nodiscard]] const Node* find_node_at_line(const Node& root, std::size_t line);

    /**
     * All nodes whose range lies within [lo, hi], in pre-order. Nodes
     * without a range are never returned.
     */
    [[nodiscard]] std::vector<const Node*> find_nodes_at_range(
        const Node& root,
        const SourceLocation& lo,
        const SourceLocation& hi
    );

    [[nodiscard]] std::size_t count_nodes(const Node& root);

    /**
     * Maximum nesting depth below @p root. The root itself is depth 0.
     */
    [[nodiscard]] std::size_t get_max_depth(const Node& root);

    /**
     * Structural cyclomatic complexity: 1 plus the number of IfStatement,
     * WhileLoop and ForLoop nodes in the subtree, @p node included.
     */
    [[nodiscard]] std::size_t calculate_complexity(const Node& node);

    /**
     * One recorded occurrence of a name.
     */
    struct SymbolOccurrence {
        NodeType kind = NodeType::Identifier;
        std::optional<SourceLocation> location;
        std::optional<NodeType> enclosing;
    };

    /**
     * Name to occurrences, each list in pre-order discovery order. The
     * table is flat: there is no scoping.
     */
    using SymbolTable = std::map<std::string, std::vector<SymbolOccurrence>>;

    [[nodiscard]] SymbolTable build_symbol_table(const Node& root);

    /**
     * Names of declared variables that occur exactly once in the whole
     * tree (the declaration itself).
     *
     * This is a heuristic without scoping, shadowing or aliasing; it can
     * report false positives and false negatives.
     *
     * @return Each flagged name once, in discovery order.
     */
    [[nodiscard]] std::vector<std::string> find_unused_variables(const Node& root);

    /**
     * Aggregate structural counts for a tree.
     */
    struct CodeMetrics {
        std::size_t functions = 0;
        std::size_t methods = 0;
        std::size_t classes = 0;
        std::size_t variables = 0;
        std::size_t conditionals = 0;
        std::size_t loops = 0;
        std::size_t complexity = 1;
        std::size_t depth = 0;
        std::size_t node_count = 0;
    };

    [[nodiscard]] CodeMetrics extract_metrics(const Node& root);

}  // namespace csa::ast

#endif //CODESTRUCTUREANALYZER_TRAVERSAL_HPP

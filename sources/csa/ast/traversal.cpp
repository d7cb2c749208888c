#include "csa/ast/traversal.hpp"

#include <algorithm>
#include <set>

namespace csa::ast {

    namespace {

        void walk_impl(const Node& node, const Node* parent, const WalkCallback& visit) {
            visit(node, parent);
            for (const Node* child : node.children()) {
                walk_impl(*child, &node, visit);
            }
        }

        bool is_decision_point(const NodeType type) noexcept {
            return type == NodeType::IfStatement ||
                   type == NodeType::WhileLoop ||
                   type == NodeType::ForLoop;
        }

        std::size_t count_decision_points(const Node& node) {
            std::size_t count = is_decision_point(node.type()) ? 1 : 0;
            for (const Node* child : node.children()) {
                count += count_decision_points(*child);
            }
            return count;
        }

    }  // namespace

    void walk(const Node& root, const WalkCallback& visit) {
        walk_impl(root, nullptr, visit);
    }

    std::vector<const Node*> find_nodes_by_type(const Node& root, const NodeType type) {
        std::vector<const Node*> result;
        walk(root, [&](const Node& node, const Node*) {
            if (node.type() == type) {
                result.push_back(&node);
            }
        });
        return result;
    }

    const Node* find_node_at_line(const Node& root, const std::size_t line) {
        const Node* found = nullptr;
        walk(root, [&](const Node& node, const Node*) {
            if (node.range && node.range->contains_line(line)) {
                found = &node;
            }
        });
        return found;
    }

    std::vector<const Node*> find_nodes_at_range(
        const Node& root,
        const SourceLocation& lo,
        const SourceLocation& hi
    ) {
        std::vector<const Node*> result;
        walk(root, [&](const Node& node, const Node*) {
            if (node.range && node.range->within(lo, hi)) {
                result.push_back(&node);
            }
        });
        return result;
    }

    std::size_t count_nodes(const Node& root) {
        std::size_t count = 1;
        for (const Node* child : root.children()) {
            count += count_nodes(*child);
        }
        return count;
    }

    std::size_t get_max_depth(const Node& root) {
        std::size_t deepest = 0;
        for (const Node* child : root.children()) {
            deepest = std::max(deepest, get_max_depth(*child) + 1);
        }
        return deepest;
    }

    std::size_t calculate_complexity(const Node& node) {
        return 1 + count_decision_points(node);
    }

    SymbolTable build_symbol_table(const Node& root) {
        SymbolTable table;
        walk(root, [&](const Node& node, const Node* parent) {
            const std::string_view name = node.symbol_name();
            if (name.empty()) {
                return;
            }

            SymbolOccurrence occurrence;
            occurrence.kind = node.type();
            if (node.range) {
                occurrence.location = node.range->start;
            }
            if (parent) {
                occurrence.enclosing = parent->type();
            }
            table[std::string(name)].push_back(occurrence);
        });
        return table;
    }

    std::vector<std::string> find_unused_variables(const Node& root) {
        const SymbolTable table = build_symbol_table(root);

        std::vector<std::string> unused;
        std::set<std::string> reported;

        for (const Node* node : find_nodes_by_type(root, NodeType::VariableDeclaration)) {
            std::string name(node->symbol_name());
            if (name.empty() || reported.contains(name)) {
                continue;
            }

            if (const auto it = table.find(name); it != table.end() && it->second.size() == 1) {
                reported.insert(name);
                unused.push_back(std::move(name));
            }
        }

        return unused;
    }

    CodeMetrics extract_metrics(const Node& root) {
        CodeMetrics metrics;

        walk(root, [&](const Node& node, const Node*) {
            ++metrics.node_count;
            switch (node.type()) {
                case NodeType::FunctionDeclaration:
                    ++metrics.functions;
                    break;
                case NodeType::MethodDeclaration:
                    ++metrics.methods;
                    break;
                case NodeType::ClassDeclaration:
                    ++metrics.classes;
                    break;
                case NodeType::VariableDeclaration:
                    ++metrics.variables;
                    break;
                case NodeType::IfStatement:
                    ++metrics.conditionals;
                    break;
                case NodeType::WhileLoop:
                case NodeType::ForLoop:
                    ++metrics.loops;
                    break;
                default:
                    break;
            }
        });

        metrics.complexity = 1 + metrics.conditionals + metrics.loops;
        metrics.depth = get_max_depth(root);
        return metrics;
    }

}  // namespace csa::ast

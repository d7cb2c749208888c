#ifndef CODESTRUCTUREANALYZER_VISITOR_HPP
#define CODESTRUCTUREANALYZER_VISITOR_HPP

/**
 * @file visitor.hpp
 * @brief Typed visitor over the canonical AST.
 *
 * Subclasses override the hooks for the kinds they care about. For every
 * node, traverse() first calls the kind-specific hook and then
 * visit_node(); if either returns VisitAction::SkipChildren the node's
 * subtree is not entered.
 *
 * Usage:
 * @code
 *     class FunctionNames final : public NodeVisitor {
 *     public:
 *         std::vector<std::string> names;
 *     protected:
 *         VisitAction visit_function(const FunctionDeclaration& fn) override {
 *             names.push_back(fn.name);
 *             return VisitAction::SkipChildren;
 *         }
 *     };
 * @endcode
 */

#include "csa/ast/node.hpp"

namespace csa::ast {

    enum class VisitAction {
        Continue,
        SkipChildren
    };

    class NodeVisitor {
    public:
        virtual ~NodeVisitor() = default;

        /**
         * Visits @p root and its descendants in pre-order.
         */
        void traverse(const Node& root);

    protected:
        virtual VisitAction visit_program(const Program&) { return VisitAction::Continue; }
        virtual VisitAction visit_function(const FunctionDeclaration&) { return VisitAction::Continue; }
        virtual VisitAction visit_class(const ClassDeclaration&) { return VisitAction::Continue; }
        virtual VisitAction visit_method(const MethodDeclaration&) { return VisitAction::Continue; }
        virtual VisitAction visit_variable(const VariableDeclaration&) { return VisitAction::Continue; }
        virtual VisitAction visit_if(const IfStatement&) { return VisitAction::Continue; }
        virtual VisitAction visit_while(const WhileLoop&) { return VisitAction::Continue; }
        virtual VisitAction visit_for(const ForLoop&) { return VisitAction::Continue; }
        virtual VisitAction visit_return(const ReturnStatement&) { return VisitAction::Continue; }
        virtual VisitAction visit_expression(const ExpressionStatement&) { return VisitAction::Continue; }
        virtual VisitAction visit_block(const BlockStatement&) { return VisitAction::Continue; }
        virtual VisitAction visit_call(const CallExpression&) { return VisitAction::Continue; }
        virtual VisitAction visit_identifier(const Identifier&) { return VisitAction::Continue; }
        virtual VisitAction visit_literal(const Literal&) { return VisitAction::Continue; }

        /**
         * Called for every node after its kind-specific hook.
         */
        virtual VisitAction visit_node(const Node&) { return VisitAction::Continue; }

    private:
        VisitAction dispatch(const Node& node);
    };

}  // namespace csa::ast

#endif //CODESTRUCTUREANALYZER_VISITOR_HPP

#include "csa/ast/visitor.hpp"

namespace csa::ast {

    void NodeVisitor::traverse(const Node& root) {
        const VisitAction specific = dispatch(root);
        const VisitAction generic = visit_node(root);

        if (specific == VisitAction::SkipChildren || generic == VisitAction::SkipChildren) {
            return;
        }

        for (const Node* child : root.children()) {
            traverse(*child);
        }
    }

    VisitAction NodeVisitor::dispatch(const Node& node) {
        switch (node.type()) {
            case NodeType::Program:
                return visit_program(static_cast<const Program&>(node));
            case NodeType::FunctionDeclaration:
                return visit_function(static_cast<const FunctionDeclaration&>(node));
            case NodeType::ClassDeclaration:
                return visit_class(static_cast<const ClassDeclaration&>(node));
            case NodeType::MethodDeclaration:
                return visit_method(static_cast<const MethodDeclaration&>(node));
            case NodeType::VariableDeclaration:
                return visit_variable(static_cast<const VariableDeclaration&>(node));
            case NodeType::IfStatement:
                return visit_if(static_cast<const IfStatement&>(node));
            case NodeType::WhileLoop:
                return visit_while(static_cast<const WhileLoop&>(node));
            case NodeType::ForLoop:
                return visit_for(static_cast<const ForLoop&>(node));
            case NodeType::ReturnStatement:
                return visit_return(static_cast<const ReturnStatement&>(node));
            case NodeType::ExpressionStatement:
                return visit_expression(static_cast<const ExpressionStatement&>(node));
            case NodeType::BlockStatement:
                return visit_block(static_cast<const BlockStatement&>(node));
            case NodeType::CallExpression:
                return visit_call(static_cast<const CallExpression&>(node));
            case NodeType::Identifier:
                return visit_identifier(static_cast<const Identifier&>(node));
            case NodeType::Literal:
                return visit_literal(static_cast<const Literal&>(node));
        }
        return VisitAction::Continue;
    }

}  // namespace csa::ast

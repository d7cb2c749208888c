#include "csa/ast/node.hpp"

namespace csa::ast {

    namespace {

        void append_if(std::vector<const Node*>& out, const NodePtr& child) {
            if (child) {
                out.push_back(child.get());
            }
        }

        void append_all(std::vector<const Node*>& out, const std::vector<NodePtr>& nodes) {
            out.reserve(out.size() + nodes.size());
            for (const auto& node : nodes) {
                append_if(out, node);
            }
        }

    }  // namespace

    const char* node_type_to_string(const NodeType type) noexcept {
        switch (type) {
            case NodeType::Program: return "Program";
            case NodeType::FunctionDeclaration: return "FunctionDeclaration";
            case NodeType::ClassDeclaration: return "ClassDeclaration";
            case NodeType::MethodDeclaration: return "MethodDeclaration";
            case NodeType::VariableDeclaration: return "VariableDeclaration";
            case NodeType::IfStatement: return "IfStatement";
            case NodeType::WhileLoop: return "WhileLoop";
            case NodeType::ForLoop: return "ForLoop";
            case NodeType::ReturnStatement: return "ReturnStatement";
            case NodeType::ExpressionStatement: return "ExpressionStatement";
            case NodeType::BlockStatement: return "BlockStatement";
            case NodeType::CallExpression: return "CallExpression";
            case NodeType::Identifier: return "Identifier";
            case NodeType::Literal: return "Literal";
        }
        return "Unknown";
    }

    std::optional<NodeType> node_type_from_string(const std::string_view name) noexcept {
        for (const NodeType type : ALL_NODE_TYPES) {
            if (name == node_type_to_string(type)) {
                return type;
            }
        }
        return std::nullopt;
    }

    const char* literal_kind_to_string(const LiteralKind kind) noexcept {
        switch (kind) {
            case LiteralKind::Number: return "number";
            case LiteralKind::String: return "string";
            case LiteralKind::Boolean: return "boolean";
            case LiteralKind::None: return "none";
            case LiteralKind::Ellipsis: return "ellipsis";
        }
        return "unknown";
    }

    std::vector<const Node*> BlockStatement::children() const {
        std::vector<const Node*> result;
        append_all(result, body);
        return result;
    }

    std::vector<const Node*> Program::children() const {
        std::vector<const Node*> result;
        append_all(result, body);
        return result;
    }

    std::vector<const Node*> CallableDeclaration::children() const {
        std::vector<const Node*> result;
        if (body) {
            result.push_back(body.get());
        }
        return result;
    }

    std::vector<const Node*> ClassDeclaration::children() const {
        std::vector<const Node*> result;
        append_all(result, body);
        return result;
    }

    std::vector<const Node*> VariableDeclaration::children() const {
        std::vector<const Node*> result;
        append_if(result, init);
        return result;
    }

    std::vector<const Node*> IfStatement::children() const {
        std::vector<const Node*> result;
        append_if(result, test);
        append_if(result, consequent);
        append_if(result, alternate);
        return result;
    }

    std::vector<const Node*> WhileLoop::children() const {
        std::vector<const Node*> result;
        append_if(result, test);
        append_if(result, body);
        return result;
    }

    std::vector<const Node*> ForLoop::children() const {
        std::vector<const Node*> result;
        append_if(result, init);
        append_if(result, test);
        append_if(result, update);
        append_if(result, body);
        return result;
    }

    std::vector<const Node*> ReturnStatement::children() const {
        std::vector<const Node*> result;
        append_if(result, argument);
        return result;
    }

    std::vector<const Node*> ExpressionStatement::children() const {
        std::vector<const Node*> result;
        append_all(result, expressions);
        return result;
    }

    std::vector<const Node*> CallExpression::children() const {
        std::vector<const Node*> result;
        append_if(result, callee);
        append_all(result, arguments);
        return result;
    }

}  // namespace csa::ast

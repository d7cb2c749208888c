#ifndef CODESTRUCTUREANALYZER_NODE_HPP
#define CODESTRUCTUREANALYZER_NODE_HPP

/**
 * @file node.hpp
 * @brief Canonical AST node model.
 *
 * Every language front-end projects its native tree into this closed set
 * of node kinds. A node's kind decides which fields it carries; generic
 * code never looks at those fields and walks the tree only through
 * Node::children(), so one traversal engine serves every front-end.
 *
 * Node kinds:
 * - Program: root, ordered top-level statements
 * - FunctionDeclaration / MethodDeclaration: callable definitions
 * - ClassDeclaration: class with base names and member statements
 * - VariableDeclaration: a named binding with an optional initializer
 * - IfStatement, WhileLoop, ForLoop: control flow
 * - ReturnStatement, BlockStatement
 * - ExpressionStatement: statement expressions and composite expressions
 * - CallExpression, Identifier, Literal: leaves and calls
 *
 * Trees own their children through std::unique_ptr. There are no parent
 * back-references; traversals pass the parent to their callback instead.
 */

#include <array>
#include <compare>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace csa::ast {

    enum class NodeType {
        Program,
        FunctionDeclaration,
        ClassDeclaration,
        MethodDeclaration,
        VariableDeclaration,
        IfStatement,
        WhileLoop,
        ForLoop,
        ReturnStatement,
        ExpressionStatement,
        BlockStatement,
        CallExpression,
        Identifier,
        Literal
    };

    inline constexpr std::array ALL_NODE_TYPES = {
        NodeType::Program,
        NodeType::FunctionDeclaration,
        NodeType::ClassDeclaration,
        NodeType::MethodDeclaration,
        NodeType::VariableDeclaration,
        NodeType::IfStatement,
        NodeType::WhileLoop,
        NodeType::ForLoop,
        NodeType::ReturnStatement,
        NodeType::ExpressionStatement,
        NodeType::BlockStatement,
        NodeType::CallExpression,
        NodeType::Identifier,
        NodeType::Literal
    };

    /**
     * Returns the canonical name of a node kind (e.g. "IfStatement").
     */
    [[nodiscard]] const char* node_type_to_string(NodeType type) noexcept;

    /**
     * Parses a canonical node kind name. Matching is exact.
     */
    [[nodiscard]] std::optional<NodeType> node_type_from_string(std::string_view name) noexcept;

    /**
     * A position in source text.
     *
     * Lines are 1-based, columns are 0-based byte offsets into the line.
     * Locations order by line, then column.
     */
    struct SourceLocation {
        std::size_t line = 1;
        std::size_t column = 0;

        auto operator<=>(const SourceLocation&) const = default;
    };

    /**
     * A half-open span of source text. start <= end always holds for
     * ranges produced by the front-ends.
     */
    struct SourceRange {
        SourceLocation start;
        SourceLocation end;

        [[nodiscard]] bool contains_line(const std::size_t line) const noexcept {
            return start.line <= line && line <= end.line;
        }

        /**
         * True when this range lies fully inside [lo, hi].
         */
        [[nodiscard]] bool within(const SourceLocation& lo, const SourceLocation& hi) const noexcept {
            return lo <= start && end <= hi;
        }

        bool operator==(const SourceRange&) const = default;
    };

    using Metadata = std::map<std::string, std::string>;

    class Node;
    using NodePtr = std::unique_ptr<Node>;

    /**
     * Base of every AST node.
     *
     * Concrete kinds are final classes below; the set is closed. Adding a
     * kind means adding an enumerator and implementing children().
     */
    class Node {
    public:
        virtual ~Node() = default;

        Node(const Node&) = delete;
        Node& operator=(const Node&) = delete;

        [[nodiscard]] NodeType type() const noexcept {
            return type_;
        }

        /**
         * Structural children in their natural order. Absent optional
         * children are omitted, never returned as null.
         */
        [[nodiscard]] virtual std::vector<const Node*> children() const = 0;

        /**
         * The declared or referenced name for named kinds; empty otherwise.
         */
        [[nodiscard]] virtual std::string_view symbol_name() const noexcept {
            return {};
        }

        std::optional<SourceRange> range;
        Metadata metadata;

    protected:
        explicit Node(const NodeType type) : type_(type) {}

    private:
        NodeType type_;
    };

    /**
     * A formal parameter of a function or method.
     */
    struct Parameter {
        std::string name;
        std::optional<std::string> type;
        std::optional<std::string> default_value;
    };

    class BlockStatement final : public Node {
    public:
        static constexpr NodeType KIND = NodeType::BlockStatement;

        BlockStatement() : Node(KIND) {}

        [[nodiscard]] std::vector<const Node*> children() const override;

        std::vector<NodePtr> body;
    };

    class Program final : public Node {
    public:
        static constexpr NodeType KIND = NodeType::Program;

        Program() : Node(KIND) {}

        [[nodiscard]] std::vector<const Node*> children() const override;

        std::vector<NodePtr> body;
        std::string source_type = "module";
    };

    /**
     * Fields shared by functions and methods.
     */
    class CallableDeclaration : public Node {
    public:
        [[nodiscard]] std::vector<const Node*> children() const override;

        [[nodiscard]] std::string_view symbol_name() const noexcept override {
            return name;
        }

        std::string name;
        std::vector<Parameter> params;
        std::unique_ptr<BlockStatement> body;
        std::optional<std::string> return_type;
        bool is_async = false;
        bool is_generator = false;

    protected:
        using Node::Node;
    };

    class FunctionDeclaration final : public CallableDeclaration {
    public:
        static constexpr NodeType KIND = NodeType::FunctionDeclaration;

        FunctionDeclaration() : CallableDeclaration(KIND) {}
    };

    class MethodDeclaration final : public CallableDeclaration {
    public:
        static constexpr NodeType KIND = NodeType::MethodDeclaration;

        MethodDeclaration() : CallableDeclaration(KIND) {}

        bool is_static = false;
    };

    class ClassDeclaration final : public Node {
    public:
        static constexpr NodeType KIND = NodeType::ClassDeclaration;

        ClassDeclaration() : Node(KIND) {}

        [[nodiscard]] std::vector<const Node*> children() const override;

        [[nodiscard]] std::string_view symbol_name() const noexcept override {
            return name;
        }

        std::string name;
        std::optional<std::string> super_class;
        std::vector<std::string> bases;
        std::vector<NodePtr> body;
    };

    class VariableDeclaration final : public Node {
    public:
        static constexpr NodeType KIND = NodeType::VariableDeclaration;

        VariableDeclaration() : Node(KIND) {}

        [[nodiscard]] std::vector<const Node*> children() const override;

        [[nodiscard]] std::string_view symbol_name() const noexcept override {
            return name;
        }

        std::string name;
        std::string kind = "var";
        NodePtr init;
        std::optional<std::string> type_annotation;
    };

    class IfStatement final : public Node {
    public:
        static constexpr NodeType KIND = NodeType::IfStatement;

        IfStatement() : Node(KIND) {}

        [[nodiscard]] std::vector<const Node*> children() const override;

        NodePtr test;
        NodePtr consequent;
        NodePtr alternate;
    };

    class WhileLoop final : public Node {
    public:
        static constexpr NodeType KIND = NodeType::WhileLoop;

        WhileLoop() : Node(KIND) {}

        [[nodiscard]] std::vector<const Node*> children() const override;

        NodePtr test;
        NodePtr body;
    };

    class ForLoop final : public Node {
    public:
        static constexpr NodeType KIND = NodeType::ForLoop;

        ForLoop() : Node(KIND) {}

        [[nodiscard]] std::vector<const Node*> children() const override;

        NodePtr init;
        NodePtr test;
        NodePtr update;
        NodePtr body;
    };

    class ReturnStatement final : public Node {
    public:
        static constexpr NodeType KIND = NodeType::ReturnStatement;

        ReturnStatement() : Node(KIND) {}

        [[nodiscard]] std::vector<const Node*> children() const override;

        NodePtr argument;
    };

    /**
     * An expression evaluated for its value.
     *
     * Also stands for composite expressions the taxonomy has no dedicated
     * kind for (operators, subscripts, containers, attribute access). The
     * operands are kept as children and metadata["kind"] names the source
     * construct.
     */
    class ExpressionStatement final : public Node {
    public:
        static constexpr NodeType KIND = NodeType::ExpressionStatement;

        ExpressionStatement() : Node(KIND) {}

        [[nodiscard]] std::vector<const Node*> children() const override;

        std::vector<NodePtr> expressions;
    };

    class CallExpression final : public Node {
    public:
        static constexpr NodeType KIND = NodeType::CallExpression;

        CallExpression() : Node(KIND) {}

        [[nodiscard]] std::vector<const Node*> children() const override;

        NodePtr callee;
        std::vector<NodePtr> arguments;
    };

    class Identifier final : public Node {
    public:
        static constexpr NodeType KIND = NodeType::Identifier;

        Identifier() : Node(KIND) {}
        explicit Identifier(std::string identifier) : Node(KIND), name(std::move(identifier)) {}

        [[nodiscard]] std::vector<const Node*> children() const override {
            return {};
        }

        [[nodiscard]] std::string_view symbol_name() const noexcept override {
            return name;
        }

        std::string name;
    };

    enum class LiteralKind {
        Number,
        String,
        Boolean,
        None,
        Ellipsis
    };

    [[nodiscard]] const char* literal_kind_to_string(LiteralKind kind) noexcept;

    class Literal final : public Node {
    public:
        static constexpr NodeType KIND = NodeType::Literal;

        Literal() : Node(KIND) {}

        [[nodiscard]] std::vector<const Node*> children() const override {
            return {};
        }

        LiteralKind kind = LiteralKind::None;
        std::string raw;
    };

    /**
     * Downcasts @p node when its tag matches T::KIND.
     *
     * @return The node as T, or nullptr for any other kind.
     */
    template<typename T>
    [[nodiscard]] const T* node_cast(const Node& node) noexcept {
        if (node.type() != T::KIND) {
            return nullptr;
        }
        return static_cast<const T*>(&node);
    }

    /**
     * Downcasts function and method declarations to their shared base.
     */
    [[nodiscard]] inline const CallableDeclaration* as_callable(const Node& node) noexcept {
        if (node.type() == NodeType::FunctionDeclaration || node.type() == NodeType::MethodDeclaration) {
            return static_cast<const CallableDeclaration*>(&node);
        }
        return nullptr;
    }

}  // namespace csa::ast

#endif //CODESTRUCTUREANALYZER_NODE_HPP
